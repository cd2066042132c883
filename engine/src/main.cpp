/*
 * 설명: 진입점. 환경설정을 로드해 서버, 일회성 재생, 백테스트, 기록 적재를 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/e2e/prediction_api_test.cpp
 */
#include <csignal>
#include <iostream>
#include <string>

#include "fightcast/app.hpp"
#include "fightcast/bout_repository.hpp"

namespace {

int Usage() {
  std::cerr << "사용법: fightcast [serve | replay | backtest <YYYY-MM-DD> <count> | import <records.json>]\n";
  return 2;
}

std::shared_ptr<fightcast::ForecastService> BuildService(const fightcast::AppConfig& config,
                                                         std::shared_ptr<fightcast::Observability> observability) {
  using namespace fightcast;
  auto db_client = std::make_shared<MariaDbClient>(MakeDbConfig(config));
  std::shared_ptr<RatingRepository> rating_repository;
  if (config.persist_ratings) {
    rating_repository = std::make_shared<RatingRepository>(db_client);
  }
  return std::make_shared<ForecastService>(MakeRecordStore(config, db_client), config.engine, observability,
                                           rating_repository);
}

int RunReplay(const fightcast::AppConfig& config) {
  auto observability = std::make_shared<fightcast::Observability>(fightcast::ParseLogLevel(config.log_level));
  auto service = BuildService(config, observability);
  auto summary = service->RunReplay(observability->NextTraceId());
  std::cout << fightcast::ToJson(summary).dump(2) << "\n";
  return summary.persist_error ? 1 : 0;
}

int RunBacktest(const fightcast::AppConfig& config, const std::string& cutoff_text, const std::string& count_text) {
  auto cutoff = fightcast::ParseIsoDate(cutoff_text);
  std::size_t idx = 0;
  unsigned long count = 0;
  try {
    count = std::stoul(count_text, &idx);
  } catch (const std::exception&) {
    idx = 0;
  }
  if (!cutoff || idx != count_text.size() || count == 0) {
    return Usage();
  }
  auto observability = std::make_shared<fightcast::Observability>(fightcast::ParseLogLevel(config.log_level));
  auto report = BuildService(config, observability)->Backtest(*cutoff, count);
  std::cout << fightcast::ToJson(report).dump(2) << "\n";
  return 0;
}

int RunImport(const fightcast::AppConfig& config, const std::string& path) {
  using namespace fightcast;
  Observability observability(ParseLogLevel(config.log_level));
  const auto trace_id = observability.NextTraceId();
  RecordSet records = JsonRecordStore(path).Load();
  for (const auto& issue : records.issues) {
    observability.Log(LogContext{trace_id, "import_record_skipped", 0, LogLevel::kWarn, std::nullopt, issue.bout_id,
                                 issue.reason});
  }
  MariaDbRecordStore store(std::make_shared<MariaDbClient>(MakeDbConfig(config)));
  auto inserted = store.Import(records);
  observability.Log(LogContext{trace_id, "import_finished", 0, LogLevel::kInfo, std::nullopt, std::nullopt,
                               "bouts=" + std::to_string(inserted) + "/" + std::to_string(records.bouts.size())});
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace fightcast;
  AppConfig config = LoadConfigFromEnv();
  const auto problems = ValidateEngineConfig(config.engine);
  if (!problems.empty()) {
    for (const auto& problem : problems) {
      std::cerr << "설정 오류: " << problem << "\n";
    }
    return 2;
  }

  const std::string command = argc > 1 ? argv[1] : "serve";
  try {
    if (command == "replay") {
      return RunReplay(config);
    }
    if (command == "backtest") {
      return argc == 4 ? RunBacktest(config, argv[2], argv[3]) : Usage();
    }
    if (command == "import") {
      return argc == 3 ? RunImport(config, argv[2]) : Usage();
    }
    if (command != "serve") {
      return Usage();
    }
  } catch (const RecordSourceException& ex) {
    std::cerr << "기록 공급원 오류: " << ex.what() << "\n";
    return 1;
  } catch (const DbException& ex) {
    std::cerr << "DB 오류(" << ex.code << "): " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  std::signal(SIGINT, [](int) { std::cout << "SIGINT 수신, 종료를 준비합니다\n"; });
  app.Run();
  return 0;
}
