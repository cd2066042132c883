/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/e2e/prediction_api_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "fightcast/config.hpp"
#include "fightcast/db_client.hpp"
#include "fightcast/forecast_service.hpp"
#include "fightcast/observability.hpp"
#include "fightcast/rating_repository.hpp"
#include "fightcast/record_store.hpp"

namespace fightcast {

class Listener;

// RECORD_SOURCE 설정에 맞는 기록 공급원을 만든다. mariadb일 때만 db_client를 사용한다.
std::shared_ptr<RecordStore> MakeRecordStore(const AppConfig& config, std::shared_ptr<MariaDbClient> db_client);
DbConfig MakeDbConfig(const AppConfig& config);

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ForecastService> GetForecastService() { return forecast_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void WarmUp();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<RatingRepository> rating_repository_;
  std::shared_ptr<ForecastService> forecast_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace fightcast
