/*
 * 설명: 서버 수명주기, 기동 시 재생, 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/e2e/prediction_api_test.cpp
 */
#include "fightcast/app.hpp"

#include <algorithm>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "fightcast/bout_repository.hpp"
#include "fightcast/http_session.hpp"

namespace fightcast {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<ForecastService> forecast_service, std::shared_ptr<Observability> observability)
      : ioc_(ioc),
        acceptor_(boost::asio::make_strand(ioc)),
        forecast_service_(std::move(forecast_service)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->forecast_service_, self->observability_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<ForecastService> forecast_service_;
  std::shared_ptr<Observability> observability_;
};

DbConfig MakeDbConfig(const AppConfig& config) {
  return DbConfig{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
}

std::shared_ptr<RecordStore> MakeRecordStore(const AppConfig& config, std::shared_ptr<MariaDbClient> db_client) {
  if (config.record_source == "json") {
    return std::make_shared<JsonRecordStore>(config.record_path);
  }
  return std::make_shared<MariaDbRecordStore>(std::move(db_client));
}

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  db_client_ = std::make_shared<MariaDbClient>(MakeDbConfig(config));
  if (config.persist_ratings) {
    rating_repository_ = std::make_shared<RatingRepository>(db_client_);
  }
  forecast_service_ = std::make_shared<ForecastService>(MakeRecordStore(config, db_client_), config.engine,
                                                        observability_, rating_repository_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::WarmUp() {
  const auto trace_id = observability_->NextTraceId();
  try {
    forecast_service_->RunReplay(trace_id);
    return;
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{trace_id, "startup_replay_failed", 0, LogLevel::kError, std::nullopt,
                                   std::nullopt, ex.what()});
  }
  // 공급원이 없으면 마지막으로 저장된 레이팅으로 서비스를 시작한다.
  try {
    forecast_service_->RestoreSnapshot(trace_id);
  } catch (const DbException& ex) {
    observability_->Log(LogContext{trace_id, "snapshot_restore_failed", 0, LogLevel::kError, std::nullopt,
                                   std::nullopt, ex.what()});
  }
}

void ServerApp::Run() {
  try {
    running_ = true;
    WarmUp();
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, forecast_service_, observability_);
    listener_->Run();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace fightcast
