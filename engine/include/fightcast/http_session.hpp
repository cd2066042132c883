/*
 * 설명: HTTP 연결을 처리하고 재생/레이팅/예측/백테스트 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/e2e/prediction_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "fightcast/api_response.hpp"
#include "fightcast/config.hpp"
#include "fightcast/forecast_service.hpp"
#include "fightcast/observability.hpp"

namespace fightcast {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ForecastService> forecast_service,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<Response> res);
  void SendError(std::shared_ptr<Response> res, boost::beast::http::status status, const std::string& code,
                 const std::string& message, const nlohmann::json& detail = nullptr);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<ForecastService> forecast_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace fightcast
