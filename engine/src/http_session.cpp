/*
 * 설명: HTTP 요청을 경로별로 분기해 재생, 레이팅 조회, 예측, 백테스트를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/e2e/prediction_api_test.cpp
 */
#include "fightcast/http_session.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include <boost/beast/version.hpp>

#include "fightcast/db_client.hpp"
#include "fightcast/matchup_evaluator.hpp"
#include "fightcast/record_store.hpp"

namespace fightcast {

namespace {
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ForecastService> forecast_service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)),
      forecast_service_(std::move(forecast_service)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "fightcast");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    auto current = forecast_service_->Current();
    nlohmann::json payload{{"status", "ok"},
                           {"version", kApiVersion},
                           {"ratedCompetitors", current ? current->state->Size() : 0}};
    auto body = MakeSuccessEnvelope(payload, trace_id_).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto body = MakeSuccessEnvelope(ToJson(observability_->Snapshot()), trace_id_).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/api/replay") {
    try {
      auto summary = forecast_service_->RunReplay(trace_id_);
      auto body = MakeSuccessEnvelope(ToJson(summary), trace_id_).dump();
      res->result(http::status::ok);
      res->body() = body;
      res->content_length(body.size());
      return SendResponse(res);
    } catch (const RecordSourceException& ex) {
      return SendError(res, http::status::service_unavailable, "record_source_unavailable",
                       "기록 공급원을 읽을 수 없습니다", ex.what());
    } catch (const DbException& ex) {
      return SendError(res, http::status::service_unavailable, "record_source_unavailable",
                       "기록 공급원을 읽을 수 없습니다", ex.what());
    }
  }

  if (req_.method() == http::verb::get && path == "/api/ratings") {
    auto params = ParseQueryParams(query);
    auto it = params.find("competitor");
    if (it == params.end() || it->second.empty()) {
      return SendError(res, http::status::bad_request, "bad_request", "competitor 값이 필요합니다");
    }
    std::optional<Date> as_of;
    auto as_of_it = params.find("asOf");
    if (as_of_it != params.end()) {
      as_of = ParseIsoDate(as_of_it->second);
      if (!as_of) {
        return SendError(res, http::status::bad_request, "bad_request", "asOf 날짜 형식이 올바르지 않습니다");
      }
    }
    auto ratings = forecast_service_->RatingsFor(it->second, as_of);
    if (!ratings) {
      return SendError(res, http::status::not_found, "competitor_not_rated", "레이팅 이력이 없는 선수입니다",
                       it->second);
    }
    auto body = MakeSuccessEnvelope(ToJson(*ratings), trace_id_).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/api/predict") {
    nlohmann::json body_json;
    try {
      body_json = nlohmann::json::parse(req_.body());
    } catch (const nlohmann::json::exception&) {
      return SendError(res, http::status::bad_request, "bad_request", "JSON 본문이 올바르지 않습니다");
    }
    std::string error;
    auto context = MatchupContextFromJson(body_json, error);
    if (!context) {
      return SendError(res, http::status::bad_request, "bad_request", error);
    }
    auto result = forecast_service_->Predict(*context);
    auto data = ToJson(result);
    data["narrative"] = forecast_service_->Narrate(result);
    if (result.Refused()) {
      observability_->Log(LogContext{trace_id_, "prediction_refused", 0, LogLevel::kInfo, std::nullopt, std::nullopt,
                                     result.refusal->reason});
    }
    auto body = MakeSuccessEnvelope(data, trace_id_).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/api/card") {
    nlohmann::json body_json;
    try {
      body_json = nlohmann::json::parse(req_.body());
    } catch (const nlohmann::json::exception&) {
      return SendError(res, http::status::bad_request, "bad_request", "JSON 본문이 올바르지 않습니다");
    }
    if (!body_json.is_object() || !body_json.contains("bouts") || !body_json["bouts"].is_array() ||
        body_json["bouts"].empty()) {
      return SendError(res, http::status::bad_request, "bad_request", "bouts 배열이 필요합니다");
    }
    std::string event_name = body_json.value("eventName", std::string{});
    std::optional<Date> event_date;
    if (body_json.contains("eventDate")) {
      event_date = body_json["eventDate"].is_string() ? ParseIsoDate(body_json["eventDate"].get<std::string>())
                                                       : std::nullopt;
      if (!event_date) {
        return SendError(res, http::status::bad_request, "bad_request", "eventDate 날짜 형식이 올바르지 않습니다");
      }
    }
    std::vector<MatchupContext> matchups;
    for (std::size_t i = 0; i < body_json["bouts"].size(); ++i) {
      nlohmann::json bout = body_json["bouts"][i];
      // 대진별 asOf가 없으면 대회 날짜를 쓴다.
      if (event_date && bout.is_object() && !bout.contains("asOf")) {
        bout["asOf"] = ToIsoString(*event_date);
      }
      std::string error;
      auto context = MatchupContextFromJson(bout, error);
      if (!context) {
        return SendError(res, http::status::bad_request, "bad_request", error, nlohmann::json{{"index", i}});
      }
      matchups.push_back(std::move(*context));
    }
    auto card = forecast_service_->PredictCard(event_name, event_date, matchups);
    auto body = MakeSuccessEnvelope(ToJson(card), trace_id_).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/api/backtest") {
    auto params = ParseQueryParams(query);
    auto cutoff_it = params.find("cutoff");
    std::optional<Date> cutoff = cutoff_it == params.end() ? std::nullopt : ParseIsoDate(cutoff_it->second);
    if (!cutoff) {
      return SendError(res, http::status::bad_request, "bad_request", "cutoff 날짜가 필요합니다");
    }
    std::size_t count = 50;
    auto count_it = params.find("count");
    if (count_it != params.end()) {
      auto parsed = ParsePositiveInt(count_it->second);
      if (!parsed || *parsed < 1 || *parsed > 10000) {
        return SendError(res, http::status::bad_request, "backtest_range", "count 값이 허용 범위를 벗어났습니다");
      }
      count = *parsed;
    }
    try {
      auto report = forecast_service_->Backtest(*cutoff, count);
      auto body = MakeSuccessEnvelope(ToJson(report), trace_id_).dump();
      res->result(http::status::ok);
      res->body() = body;
      res->content_length(body.size());
      return SendResponse(res);
    } catch (const RecordSourceException& ex) {
      return SendError(res, http::status::service_unavailable, "record_source_unavailable",
                       "기록 공급원을 읽을 수 없습니다", ex.what());
    } catch (const DbException& ex) {
      return SendError(res, http::status::service_unavailable, "record_source_unavailable",
                       "기록 공급원을 읽을 수 없습니다", ex.what());
    }
  }

  SendError(res, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::SendError(std::shared_ptr<Response> res, boost::beast::http::status status, const std::string& code,
                            const std::string& message, const nlohmann::json& detail) {
  res->result(status);
  auto body = MakeErrorEnvelope(code, message, detail, trace_id_).dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const bool failed = static_cast<unsigned>(res->result_int()) >= 400;
  if (failed) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, "http_request", static_cast<long>(latency),
                                 failed ? LogLevel::kWarn : LogLevel::kInfo, std::nullopt, std::nullopt,
                                 std::string(req_.method_string()) + " " + std::string(req_.target()) + " " +
                                     std::to_string(res->result_int())});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace fightcast
