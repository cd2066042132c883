/*
 * 설명: JSON 응답 엔벨로프와 공통 meta(시각, 버전, 추적 ID)를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/json_envelope_test.cpp
 */
#include "fightcast/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fightcast {
namespace {
std::string UtcTimestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::ostringstream ss;
  ss << std::put_time(&utc, "%FT%TZ");
  return ss.str();
}

nlohmann::json Meta(std::string_view trace_id) {
  nlohmann::json meta{{"timestamp", UtcTimestamp()}, {"version", kApiVersion}};
  if (!trace_id.empty()) {
    meta["traceId"] = trace_id;
  }
  return meta;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data, std::string_view trace_id) {
  return nlohmann::json{{"success", true}, {"data", data}, {"error", nullptr}, {"meta", Meta(trace_id)}};
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail,
                                 std::string_view trace_id) {
  return nlohmann::json{{"success", false},
                        {"data", nullptr},
                        {"error", {{"code", code}, {"message", message}, {"detail", detail}}},
                        {"meta", Meta(trace_id)}};
}

}  // namespace fightcast
