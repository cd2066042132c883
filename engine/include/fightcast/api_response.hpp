/*
 * 설명: REST 응답 엔벨로프(success, data, error, meta) 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace fightcast {

inline constexpr std::string_view kApiVersion = "v1.0.0";

// trace_id가 비어 있으면 meta에 넣지 않는다.
nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data, std::string_view trace_id = {});
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr, std::string_view trace_id = {});

}  // namespace fightcast
