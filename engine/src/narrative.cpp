/*
 * 설명: 설명 문장 템플릿 표와 자리표시자 치환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/narrative_test.cpp
 */
#include "fightcast/narrative.hpp"

#include <sstream>

namespace fightcast {
namespace {
std::string DisplayName(const std::string& id, const CompetitorIndex* registry) {
  if (registry) {
    auto it = registry->find(id);
    if (it != registry->end() && it->second && !it->second->name.empty()) {
      return it->second->name;
    }
  }
  return id;
}

std::string FormatValue(double value) {
  std::ostringstream oss;
  oss.precision(1);
  oss << std::fixed << value;
  return oss.str();
}

void ReplaceAll(std::string& text, std::string_view token, const std::string& value) {
  std::size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

std::string_view DimensionLabel(Dimension dim) {
  switch (dim) {
    case Dimension::kKnockoutPower:
      return "타격 파워";
    case Dimension::kStrikingVolume:
      return "타격 볼륨";
    case Dimension::kStrikingDefense:
      return "타격 방어";
    case Dimension::kWrestlingOffense:
      return "레슬링 공격";
    case Dimension::kWrestlingDefense:
      return "테이크다운 방어";
    case Dimension::kSubmissionOffense:
      return "서브미션 공격";
    case Dimension::kSubmissionDefense:
      return "서브미션 방어";
    case Dimension::kCardio:
      return "체력";
    case Dimension::kPressure:
      return "압박";
    case Dimension::kAdaptability:
      return "적응력";
  }
  return "";
}

struct Placeholders {
  std::string a;
  std::string b;
  std::string winner;
  std::string loser;
  std::string dimensions;
};

std::string Fill(std::string_view text, const Placeholders& names, double value) {
  std::string line(text);
  ReplaceAll(line, "{a}", names.a);
  ReplaceAll(line, "{b}", names.b);
  ReplaceAll(line, "{winner}", names.winner);
  ReplaceAll(line, "{loser}", names.loser);
  ReplaceAll(line, "{dimensions}", names.dimensions);
  ReplaceAll(line, "{value}", FormatValue(value));
  return line;
}

std::vector<std::string> RenderRefusal(const PredictionResult& result, const CompetitorIndex* registry) {
  const auto& refusal = *result.refusal;
  std::string subject;
  auto colon = refusal.reason.find(':');
  if (colon != std::string::npos) {
    subject = DisplayName(refusal.reason.substr(colon + 1), registry);
  }
  switch (refusal.kind) {
    case ErrorKind::kInsufficientHistory:
      return {subject + "의 경기 이력이 부족해 예측하지 않습니다."};
    case ErrorKind::kUnknownCompetitor:
      return {subject + "은(는) 등록되지 않은 선수라 예측하지 않습니다."};
    case ErrorKind::kMalformedRecord:
    case ErrorKind::kDataConflict:
      break;
  }
  return {"대진 정보가 올바르지 않아 예측하지 않습니다 (" + refusal.reason + ")."};
}
}  // namespace

const std::vector<NarrativeTemplate>& NarrativeTemplates() {
  static const std::vector<NarrativeTemplate> kTemplates{
      {Stage::kWinner, "style_pairings", "접전이지만 {winner}이(가) 스타일 상성에서 {value}개 더 앞섭니다."},
      {Stage::kWinner, "confidence", "접전이며 레이팅 신뢰도가 더 높은 {winner}을(를) 택했습니다."},
      {Stage::kWinner, "experience", "접전이며 경기 경험이 {value}전 많은 {winner}을(를) 택했습니다."},
      {Stage::kWinner, "size_advantage", "{winner}의 체급 우위가 {value}점 반영되었습니다."},
      {Stage::kMethod, "ko_finish_rate", "{winner}의 KO/TKO 피니시 성향 점수는 {value}입니다."},
      {Stage::kMethod, "power_vs_striking_defense", "{winner}의 파워가 {loser}의 타격 방어를 {value}점 앞섭니다."},
      {Stage::kMethod, "chin_flags", "{loser}의 KO 패배 이력이 턱 취약성으로 {value}점 반영되었습니다."},
      {Stage::kMethod, "submission_finish_rate", "{winner}의 서브미션 피니시 성향 점수는 {value}입니다."},
      {Stage::kMethod, "submission_vs_submission_defense",
       "{winner}의 서브미션 공격이 {loser}의 방어를 {value}점 앞섭니다."},
      {Stage::kMethod, "decision_rate", "{winner}은(는) 판정까지 가는 경기가 많습니다 ({value})."},
      {Stage::kMethod, "five_round_distance", "5라운드 경기라 판정 가능성이 {value}점 높아집니다."},
      {Stage::kMethod, "method_confidence_high", "방식 예측 확신도는 높음입니다 (차이 {value})."},
      {Stage::kMethod, "method_confidence_medium", "방식 예측 확신도는 보통입니다 (차이 {value})."},
      {Stage::kMethod, "method_confidence_low", "방식 예측 확신도는 낮습니다 (차이 {value})."},
      {Stage::kRound, "championship_shift", "챔피언십 라운드로 피니시 확률 {value}이 이동했습니다."},
      {Stage::kRound, "finish_round_history", "{winner}은(는) 해당 라운드에서 {value}번 피니시했습니다."},
      {Stage::kStyle, "chin_vulnerability_a", "{a}은(는) KO 패배 {value}회로 턱 취약성을 보였습니다."},
      {Stage::kStyle, "chin_vulnerability_b", "{b}은(는) KO 패배 {value}회로 턱 취약성을 보였습니다."},
      {Stage::kStyle, "experience_edge_a", "{a}이(가) 경험에서 크게 앞섭니다."},
      {Stage::kStyle, "experience_edge_b", "{b}이(가) 경험에서 크게 앞섭니다."},
      {Stage::kStyle, "championship_cardio_a", "{a}이(가) 챔피언십 라운드 체력에서 우위입니다."},
      {Stage::kStyle, "championship_cardio_b", "{b}이(가) 챔피언십 라운드 체력에서 우위입니다."},
      {Stage::kStyle, "striker_vs_grappler_a", "타격가 {a} 대 그래플러 {b} 구도라 경기 장소(스탠딩/그라운드)가 승부를 가릅니다."},
      {Stage::kStyle, "striker_vs_grappler_b", "타격가 {b} 대 그래플러 {a} 구도라 경기 장소(스탠딩/그라운드)가 승부를 가릅니다."},
      {Stage::kStyle, "location_bias_a", "{a}의 홈 지역 경기입니다."},
      {Stage::kStyle, "location_bias_b", "{b}의 홈 지역 경기입니다."},
      {Stage::kStyle, "short_notice_a", "{a}은(는) 단기 통보로 공격 지표가 {value}점 감점되었습니다."},
      {Stage::kStyle, "short_notice_b", "{b}은(는) 단기 통보로 공격 지표가 {value}점 감점되었습니다."},
      {Stage::kStyle, "key_dimensions", "이 대진의 핵심 축은 {dimensions}입니다."},
  };
  return kTemplates;
}

std::vector<std::string> RenderNarrative(const PredictionResult& result, const CompetitorIndex* registry) {
  if (result.Refused()) {
    return RenderRefusal(result, registry);
  }

  Placeholders names;
  names.a = DisplayName(result.competitor_a, registry);
  names.b = DisplayName(result.competitor_b, registry);
  const bool a_wins = result.winner_side && *result.winner_side == Side::kA;
  names.winner = a_wins ? names.a : names.b;
  names.loser = a_wins ? names.b : names.a;
  for (Dimension dim : result.key_dimensions) {
    names.dimensions += (names.dimensions.empty() ? "" : ", ") + std::string(DimensionLabel(dim));
  }

  std::vector<std::string> lines;
  if (result.method && *result.method == Method::kDecision) {
    lines.push_back(names.winner + "이(가) 판정승을 거둘 것으로 예측합니다.");
  } else if (result.method && result.round) {
    lines.push_back(names.winner + "이(가) " + std::to_string(*result.round) + "라운드 " +
                    std::string(MethodName(*result.method)) + "로 승리할 것으로 예측합니다.");
  }

  for (const auto& factor : result.factors) {
    if (factor.stage == Stage::kWinner) {
      if (auto dim = ParseDimension(factor.name)) {
        lines.push_back(names.winner + "의 " + std::string(DimensionLabel(*dim)) + " 우위 (+" +
                        FormatValue(factor.magnitude) + ")");
        continue;
      }
    }
    for (const auto& entry : NarrativeTemplates()) {
      if (entry.stage == factor.stage && entry.factor == factor.name) {
        lines.push_back(Fill(entry.text, names, factor.magnitude));
        break;
      }
    }
  }
  if (!result.key_dimensions.empty()) {
    for (const auto& entry : NarrativeTemplates()) {
      if (entry.stage == Stage::kStyle && entry.factor == "key_dimensions") {
        lines.push_back(Fill(entry.text, names, 0.0));
        break;
      }
    }
  }
  return lines;
}

}  // namespace fightcast
