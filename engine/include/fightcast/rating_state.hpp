/*
 * 설명: 선수별 10개 축 레이팅 상태와 명시적 변경/스냅샷 연산을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_state_test.cpp
 */
#pragma once

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fightcast/config.hpp"
#include "fightcast/date.hpp"
#include "fightcast/dimension.hpp"
#include "fightcast/records.hpp"

namespace fightcast {

struct Rating {
  double value{1500.0};
  double uncertainty{350.0};
  std::optional<Date> last_active;
  int chin_flags{0};
  int bouts{0};

  friend bool operator==(const Rating& lhs, const Rating& rhs) {
    return lhs.value == rhs.value && lhs.uncertainty == rhs.uncertainty && lhs.last_active == rhs.last_active &&
           lhs.chin_flags == rhs.chin_flags && lhs.bouts == rhs.bouts;
  }
  friend bool operator!=(const Rating& lhs, const Rating& rhs) { return !(lhs == rhs); }
};

Rating BaselineRating(const RatingParams& params);

// 결승 방식 인덱스: KO/TKO, Submission, Decision
inline constexpr std::size_t kMethodSlots = 3;
inline constexpr int kMaxRounds = 5;

std::optional<std::size_t> MethodSlot(Method method);

struct CompetitorRatings {
  std::string competitor_id;
  DimensionArray<Rating> ratings;
  int bouts{0};
  int wins{0};
  int losses{0};
  int draws{0};
  int no_contests{0};
  int ko_losses{0};
  std::array<int, kMethodSlots> wins_by_method{};
  // KO/TKO, Submission 승리의 라운드별 횟수
  std::array<std::array<int, kMaxRounds>, 2> finish_rounds{};
  std::optional<Date> last_bout_date;
  std::optional<Date> birth_date;
  std::string weight_class;
  std::optional<std::string> home_region;

  const Rating& At(Dimension dim) const { return ratings[IndexOf(dim)]; }
  Rating& At(Dimension dim) { return ratings[IndexOf(dim)]; }
  double Value(Dimension dim) const { return At(dim).value; }
  int ChinFlags() const { return At(Dimension::kStrikingDefense).chin_flags; }
  double MeanValue() const;
  double MeanUncertainty() const;

  friend bool operator==(const CompetitorRatings& lhs, const CompetitorRatings& rhs);
  friend bool operator!=(const CompetitorRatings& lhs, const CompetitorRatings& rhs) { return !(lhs == rhs); }
};

class RatingState {
 public:
  RatingState() = default;
  explicit RatingState(RatingParams params) : params_(params) {}

  CompetitorRatings& Ensure(const std::string& competitor_id);
  std::optional<Rating> Get(const std::string& competitor_id, Dimension dim) const;
  void Set(const std::string& competitor_id, Dimension dim, const Rating& rating);

  const CompetitorRatings* Find(const std::string& competitor_id) const;
  CompetitorRatings* FindMutable(const std::string& competitor_id);
  bool Contains(const std::string& competitor_id) const { return entries_.count(competitor_id) != 0; }
  std::size_t Size() const { return entries_.size(); }
  std::vector<std::string> CompetitorIds() const;
  const std::map<std::string, CompetitorRatings>& Entries() const { return entries_; }
  const RatingParams& Params() const { return params_; }

  std::shared_ptr<const RatingState> Snapshot() const;

  // 저장된 상태는 바꾸지 않고 as_of 시점으로 감쇠한 사본을 돌려준다.
  std::optional<CompetitorRatings> DecayedAt(const std::string& competitor_id, Date as_of,
                                             const DecayParams& decay) const;

  friend bool operator==(const RatingState& lhs, const RatingState& rhs) { return lhs.entries_ == rhs.entries_; }

 private:
  RatingParams params_;
  std::map<std::string, CompetitorRatings> entries_;
};

nlohmann::json ToJson(const CompetitorRatings& entry);
nlohmann::json ToJson(const RatingState& state);
std::optional<CompetitorRatings> CompetitorRatingsFromJson(const nlohmann::json& record);
RatingState RatingStateFromJson(const nlohmann::json& document, const RatingParams& params);

}  // namespace fightcast
