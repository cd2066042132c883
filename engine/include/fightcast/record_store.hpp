/*
 * 설명: 선수/경기 기록 공급원 인터페이스, JSON 파일 공급원, 개정 충돌 해소를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/record_store_test.cpp
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fightcast/engine_error.hpp"
#include "fightcast/records.hpp"

namespace fightcast {

class RecordSourceException : public std::runtime_error {
 public:
  explicit RecordSourceException(const std::string& message) : std::runtime_error(message) {}
};

struct RecordSet {
  std::vector<Competitor> competitors;
  std::vector<Bout> bouts;
  // 읽는 도중 버린 항목
  std::vector<RecordIssue> issues;
};

class RecordStore {
 public:
  virtual ~RecordStore() = default;
  // 공급원 자체에 접근할 수 없으면 예외를 던진다. 개별 항목 오류는 issues로 돌려준다.
  virtual RecordSet Load() const = 0;
  virtual std::string Name() const = 0;
};

class JsonRecordStore : public RecordStore {
 public:
  explicit JsonRecordStore(std::string path);

  RecordSet Load() const override;
  std::string Name() const override { return "json"; }

 private:
  std::string path_;
};

// {"competitors": [...], "bouts": [...]} 문서를 기록 집합으로 변환한다.
RecordSet ParseRecordDocument(const nlohmann::json& document);
std::optional<Competitor> CompetitorFromJson(const nlohmann::json& item, std::vector<RecordIssue>& issues);
std::optional<Bout> BoutFromJson(const nlohmann::json& item, std::vector<RecordIssue>& issues);
nlohmann::json ToJson(const Competitor& competitor);
nlohmann::json ToJson(const Bout& bout);

struct ConflictResolution {
  std::vector<Bout> bouts;
  std::vector<RecordIssue> notices;
};

// 같은 경기 ID가 여러 번 오면 revision이 가장 큰 기록을, 같으면 나중에 공급된 기록을 남긴다.
ConflictResolution ResolveBoutConflicts(std::vector<Bout> bouts);

}  // namespace fightcast
