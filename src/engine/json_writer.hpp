#pragma once

// ---------------------------------------------------------------------------
// json_writer.hpp
//
// 판정/마스킹 결과의 JSON 직렬화 (외부 JSON 라이브러리 없이 수동 직렬화).
//
// [Decision]
//   {"classification":"SENSITIVE","risk_level":"MEDIUM","action":"LOG",
//    "risk_score":45,"reasons":[...],
//    "ml_assist":null | {"pred_label":1,"label":"SENSITIVE",
//                        "proba":[0.1,0.7,0.2],"confidence":0.7},
//    "input":"..."}
//   proba 는 분포가 있을 때만 포함한다.
//
// [RedactionResult]
//   {"redacted_text":"...","mode":"tokenize","token_map":{...},"reversible":true}
//   token_map 은 TOKENIZE 일 때만 포함한다.
//
// [오류]
//   {"error":"...","code":"malformed_input"}
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "decision/decision.hpp"
#include "policy/policy.hpp"
#include "redaction/redaction_engine.hpp"

#include <expected>
#include <string>
#include <vector>

[[nodiscard]] std::string to_json(const Decision& decision);
[[nodiscard]] std::string to_json(const RedactionResult& result);
[[nodiscard]] std::string to_json(const AnalysisError& error);
[[nodiscard]] std::string to_json(const RedactionError& error);
[[nodiscard]] std::string to_json(const PolicyError& error);
[[nodiscard]] std::string to_json(const Policy& policy);

// 배치 결과: 입력과 같은 순서의 JSON 배열. 실패 항목은 오류 객체로 표현.
[[nodiscard]] std::string to_json(const std::vector<std::expected<Decision, AnalysisError>>& results);

[[nodiscard]] std::string policies_to_json(const std::vector<Policy>& policies);

[[nodiscard]] std::string modes_to_json();
