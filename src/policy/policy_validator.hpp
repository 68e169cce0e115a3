#pragma once

// ---------------------------------------------------------------------------
// policy_validator.hpp
//
// 정책 정의 검증. 스토어에 들어가기 전에만 수행한다 (적용 시점에는 검증 없음).
//
// [검증 규칙]
//   name            : 필수, 비어 있으면 안 됨           → kMissingName
//   rules           : 필수 (map)                        → kMissingRules
//   priority        : 정수                              → kInvalidField
//   risk_adjustment : 정수, [-100, 100]                 → kInvalidField
//   block_threshold : 있으면 정수, [0, 100]             → kInvalidField
//   pattern_ids     : 알려진 패턴 식별자만 허용          → kInvalidField
//
// parse_policy 는 타입이 없는 YAML 입력에서 정수 타입 검사까지 수행하고,
// validate_policy 는 이미 타입이 정해진 Policy 의 범위 검사만 수행한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/policy.hpp"

#include <expected>

namespace YAML {
class Node;
}

inline constexpr int kMinRiskAdjustment = -100;
inline constexpr int kMaxRiskAdjustment = 100;

[[nodiscard]] std::expected<void, PolicyError> validate_policy(const Policy& policy);

[[nodiscard]] std::expected<Policy, PolicyError> parse_policy(const YAML::Node& node);
