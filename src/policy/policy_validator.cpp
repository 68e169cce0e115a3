// ---------------------------------------------------------------------------
// policy_validator.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_validator.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace {

[[nodiscard]] std::unexpected<PolicyError> fail(PolicyErrorCode code,
                                                std::string message,
                                                std::string field = {}) {
    return std::unexpected(PolicyError{code, std::move(message), std::move(field)});
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 정수 읽기.
//   노드 없음 → fallback, 정수가 아님 → std::nullopt (타입 오류).
//   yaml-cpp 의 as<int>() 는 "1.5", "true", "abc" 모두 예외를 던진다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<int> read_int(const YAML::Node& node, int fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// 노드 없음 → fallback, true/false 가 아님 → std::nullopt (타입 오류)
[[nodiscard]] std::optional<bool> read_bool(const YAML::Node& node, bool fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

// 중복 제거, 최초 등장 순서 유지 (이유 문자열의 키워드 순서가 설정 순서를 따르도록)
void push_unique(std::vector<std::string>& out, std::string value) {
    if (value.empty()) {
        return;
    }
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(std::move(value));
    }
}

}  // namespace

std::expected<void, PolicyError> validate_policy(const Policy& policy) {
    if (policy.name.empty()) {
        return fail(PolicyErrorCode::kMissingName, "Policy name is required", "name");
    }
    const auto& rules = policy.rules;
    if (rules.risk_adjustment < kMinRiskAdjustment || rules.risk_adjustment > kMaxRiskAdjustment) {
        return fail(PolicyErrorCode::kInvalidField,
                    "Risk adjustment must be an integer between -100 and 100",
                    "rules.risk_adjustment");
    }
    if (rules.block_threshold
        && (*rules.block_threshold < kMinScore || *rules.block_threshold > kMaxScore)) {
        return fail(PolicyErrorCode::kInvalidField,
                    "Block threshold must be an integer between 0 and 100",
                    "rules.block_threshold");
    }
    return {};
}

// ---------------------------------------------------------------------------
// parse_policy
//   YAML 예:
//     name: PCI-DSS Compliance
//     description: ...
//     enabled: true
//     priority: 10
//     rules:
//       keywords: [card, payment]
//       pattern_ids: [credit_card]
//       risk_adjustment: 25
//       block_threshold: 50
// ---------------------------------------------------------------------------
std::expected<Policy, PolicyError> parse_policy(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return fail(PolicyErrorCode::kMissingName, "Policy name is required", "name");
    }

    Policy policy{};
    policy.name        = read_string(node["name"], "");
    policy.description = read_string(node["description"], "");

    if (policy.name.empty()) {
        return fail(PolicyErrorCode::kMissingName, "Policy name is required", "name");
    }

    const YAML::Node rules_node = node["rules"];
    if (!rules_node || !rules_node.IsMap()) {
        return fail(PolicyErrorCode::kMissingRules, "Policy rules are required", "rules");
    }

    const auto enabled = read_bool(node["enabled"], true);
    if (!enabled) {
        return fail(PolicyErrorCode::kInvalidField, "Enabled must be a boolean", "enabled");
    }
    policy.enabled = *enabled;

    const auto priority = read_int(node["priority"], 0);
    if (!priority) {
        return fail(PolicyErrorCode::kInvalidField, "Priority must be an integer", "priority");
    }
    policy.priority = *priority;

    const auto adjustment = read_int(rules_node["risk_adjustment"], 0);
    if (!adjustment) {
        return fail(PolicyErrorCode::kInvalidField,
                    "Risk adjustment must be an integer between -100 and 100",
                    "rules.risk_adjustment");
    }
    policy.rules.risk_adjustment = *adjustment;

    const YAML::Node threshold_node = rules_node["block_threshold"];
    if (threshold_node && !threshold_node.IsNull()) {
        const auto threshold = read_int(threshold_node, 0);
        if (!threshold) {
            return fail(PolicyErrorCode::kInvalidField,
                        "Block threshold must be an integer between 0 and 100",
                        "rules.block_threshold");
        }
        policy.rules.block_threshold = *threshold;
    }

    const YAML::Node keywords_node = rules_node["keywords"];
    if (keywords_node && !keywords_node.IsNull()) {
        if (!keywords_node.IsSequence()) {
            return fail(PolicyErrorCode::kInvalidField, "Keywords must be a list of strings",
                        "rules.keywords");
        }
        for (const auto& item : keywords_node) {
            if (!item.IsScalar()) {
                return fail(PolicyErrorCode::kInvalidField, "Keywords must be a list of strings",
                            "rules.keywords");
            }
            push_unique(policy.rules.keywords, item.as<std::string>());
        }
    }

    const YAML::Node patterns_node = rules_node["pattern_ids"];
    if (patterns_node && !patterns_node.IsNull()) {
        if (!patterns_node.IsSequence()) {
            return fail(PolicyErrorCode::kInvalidField, "Pattern ids must be a list of strings",
                        "rules.pattern_ids");
        }
        for (const auto& item : patterns_node) {
            const std::string key = item.IsScalar() ? item.as<std::string>() : std::string{};
            const auto id = parse_pattern_id(key);
            if (!id) {
                return fail(PolicyErrorCode::kInvalidField,
                            fmt::format("Unknown pattern id '{}'", key),
                            "rules.pattern_ids");
            }
            auto& ids = policy.rules.pattern_ids;
            if (std::find(ids.begin(), ids.end(), *id) == ids.end()) {
                ids.push_back(*id);
            }
        }
    }

    if (auto valid = validate_policy(policy); !valid) {
        return std::unexpected(valid.error());
    }
    return policy;
}
