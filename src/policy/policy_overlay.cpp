// ---------------------------------------------------------------------------
// policy_overlay.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_overlay.hpp"

#include "normalizer/text_normalizer.hpp"  // ascii_lower

#include <algorithm>
#include <functional>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

Decision PolicyOverlay::apply(Decision decision, const std::vector<Policy>& policies) const {
    // 적용 대상만 참조로 모은 뒤 안정 정렬 (정책 객체 복사 없음)
    std::vector<std::reference_wrapper<const Policy>> active;
    active.reserve(policies.size());
    for (const auto& policy : policies) {
        if (policy.enabled) {
            active.emplace_back(policy);
        }
    }
    if (active.empty()) {
        return decision;
    }

    std::stable_sort(active.begin(), active.end(), [](const Policy& a, const Policy& b) {
        return a.priority > b.priority;
    });

    const std::string lowered_input = ascii_lower(decision.input);
    for (const Policy& policy : active) {
        apply_one(decision, policy, lowered_input);
    }

    spdlog::debug("policy_overlay: applied {} policies, score={}", active.size(),
                  decision.risk_score);
    return decision;
}

void PolicyOverlay::apply_one(Decision& decision, const Policy& policy,
                              const std::string& lowered_input) {
    const auto& rules = policy.rules;

    // 1. 점수 조정
    if (rules.risk_adjustment != 0) {
        decision.risk_score = clamp_score(decision.risk_score + rules.risk_adjustment);
        decision.reasons.push_back(fmt::format("Policy '{}': {:+d} risk adjustment",
                                               policy.name, rules.risk_adjustment));
    }

    // 2. 차단 임계값
    if (rules.block_threshold && decision.risk_score >= *rules.block_threshold) {
        apply_tier(decision, block_tier());
        decision.reasons.push_back(fmt::format("Policy '{}': Block threshold ({}) exceeded",
                                               policy.name, *rules.block_threshold));
    }

    // 3. 키워드 매칭 (설정 순서 유지)
    std::vector<std::string> matched;
    for (const auto& keyword : rules.keywords) {
        const std::string lowered = ascii_lower(keyword);
        if (!lowered.empty() && lowered_input.find(lowered) != std::string::npos) {
            matched.push_back(keyword);
        }
    }
    if (!matched.empty()) {
        decision.reasons.push_back(fmt::format("Policy '{}': Matched keywords: {}",
                                               policy.name, fmt::join(matched, ", ")));
    }
}
