#pragma once

// ---------------------------------------------------------------------------
// decision.hpp
//
// 최종 판정(Decision). RuleDecision 의 상위 집합.
//
// [불변식]
// - risk_score 는 항상 [0,100].
// - risk_score 는 파이프라인 단계마다 단조 비감소한다.
//   예외: 정책의 음수 risk_adjustment (정책 작성자가 명시적으로 허용한 감소).
// - reasons 는 추가 전용. 병합/정책 단계의 이유는 규칙 이유 뒤에 덧붙는다.
// - input 은 정규화 전 원문 그대로 (직렬화 시 에코, 정책 키워드 매칭 대상).
// ---------------------------------------------------------------------------

#include "classifier/classifier.hpp"
#include "common/types.hpp"
#include "scoring/rule_scorer.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

struct Decision {
    Classification                  classification{Classification::kSafe};
    RiskLevel                       risk_level{RiskLevel::kLow};
    Action                          action{Action::kAllow};
    int                             risk_score{0};
    std::vector<std::string>        reasons{};
    std::optional<ClassifierSignal> ml_assist{};
    std::string                     input{};
};

[[nodiscard]] inline Decision decision_from_rules(RuleDecision rules) {
    Decision d{};
    d.classification = rules.classification;
    d.risk_level     = rules.risk_level;
    d.action         = rules.action;
    d.risk_score     = rules.risk_score;
    d.reasons        = std::move(rules.reasons);
    return d;
}

inline void apply_tier(Decision& d, const DecisionTier& tier) noexcept {
    d.risk_level     = tier.risk_level;
    d.action         = tier.action;
    d.classification = tier.classification;
}
