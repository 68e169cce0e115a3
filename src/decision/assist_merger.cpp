// ---------------------------------------------------------------------------
// assist_merger.cpp
// ---------------------------------------------------------------------------

#include "decision/assist_merger.hpp"

#include <algorithm>
#include <utility>

AssistMerger::AssistMerger(double strong_confidence)
    : strong_confidence_(strong_confidence)
{}

Decision AssistMerger::merge(RuleDecision rules,
                             const std::optional<ClassifierSignal>& signal) const {
    Decision final_decision = decision_from_rules(std::move(rules));
    final_decision.ml_assist = signal;

    if (!signal || signal->confidence < strong_confidence_) {
        return final_decision;
    }

    switch (final_decision.risk_level) {
        case RiskLevel::kHigh:
            // 차단 판정은 분류기 신호와 무관하게 유지
            break;

        case RiskLevel::kMedium:
            if (signal->label == Classification::kHighlyConfidential) {
                apply_tier(final_decision, block_tier());
                final_decision.risk_score = std::max(final_decision.risk_score, kBlockScore);
                final_decision.reasons.emplace_back("ML assist: high-confidence HIGHLY_CONFIDENTIAL");
            } else if (signal->label == Classification::kSafe) {
                final_decision.reasons.emplace_back(
                    "ML assist: high-confidence SAFE (rules kept authoritative)");
            }
            break;

        case RiskLevel::kLow:
            if (signal->label == Classification::kSensitive
                || signal->label == Classification::kHighlyConfidential) {
                const bool highly = signal->label == Classification::kHighlyConfidential;
                final_decision.risk_level     = RiskLevel::kMedium;
                final_decision.action         = Action::kLog;
                final_decision.classification = signal->label;
                final_decision.risk_score =
                    std::max(final_decision.risk_score, highly ? 60 : 35);
                final_decision.reasons.emplace_back(
                    "ML assist: elevated due to high-confidence prediction");
            }
            break;
    }

    return final_decision;
}
