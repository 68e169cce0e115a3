#pragma once

// ---------------------------------------------------------------------------
// assist_merger.hpp
//
// 규칙 판정(RuleDecision)과 보조 분류기 신호를 보수적으로 병합한다.
//
// [병합 정책: confidence >= strong 일 때만 신호를 반영]
//   규칙 HIGH   + 임의 라벨               → 변경 없음 (차단은 절대 하향 금지)
//   규칙 MEDIUM + HIGHLY_CONFIDENTIAL     → HIGH/BLOCK/HIGHLY_CONFIDENTIAL,
//                                            score = max(score, 70)
//   규칙 MEDIUM + SAFE                    → MEDIUM 유지, 불일치 이유만 기록
//   규칙 LOW    + SENSITIVE               → MEDIUM/LOG/SENSITIVE, score = max(score, 35)
//   규칙 LOW    + HIGHLY_CONFIDENTIAL     → MEDIUM/LOG/HIGHLY_CONFIDENTIAL,
//                                            score = max(score, 60)
//   confidence < strong 또는 신호 없음     → 변경 없음
//
// ❌ 금지: 분류기 신호로 risk_level/action/classification 을 낮추는 것.
// ---------------------------------------------------------------------------

#include "classifier/classifier.hpp"
#include "decision/decision.hpp"
#include "scoring/rule_scorer.hpp"

#include <optional>

class AssistMerger {
public:
    static constexpr double kDefaultStrongConfidence = 0.80;

    explicit AssistMerger(double strong_confidence = kDefaultStrongConfidence);

    [[nodiscard]] Decision merge(RuleDecision rules,
                                 const std::optional<ClassifierSignal>& signal) const;

    [[nodiscard]] double strong_confidence() const noexcept { return strong_confidence_; }

private:
    double strong_confidence_;
};
