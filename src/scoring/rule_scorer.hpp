#pragma once

// ---------------------------------------------------------------------------
// rule_scorer.hpp
//
// FeatureVector → 위험 점수 [0,100] + 판정 이유 목록 → 고정 임계값 매핑.
// 결정적이며 부작용 없는 함수. 판정 파이프라인의 권위 있는(authoritative) 단계.
//
// [가산 규칙]
//   HIGH 키워드          : +35 + 10 × 개수
//   MEDIUM 키워드만       : +15 + 5 × 개수   (HIGH 가 하나라도 있으면 미적용)
//   PEM 개인키 마커       : +80
//   클라우드 액세스 키     : +70
//   토큰/JWT/키-값 시크릿 : +55 (하나 이상이면 1회)
//   검증된 SSN           : +60
//   검증된 카드번호        : +45
//   이메일               : +10
//   IPv4 + 인프라 문맥    : +20
//   고엔트로피 긴 토큰     : +25 (max_chunk_entropy >= 4.2 && max_token_len >= 20)
//   텍스트 길이 >= 250    : +5
//
// 규칙 하나당 이유 문자열 정확히 1개를 추가한다.
// 아무 규칙도 발동하지 않으면 "No sensitive patterns detected" 1개.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "detector/feature_extractor.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RuleDecision
//   classification/risk_level/action 은 항상 tier_for_score(risk_score) 와 일치.
//   reasons 는 추가 전용이며 순서가 곧 근거 순서다.
// ---------------------------------------------------------------------------
struct RuleDecision {
    Classification           classification{Classification::kSafe};
    RiskLevel                risk_level{RiskLevel::kLow};
    Action                   action{Action::kAllow};
    int                      risk_score{0};
    std::vector<std::string> reasons{};
};

class RuleScorer {
public:
    // 엔트로피 의심 기준
    static constexpr double kEntropyThreshold   = 4.2;
    static constexpr double kLongTokenThreshold = 20.0;
    static constexpr double kLongTextThreshold  = 250.0;

    [[nodiscard]] RuleDecision score(const FeatureVector& features) const;
};
