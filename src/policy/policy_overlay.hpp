#pragma once

// ---------------------------------------------------------------------------
// policy_overlay.hpp
//
// 병합된 판정(Decision) 위에 컴플라이언스 정책을 순서대로 적용한다.
//
// [적용 순서]
// - enabled 정책만 대상.
// - priority 내림차순 안정 정렬 (동순위는 입력 순서 유지).
// - 각 정책은 누적 중인 Decision 을 읽고 수정한다:
//   1. risk_adjustment != 0 → score = clamp(score + adj, 0, 100), 이유 추가.
//      음수 조정은 점수를 낮출 수 있다 (정책 작성자가 명시한 예외).
//   2. block_threshold 설정 && score >= threshold → 차단 튜플로 강제, 이유 추가.
//      차단은 최상위 상태이므로 이 단계는 상태를 낮추지 않는다.
//   3. 키워드가 원문 입력(대소문자 무시)에 부분 문자열로 있으면 이유 추가.
//      정보성 이유만 추가하며 점수에는 영향이 없다.
//
// [스레드 안전성]
// 상태 없음. 정책 목록은 호출자가 소유한 불변 스냅샷으로 받는다.
// ---------------------------------------------------------------------------

#include "decision/decision.hpp"
#include "policy/policy.hpp"

#include <string>
#include <vector>

class PolicyOverlay {
public:
    [[nodiscard]] Decision apply(Decision decision, const std::vector<Policy>& policies) const;

private:
    static void apply_one(Decision& decision, const Policy& policy, const std::string& lowered_input);
};
