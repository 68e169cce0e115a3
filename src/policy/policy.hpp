#pragma once

// ---------------------------------------------------------------------------
// policy.hpp
//
// 컴플라이언스 정책 구조체 정의 (헤더만, 구현 없음).
// config/policies.yaml 또는 PolicyStore CRUD 를 통해 생성된다.
//
// [설계 원칙]
// - 판정 파이프라인은 정책을 읽기만 한다. 호출마다 불변 스냅샷을 받는다.
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 범위 검증은 policy_validator 가 담당한다. 이 구조체 자체는
//   판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include "detector/pattern_catalog.hpp"  // PatternId

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PolicyRules
//   keywords        : 원문 입력에 대소문자 무시 부분 문자열로 매칭 (정보성 이유만 추가)
//   pattern_ids     : 정책이 관심을 두는 탐지 패턴 (검증/표시용, 점수에 영향 없음)
//   risk_adjustment : [-100, 100]. 음수면 점수를 낮출 수 있다.
//   block_threshold : [0, 100]. 설정 시 score >= threshold 면 차단으로 강제.
// ---------------------------------------------------------------------------
struct PolicyRules {
    std::vector<std::string> keywords{};
    std::vector<PatternId>   pattern_ids{};
    int                      risk_adjustment{0};
    std::optional<int>       block_threshold{};
};

// ---------------------------------------------------------------------------
// Policy
//   name 이 고유 키. priority 가 높을수록 먼저 적용된다.
// ---------------------------------------------------------------------------
struct Policy {
    std::string name{};
    std::string description{};
    bool        enabled{true};
    int         priority{0};
    PolicyRules rules{};
};
