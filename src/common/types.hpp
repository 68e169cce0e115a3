#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Classification / RiskLevel / Action
//   판정 파이프라인 전 구간에서 공유하는 분류 체계.
//   정수값은 직렬화(pred_label) 및 감사 로그에서 그대로 사용되므로 변경 금지.
// ---------------------------------------------------------------------------
enum class Classification : std::uint8_t {
    kSafe               = 0,
    kSensitive          = 1,
    kHighlyConfidential = 2,
};

enum class RiskLevel : std::uint8_t {
    kLow    = 0,
    kMedium = 1,
    kHigh   = 2,
};

enum class Action : std::uint8_t {
    kAllow = 0,  // 통과
    kLog   = 1,  // 통과 + 감사 로그
    kBlock = 2,  // 차단
};

[[nodiscard]] std::string_view to_string(Classification value) noexcept;
[[nodiscard]] std::string_view to_string(RiskLevel value) noexcept;
[[nodiscard]] std::string_view to_string(Action value) noexcept;

// ---------------------------------------------------------------------------
// DecisionTier
//   점수 → (risk_level, action, classification) 고정 매핑 결과.
//
//   score >= 70       → (HIGH,   BLOCK, HIGHLY_CONFIDENTIAL)
//   30 <= score < 70  → (MEDIUM, LOG,   SENSITIVE)
//   score < 30        → (LOW,    ALLOW, SAFE)
//
//   임계값은 이 함수에만 존재한다. 다른 모듈은 상수를 복제하지 말 것.
// ---------------------------------------------------------------------------
struct DecisionTier {
    RiskLevel      risk_level{RiskLevel::kLow};
    Action         action{Action::kAllow};
    Classification classification{Classification::kSafe};
};

inline constexpr int kBlockScore = 70;
inline constexpr int kLogScore   = 30;
inline constexpr int kMinScore   = 0;
inline constexpr int kMaxScore   = 100;

[[nodiscard]] DecisionTier tier_for_score(int score) noexcept;

// 차단 튜플 (HIGH, BLOCK, HIGHLY_CONFIDENTIAL)
[[nodiscard]] constexpr DecisionTier block_tier() noexcept {
    return DecisionTier{RiskLevel::kHigh, Action::kBlock, Classification::kHighlyConfidential};
}

[[nodiscard]] constexpr int clamp_score(int score) noexcept {
    if (score < kMinScore) {
        return kMinScore;
    }
    if (score > kMaxScore) {
        return kMaxScore;
    }
    return score;
}

// ---------------------------------------------------------------------------
// AnalysisError
//   텍스트 1건 분석 실패 정보. std::expected<Decision, AnalysisError> 로 반환.
//   배치 분석에서 한 건의 실패가 다른 건에 영향을 주지 않도록 값으로 격리한다.
// ---------------------------------------------------------------------------
enum class AnalysisErrorCode : std::uint8_t {
    kMalformedInput = 0,  // UTF-8 구조 오류 등 입력 바이트 자체가 잘못됨
    kInternalError  = 1,  // 파이프라인 내부 예외 (정상 입력에서는 발생하지 않아야 함)
};

struct AnalysisError {
    AnalysisErrorCode code{AnalysisErrorCode::kInternalError};
    std::string       message{};
};

[[nodiscard]] std::string_view to_string(AnalysisErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// RedactionError
//   지원하지 않는 마스킹 모드 또는 모드 파라미터 오류.
//   mode 에는 호출자가 넘긴 모드 문자열을 그대로 담는다.
// ---------------------------------------------------------------------------
enum class RedactionErrorCode : std::uint8_t {
    kUnsupportedMode = 0,
    kInvalidParams   = 1,
};

struct RedactionError {
    RedactionErrorCode code{RedactionErrorCode::kUnsupportedMode};
    std::string        message{};
    std::string        mode{};
};

[[nodiscard]] std::string_view to_string(RedactionErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// PolicyError
//   정책 검증/CRUD 실패. field 는 문제가 된 필드 이름 (해당 없으면 빈 문자열).
//   검증 오류는 호출자에게만 반환하며 경보 로그로 남기지 않는다.
// ---------------------------------------------------------------------------
enum class PolicyErrorCode : std::uint8_t {
    kMissingName   = 0,
    kMissingRules  = 1,
    kInvalidField  = 2,
    kDuplicateName = 3,
    kNotFound      = 4,
};

struct PolicyError {
    PolicyErrorCode code{PolicyErrorCode::kInvalidField};
    std::string     message{};
    std::string     field{};
};

[[nodiscard]] std::string_view to_string(PolicyErrorCode code) noexcept;
