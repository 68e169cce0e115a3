// ---------------------------------------------------------------------------
// types.cpp
//
// 공용 열거형 문자열 변환 및 점수 → 판정 티어 매핑.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

std::string_view to_string(Classification value) noexcept {
    switch (value) {
        case Classification::kSafe:               return "SAFE";
        case Classification::kSensitive:          return "SENSITIVE";
        case Classification::kHighlyConfidential: return "HIGHLY_CONFIDENTIAL";
        default:                                  return "SAFE";
    }
}

std::string_view to_string(RiskLevel value) noexcept {
    switch (value) {
        case RiskLevel::kLow:    return "LOW";
        case RiskLevel::kMedium: return "MEDIUM";
        case RiskLevel::kHigh:   return "HIGH";
        default:                 return "LOW";
    }
}

std::string_view to_string(Action value) noexcept {
    switch (value) {
        case Action::kAllow: return "ALLOW";
        case Action::kLog:   return "LOG";
        case Action::kBlock: return "BLOCK";
        default:             return "ALLOW";
    }
}

std::string_view to_string(AnalysisErrorCode code) noexcept {
    switch (code) {
        case AnalysisErrorCode::kMalformedInput: return "malformed_input";
        case AnalysisErrorCode::kInternalError:  return "internal_error";
        default:                                 return "internal_error";
    }
}

std::string_view to_string(RedactionErrorCode code) noexcept {
    switch (code) {
        case RedactionErrorCode::kUnsupportedMode: return "unsupported_mode";
        case RedactionErrorCode::kInvalidParams:   return "invalid_params";
        default:                                   return "invalid_params";
    }
}

std::string_view to_string(PolicyErrorCode code) noexcept {
    switch (code) {
        case PolicyErrorCode::kMissingName:   return "missing_name";
        case PolicyErrorCode::kMissingRules:  return "missing_rules";
        case PolicyErrorCode::kInvalidField:  return "invalid_field";
        case PolicyErrorCode::kDuplicateName: return "duplicate_name";
        case PolicyErrorCode::kNotFound:      return "not_found";
        default:                              return "invalid_field";
    }
}

// ---------------------------------------------------------------------------
// tier_for_score
//   입력 점수는 호출자가 이미 [0,100] 으로 clamp 했다고 가정하지 않는다.
// ---------------------------------------------------------------------------
DecisionTier tier_for_score(int score) noexcept {
    const int s = clamp_score(score);
    if (s >= kBlockScore) {
        return block_tier();
    }
    if (s >= kLogScore) {
        return DecisionTier{RiskLevel::kMedium, Action::kLog, Classification::kSensitive};
    }
    return DecisionTier{RiskLevel::kLow, Action::kAllow, Classification::kSafe};
}
