#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 감사 로그 타입 정의.
//
// [민감정보 취급 주의]
// - redacted_input 에는 반드시 FULL 마스킹된 텍스트를 넣는다.
//   원문 입력을 감사 로그에 기록하지 말 것.
// - 정책 키워드 매칭 이유(reasons)는 키워드 자체만 포함하므로 기록해도 된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "warning" | "error" (대소문자 무시)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ---------------------------------------------------------------------------
// DecisionLog
//   MEDIUM 판정 감사 로그 (info).
//   ml_assisted: 보조 분류기 신호가 존재했는지 여부
// ---------------------------------------------------------------------------
struct DecisionLog {
    Classification                        classification{Classification::kSafe};
    RiskLevel                             risk_level{RiskLevel::kLow};
    Action                                action{Action::kAllow};
    int                                   risk_score{0};
    std::vector<std::string>              reasons{};
    std::string                           redacted_input{};  // FULL 마스킹 결과
    bool                                  ml_assisted{false};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};       // 분석 소요 시간
};

// ---------------------------------------------------------------------------
// AlertLog
//   HIGH 판정 경보 로그 (warn). 실시간 알림 채널 연계 대상.
// ---------------------------------------------------------------------------
struct AlertLog {
    Classification                        classification{Classification::kHighlyConfidential};
    int                                   risk_score{0};
    std::vector<std::string>              reasons{};
    std::string                           redacted_input{};  // FULL 마스킹 결과
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// RedactionLog
//   마스킹 요청 로그 (info). 원문/결과 텍스트는 기록하지 않고 크기만 남긴다.
// ---------------------------------------------------------------------------
struct RedactionLog {
    std::string                           mode{};
    std::size_t                           input_length{0};
    std::size_t                           output_length{0};
    std::size_t                           token_count{0};  // TOKENIZE 일 때 vault 크기
    bool                                  reversible{false};
    std::chrono::system_clock::time_point timestamp{};
};
