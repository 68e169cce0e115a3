#pragma once

// ---------------------------------------------------------------------------
// redaction_engine.hpp
//
// 원문 텍스트에서 민감정보 구간을 찾아 네 가지 모드로 치환한다.
// 판정 파이프라인(Decision)과 독립적으로 원문을 직접 입력받는다.
//
// [모드]
//   FULL     : 모든 매칭 구간 → placeholder (기본 "[REDACTED]").
//              PEM 개인키 블록(BEGIN~END)과 key=value 시크릿의 값도 포함.
//   PARTIAL  : 패턴별 부분 마스킹
//                SSN   → ***-**-6789
//                카드  → 끝 show_last 자리 외 숫자 마스킹 (Luhn 통과 구간만)
//                이메일 → ***@domain
//                클라우드 키 → 앞 4 + 마스크 + 끝 4
//                토큰/JWT → 끝 show_last 자 외 마스킹
//                IPv4  → ***.***.***.<마지막 옥텟>
//   TOKENIZE : [<NAME>_<16자리 대문자 hex>] 토큰으로 치환, TokenVault 에 기록 (가역)
//   HASH     : [HASH:<SHA-256 앞 16 hex>] (비가역)
//
// [치환 방식: 구간 추적, 단일 패스]
// - 모든 패턴은 "원문"에 대해 매칭한다. 치환 결과를 다시 스캔하지 않는다.
// - 우선순위: SSN > 카드 > 이메일 > 클라우드 키 > 소스 컨트롤 토큰 >
//   Pub/Sub 토큰 > JWT > PEM 블록(FULL 전용) > key=value 시크릿 값(FULL 전용) > IPv4.
//   앞 순위 패턴이 차지한 구간과 겹치는 매칭은 버린다.
// - 결과는 원문 오프셋 순서로 조립한다. 토큰은 특정 바이트 오프셋의
//   매칭에 묶인다 (같은 값이 여러 번 나와도 각각 별도 토큰).
//
// [오류]
// - 알 수 없는 모드 문자열 → RedactionError{kUnsupportedMode, mode}
// - PARTIAL 의 show_last < 0 → RedactionError{kInvalidParams}
// - 난수/해시 생성 실패(OpenSSL) 는 std::runtime_error (정상 환경에서 발생하지 않음)
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "detector/pattern_catalog.hpp"
#include "redaction/token_vault.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class RedactionMode : std::uint8_t {
    kFull     = 0,
    kPartial  = 1,
    kTokenize = 2,
    kHash     = 3,
};

// "full" | "partial" | "tokenize" | "hash"
[[nodiscard]] std::string_view to_string(RedactionMode mode) noexcept;

// 대소문자 무시. 실패 시 kUnsupportedMode (mode 필드에 입력 그대로).
[[nodiscard]] std::expected<RedactionMode, RedactionError> parse_redaction_mode(std::string_view name);

struct RedactionParams {
    std::string placeholder{"[REDACTED]"};  // FULL 전용
    int         show_last{4};               // PARTIAL 전용
};

struct RedactionResult {
    RedactionMode                  mode{RedactionMode::kFull};
    std::string                    sanitized_text{};
    std::optional<TokenVault::Map> token_vault{};  // TOKENIZE 일 때만
    bool                           reversible{false};
};

struct RedactionModeInfo {
    RedactionMode    mode;
    std::string_view description;
    bool             reversible;
};

class RedactionEngine {
public:
    [[nodiscard]] std::expected<RedactionResult, RedactionError>
    redact(std::string_view text, RedactionMode mode, const RedactionParams& params = {}) const;

    // 호출자가 소유한 vault 에 토큰을 기록한다. 요청 간 역변환용.
    [[nodiscard]] std::string tokenize(std::string_view text, TokenVault& vault) const;

    // 왼쪽부터 한 번만 훑으며 vault 에 있는 토큰만 원문으로 되돌린다.
    // 복원된 값은 다시 스캔하지 않는다.
    [[nodiscard]] static std::string detokenize(std::string_view text, const TokenVault& vault);
    [[nodiscard]] static std::string detokenize(std::string_view text, const TokenVault::Map& vault);

    [[nodiscard]] static const std::array<RedactionModeInfo, 4>& available_modes() noexcept;

private:
    // 우선순위를 적용해 겹치지 않는 매칭 구간을 오프셋 순으로 반환
    [[nodiscard]] static std::vector<PatternMatch> claim_spans(std::string_view text, RedactionMode mode);
};
