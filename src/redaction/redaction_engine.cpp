// ---------------------------------------------------------------------------
// redaction_engine.cpp
//
// [OpenSSL 사용]
// - 토큰 난수: RAND_bytes (CSPRNG). 8 바이트 → 16 hex.
// - HASH 모드: EVP_Digest + EVP_sha256, 앞 8 바이트(16 hex)만 사용.
// - 두 호출 모두 실패 시 std::runtime_error. 부분 치환 결과를 반환하지 않는다.
// ---------------------------------------------------------------------------

#include "redaction/redaction_engine.hpp"

#include "detector/validators.hpp"         // luhn_check
#include "normalizer/text_normalizer.hpp"  // ascii_lower

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

namespace {

// 치환 우선순위 (앞이 우선)
constexpr std::array<PatternId, 10> kRedactionOrder{
    PatternId::kSsn,          PatternId::kCreditCard,    PatternId::kEmail,
    PatternId::kAwsAccessKey, PatternId::kGithubToken,   PatternId::kSlackToken,
    PatternId::kJwt,          PatternId::kSshPrivateKey, PatternId::kKeyValueSecret,
    PatternId::kIpv4,
};

// PEM 블록과 key=value 시크릿 값은 FULL 에서만 치환한다
[[nodiscard]] constexpr bool full_mode_only(PatternId id) noexcept {
    return id == PatternId::kSshPrivateKey || id == PatternId::kKeyValueSecret;
}

constexpr std::size_t kTokenRandomBytes = 8;   // 16 hex
constexpr std::size_t kHashPrefixBytes  = 8;   // 16 hex

[[nodiscard]] std::string to_upper_hex(const unsigned char* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

[[nodiscard]] std::string to_lower_hex(const unsigned char* data, std::size_t len) {
    return ascii_lower(to_upper_hex(data, len));
}

[[nodiscard]] std::string sha256_prefix_hex(std::string_view value) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(value.data(), value.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("redaction_engine: EVP_Digest(sha256) failed");
    }
    return to_lower_hex(digest.data(), std::min<std::size_t>(kHashPrefixBytes, digest_len));
}

[[nodiscard]] std::string random_token(PatternId id) {
    std::array<unsigned char, kTokenRandomBytes> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("redaction_engine: RAND_bytes failed");
    }
    return fmt::format("[{}_{}]", vault_name(id), to_upper_hex(bytes.data(), bytes.size()));
}

[[nodiscard]] bool overlaps(const PatternMatch& a, const PatternMatch& b) noexcept {
    return a.offset < b.offset + b.length && b.offset < a.offset + a.length;
}

[[nodiscard]] std::string digits_only(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    for (const char c : text) {
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
        }
    }
    return digits;
}

// 끝 show_last 자를 남기고 '*' 로 마스킹. 길이가 show_last 이하면 전부 마스킹.
[[nodiscard]] std::string mask_keep_last(std::string_view value, std::size_t show_last) {
    if (value.size() <= show_last) {
        return std::string(value.size(), '*');
    }
    return std::string(value.size() - show_last, '*')
         + std::string(value.substr(value.size() - show_last));
}

// ---------------------------------------------------------------------------
// PARTIAL 모드 패턴별 마스킹
// ---------------------------------------------------------------------------
[[nodiscard]] std::string partial_mask(const PatternMatch& m, std::size_t show_last) {
    const std::string_view value = m.value;
    switch (m.id) {
        case PatternId::kSsn:
            return fmt::format("***-**-{}", value.substr(value.size() - 4));

        case PatternId::kCreditCard: {
            const std::string digits = digits_only(value);
            if (digits.size() >= show_last) {
                return std::string(digits.size() - show_last, '*')
                     + digits.substr(digits.size() - show_last);
            }
            return std::string(digits.size(), '*');
        }

        case PatternId::kEmail: {
            const auto at = value.find('@');
            if (at == std::string_view::npos) {
                return "***";
            }
            return fmt::format("***@{}", value.substr(at + 1));
        }

        case PatternId::kAwsAccessKey:
            // 항상 20자 (AKIA/ASIA + 16)
            return fmt::format("{}{}{}", value.substr(0, 4),
                               std::string(value.size() - 8, '*'),
                               value.substr(value.size() - 4));

        case PatternId::kGithubToken:
        case PatternId::kSlackToken:
        case PatternId::kJwt:
            return mask_keep_last(value, show_last);

        case PatternId::kIpv4: {
            const auto dot = value.rfind('.');
            if (dot == std::string_view::npos) {
                return "***";
            }
            return fmt::format("***.***.***.{}", value.substr(dot + 1));
        }

        default:
            return std::string(value.size(), '*');
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// 모드 이름
// ---------------------------------------------------------------------------
std::string_view to_string(RedactionMode mode) noexcept {
    switch (mode) {
        case RedactionMode::kFull:     return "full";
        case RedactionMode::kPartial:  return "partial";
        case RedactionMode::kTokenize: return "tokenize";
        case RedactionMode::kHash:     return "hash";
        default:                       return "full";
    }
}

std::expected<RedactionMode, RedactionError> parse_redaction_mode(std::string_view name) {
    const std::string lowered = ascii_lower(name);
    for (const auto& info : RedactionEngine::available_modes()) {
        if (to_string(info.mode) == lowered) {
            return info.mode;
        }
    }
    return std::unexpected(RedactionError{
        RedactionErrorCode::kUnsupportedMode,
        fmt::format("Unknown redaction mode: {}", name),
        std::string(name),
    });
}

const std::array<RedactionModeInfo, 4>& RedactionEngine::available_modes() noexcept {
    static constexpr std::array<RedactionModeInfo, 4> kModes{{
        {RedactionMode::kFull,     "Replace all sensitive data with [REDACTED]", false},
        {RedactionMode::kPartial,  "Show last N characters, mask the rest",      false},
        {RedactionMode::kTokenize, "Replace with reversible tokens",             true},
        {RedactionMode::kHash,     "One-way hashing for anonymization",          false},
    }};
    return kModes;
}

// ---------------------------------------------------------------------------
// claim_spans
//   우선순위 순으로 패턴을 적용하며 겹치지 않는 구간만 차지한다.
//   PARTIAL 은 Luhn 검증을 통과한 카드 구간만 차지한다.
// ---------------------------------------------------------------------------
std::vector<PatternMatch> RedactionEngine::claim_spans(std::string_view text, RedactionMode mode) {
    const auto& catalog = PatternCatalog::instance();
    std::vector<PatternMatch> claimed;

    for (const auto id : kRedactionOrder) {
        if (full_mode_only(id) && mode != RedactionMode::kFull) {
            continue;
        }
        for (auto& match : catalog.find_all(id, text)) {
            if (mode == RedactionMode::kPartial && id == PatternId::kCreditCard
                && !luhn_check(match.value)) {
                continue;
            }
            const bool taken = std::any_of(claimed.begin(), claimed.end(),
                [&match](const PatternMatch& c) { return overlaps(c, match); });
            if (!taken) {
                claimed.push_back(std::move(match));
            }
        }
    }

    std::sort(claimed.begin(), claimed.end(), [](const PatternMatch& a, const PatternMatch& b) {
        return a.offset < b.offset;
    });
    return claimed;
}

// ---------------------------------------------------------------------------
// redact
// ---------------------------------------------------------------------------
std::expected<RedactionResult, RedactionError>
RedactionEngine::redact(std::string_view text, RedactionMode mode, const RedactionParams& params) const {
    if (mode == RedactionMode::kPartial && params.show_last < 0) {
        return std::unexpected(RedactionError{
            RedactionErrorCode::kInvalidParams,
            fmt::format("show_last must be >= 0 (got {})", params.show_last),
            std::string(to_string(mode)),
        });
    }

    RedactionResult result{};
    result.mode = mode;

    if (mode == RedactionMode::kTokenize) {
        TokenVault vault;
        result.sanitized_text = tokenize(text, vault);
        result.token_vault    = vault.snapshot();
        result.reversible     = true;
        return result;
    }

    const auto spans = claim_spans(text, mode);
    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;
    for (const auto& span : spans) {
        out.append(text.substr(cursor, span.offset - cursor));
        switch (mode) {
            case RedactionMode::kFull:
                out.append(params.placeholder);
                break;
            case RedactionMode::kPartial:
                out.append(partial_mask(span, static_cast<std::size_t>(params.show_last)));
                break;
            case RedactionMode::kHash:
                out.append(fmt::format("[HASH:{}]", sha256_prefix_hex(span.value)));
                break;
            case RedactionMode::kTokenize:
                break;
        }
        cursor = span.offset + span.length;
    }
    out.append(text.substr(cursor));

    spdlog::debug("redaction_engine: mode={} spans={}", to_string(mode), spans.size());

    result.sanitized_text = std::move(out);
    return result;
}

// ---------------------------------------------------------------------------
// tokenize
//   각 토큰은 해당 바이트 오프셋의 매칭 하나에만 묶인다.
//   vault 또는 원문에 이미 있는 토큰이 나오면 다시 생성한다.
// ---------------------------------------------------------------------------
std::string RedactionEngine::tokenize(std::string_view text, TokenVault& vault) const {
    const auto spans = claim_spans(text, RedactionMode::kTokenize);

    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;
    for (const auto& span : spans) {
        out.append(text.substr(cursor, span.offset - cursor));

        std::string token = random_token(span.id);
        while (text.find(token) != std::string_view::npos || !vault.insert(token, span.value)) {
            token = random_token(span.id);
        }
        out.append(token);
        cursor = span.offset + span.length;
    }
    out.append(text.substr(cursor));

    spdlog::debug("redaction_engine: tokenized {} spans (vault size={})", spans.size(), vault.size());
    return out;
}

// ---------------------------------------------------------------------------
// detokenize
// ---------------------------------------------------------------------------
namespace {

template <typename Lookup>
[[nodiscard]] std::string detokenize_with(std::string_view text, Lookup&& lookup) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find('[', pos);
        if (open == std::string_view::npos) {
            break;
        }
        const auto close = text.find(']', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        out.append(text.substr(pos, open - pos));

        const auto candidate = text.substr(open, close - open + 1);
        if (auto original = lookup(candidate)) {
            out.append(*original);
            pos = close + 1;
        } else {
            // 토큰이 아니면 '[' 만 내보내고 다음 위치부터 다시 찾는다
            out.push_back('[');
            pos = open + 1;
        }
    }
    out.append(text.substr(std::min(pos, text.size())));
    return out;
}

}  // namespace

std::string RedactionEngine::detokenize(std::string_view text, const TokenVault& vault) {
    return detokenize_with(text, [&vault](std::string_view token) { return vault.find(token); });
}

std::string RedactionEngine::detokenize(std::string_view text, const TokenVault::Map& vault) {
    return detokenize_with(text, [&vault](std::string_view token) -> std::optional<std::string> {
        const auto it = vault.find(token);
        if (it == vault.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}
