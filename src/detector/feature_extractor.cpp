// ---------------------------------------------------------------------------
// feature_extractor.cpp
//
// [SSN/카드 검증 연계]
// 정규식 매칭만으로는 양성 처리하지 않는다. 매칭 목록 중 하나라도
// validate_ssn / luhn_check 를 통과해야 has_ssn / has_cc_like = 1.
//
// [키워드 매칭 한계]
// 부분 문자열 포함 방식이므로 "db" 는 "feedback" 에도 매칭된다 (false positive).
// 단어 경계 매칭으로 바꾸면 "api_key" 같은 결합 표기를 놓치므로 현 방식을 유지한다.
// ---------------------------------------------------------------------------

#include "detector/feature_extractor.hpp"

#include "detector/pattern_catalog.hpp"
#include "detector/validators.hpp"
#include "normalizer/text_normalizer.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// 엔트로피 청크 최소 길이
constexpr std::size_t kMinChunkLength = 12;

[[nodiscard]] constexpr bool is_chunk_char(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '_' || c == '.' || c == '/' || c == '+' || c == '=' || c == '-';
}

// \w (유니코드 문자 근사: 비 ASCII 바이트 포함) + '@' '.' '-'
[[nodiscard]] constexpr bool is_token_char(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '_' || c == '@' || c == '.' || c == '-' || c >= 0x80u;
}

[[nodiscard]] double ratio(double numerator, double denominator) noexcept {
    return numerator / std::max(1.0, denominator);
}

struct KeywordHits {
    std::size_t              medium{0};
    std::size_t              high{0};
    std::vector<std::string> matched{};
};

[[nodiscard]] KeywordHits keyword_hits(std::string_view text_lower) {
    KeywordHits hits{};
    for (const auto kw : FeatureExtractor::high_keywords()) {
        if (text_lower.find(kw) != std::string_view::npos) {
            ++hits.high;
            hits.matched.emplace_back(kw);
        }
    }
    for (const auto kw : FeatureExtractor::medium_keywords()) {
        if (text_lower.find(kw) != std::string_view::npos) {
            ++hits.medium;
            hits.matched.emplace_back(kw);
        }
    }
    std::sort(hits.matched.begin(), hits.matched.end());
    hits.matched.erase(std::unique(hits.matched.begin(), hits.matched.end()), hits.matched.end());
    return hits;
}

[[nodiscard]] bool any_valid_match(const PatternCatalog& catalog, PatternId id,
                                   std::string_view text, bool (*validator)(std::string_view) noexcept) {
    for (const auto& m : catalog.find_all(id, text)) {
        if (validator(m.value)) {
            return true;
        }
    }
    return false;
}

void add_entropy_features(std::string_view text, FeatureVector::ValueMap& out) {
    std::vector<double> entropies;

    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_chunk_char(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && is_chunk_char(static_cast<unsigned char>(text[j]))) {
            ++j;
        }
        if (j - i >= kMinChunkLength) {
            entropies.push_back(shannon_entropy(text.substr(i, j - i)));
        }
        i = j;
    }

    double max_ent = 0.0;
    double sum_ent = 0.0;
    for (const double e : entropies) {
        max_ent = std::max(max_ent, e);
        sum_ent += e;
    }
    out.emplace(feature::kMaxChunkEntropy, max_ent);
    out.emplace(feature::kAvgChunkEntropy,
                ratio(sum_ent, static_cast<double>(entropies.size())));
}

void add_token_stats(std::string_view text, FeatureVector::ValueMap& out) {
    std::size_t num_tokens    = 0;
    std::size_t total_len     = 0;
    std::size_t longest       = 0;
    std::size_t digit_tokens  = 0;
    std::size_t upper_tokens  = 0;

    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_token_char(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        bool has_digit = false;
        bool has_upper = false;
        std::size_t len = 0;  // 코드 포인트 수 (text_len 과 같은 기준)
        std::size_t j = i;
        while (j < text.size() && is_token_char(static_cast<unsigned char>(text[j]))) {
            const char c = text[j];
            has_digit = has_digit || (c >= '0' && c <= '9');
            has_upper = has_upper || (c >= 'A' && c <= 'Z');
            len += (static_cast<unsigned char>(c) & 0xC0u) == 0x80u ? 0 : 1;
            ++j;
        }
        ++num_tokens;
        total_len += len;
        longest = std::max(longest, len);
        digit_tokens += has_digit ? 1 : 0;
        upper_tokens += has_upper ? 1 : 0;
        i = j;
    }

    const auto n = static_cast<double>(num_tokens);
    out.emplace(feature::kNumTokens,       n);
    out.emplace(feature::kAvgTokenLen,     ratio(static_cast<double>(total_len), n));
    out.emplace(feature::kMaxTokenLen,     static_cast<double>(longest));
    out.emplace(feature::kDigitTokenRatio, ratio(static_cast<double>(digit_tokens), n));
    out.emplace(feature::kUpperTokenRatio, ratio(static_cast<double>(upper_tokens), n));
}

void add_character_ratios(std::string_view text, FeatureVector::ValueMap& out) {
    std::size_t length   = 0;
    std::size_t digits   = 0;
    std::size_t uppers   = 0;
    std::size_t lowers   = 0;
    std::size_t specials = 0;

    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if ((c & 0xC0u) == 0x80u) {
            continue;  // UTF-8 continuation 바이트는 길이에 포함하지 않음
        }
        ++length;
        if (c >= 0x80u) {
            continue;
        }
        if (c >= '0' && c <= '9') {
            ++digits;
        } else if (c >= 'A' && c <= 'Z') {
            ++uppers;
        } else if (c >= 'a' && c <= 'z') {
            ++lowers;
        } else if (c != ' ' && c != '\t' && c != '\n' && c != '\v' && c != '\f' && c != '\r') {
            ++specials;
        }
    }

    const auto len = static_cast<double>(length);
    out.emplace(feature::kTextLen,      len);
    out.emplace(feature::kDigitRatio,   ratio(static_cast<double>(digits), len));
    out.emplace(feature::kUpperRatio,   ratio(static_cast<double>(uppers), len));
    out.emplace(feature::kLowerRatio,   ratio(static_cast<double>(lowers), len));
    out.emplace(feature::kSpecialRatio, ratio(static_cast<double>(specials), len));
}

[[nodiscard]] double as_flag(bool value) noexcept {
    return value ? 1.0 : 0.0;
}

}  // namespace

// ---------------------------------------------------------------------------
// FeatureVector
// ---------------------------------------------------------------------------
FeatureVector::FeatureVector(ValueMap values, std::vector<std::string> matched_keywords)
    : values_(std::move(values))
    , matched_keywords_(std::move(matched_keywords))
{}

double FeatureVector::get(std::string_view name) const noexcept {
    const auto it = values_.find(name);
    return it == values_.end() ? 0.0 : it->second;
}

// ---------------------------------------------------------------------------
// 키워드 집합
// ---------------------------------------------------------------------------
const std::vector<std::string_view>& FeatureExtractor::high_keywords() {
    static const std::vector<std::string_view> keywords{
        "password", "passcode", "otp", "one-time password", "secret", "private key",
        "ssh private key", "api key", "access key", "bearer", "token", "client_secret",
    };
    return keywords;
}

const std::vector<std::string_view>& FeatureExtractor::medium_keywords() {
    static const std::vector<std::string_view> keywords{
        "ssn", "social security", "credit card", "card number", "account number",
        "routing", "bank", "invoice", "customer", "address", "phone", "email",
        "database", "db", "host", "internal",
    };
    return keywords;
}

const std::vector<std::string_view>& FeatureExtractor::infra_context_words() {
    static const std::vector<std::string_view> words{
        "internal", "database", "db", "host", "server",
    };
    return words;
}

// ---------------------------------------------------------------------------
// FeatureExtractor::extract
// ---------------------------------------------------------------------------
FeatureVector FeatureExtractor::extract(std::string_view normalized_text) const {
    const auto& catalog    = PatternCatalog::instance();
    const std::string text_lower = ascii_lower(normalized_text);

    FeatureVector::ValueMap values;

    add_character_ratios(normalized_text, values);

    auto kw = keyword_hits(text_lower);
    values.emplace(feature::kKeywordMedCount,  static_cast<double>(kw.medium));
    values.emplace(feature::kKeywordHighCount, static_cast<double>(kw.high));

    add_entropy_features(normalized_text, values);

    // 정규식 패턴 (SSN/카드는 구조 검증 통과분만)
    values.emplace(feature::kHasSsn,
                   as_flag(any_valid_match(catalog, PatternId::kSsn, normalized_text, validate_ssn)));
    values.emplace(feature::kHasCcLike,
                   as_flag(any_valid_match(catalog, PatternId::kCreditCard, normalized_text, luhn_check)));
    values.emplace(feature::kHasEmail,
                   as_flag(catalog.contains(PatternId::kEmail, normalized_text)));
    values.emplace(feature::kHasAwsAccessKey,
                   as_flag(catalog.contains(PatternId::kAwsAccessKey, normalized_text)));
    values.emplace(feature::kHasGithubToken,
                   as_flag(catalog.contains(PatternId::kGithubToken, normalized_text)));
    values.emplace(feature::kHasSlackToken,
                   as_flag(catalog.contains(PatternId::kSlackToken, normalized_text)));
    values.emplace(feature::kHasJwt,
                   as_flag(catalog.contains(PatternId::kJwt, normalized_text)));
    values.emplace(feature::kHasSshPrivateKey,
                   as_flag(catalog.contains(PatternId::kSshPrivateKey, normalized_text)));
    values.emplace(feature::kHasKeyValueSecret,
                   as_flag(catalog.contains(PatternId::kKeyValueSecret, normalized_text)));
    values.emplace(feature::kHasIpv4,
                   as_flag(catalog.contains(PatternId::kIpv4, normalized_text)));

    const auto& infra = infra_context_words();
    const bool infra_context = std::any_of(infra.begin(), infra.end(), [&](std::string_view w) {
        return text_lower.find(w) != std::string::npos;
    });
    values.emplace(feature::kHasInfraContext, as_flag(infra_context));

    add_token_stats(normalized_text, values);

    return FeatureVector{std::move(values), std::move(kw.matched)};
}
