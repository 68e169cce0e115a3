#pragma once

// ---------------------------------------------------------------------------
// feature_extractor.hpp
//
// 정규화된 텍스트(structural 형태)에서 키워드/정규식/엔트로피/토큰 통계
// 탐지기를 실행하여 평탄한 수치 특성 벡터(FeatureVector)를 만든다.
//
// [탐지기 목록: 각각 독립 계산]
// - 키워드 집합 (HIGH / MEDIUM): 소문자화 후 부분 문자열 포함 여부
// - 정규식 패턴 (PatternCatalog): SSN/카드는 구조 검증 통과 시에만 양성
// - 엔트로피: [A-Za-z0-9_./+=-]{12,} 청크별 Shannon 엔트로피 최대/평균
// - 토큰 통계: [^\w@.-]+ 경계로 분할한 토큰 수/평균·최대 길이/숫자·대문자 비율
// - 문자 비율: 숫자/대문자/소문자/특수문자 비율 및 텍스트 길이
//
// [0 나누기 방지]
// 모든 비율은 max(1, 분모) 로 나눈다. 빈 입력에서도 예외 없음.
//
// [길이 단위]
// text_len 및 문자 비율의 분모는 UTF-8 코드포인트 수.
// 비 ASCII 코드포인트는 길이에만 포함되고 숫자/대소문자/특수문자 어디에도
// 집계되지 않는다.
// ---------------------------------------------------------------------------

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// 특성 이름 상수. 분류기 모델 파일(numeric_weights)의 키와 일치해야 한다.
// ---------------------------------------------------------------------------
namespace feature {
inline constexpr std::string_view kTextLen           = "text_len";
inline constexpr std::string_view kDigitRatio        = "digit_ratio";
inline constexpr std::string_view kUpperRatio        = "upper_ratio";
inline constexpr std::string_view kLowerRatio        = "lower_ratio";
inline constexpr std::string_view kSpecialRatio      = "special_ratio";
inline constexpr std::string_view kKeywordMedCount   = "keyword_med_count";
inline constexpr std::string_view kKeywordHighCount  = "keyword_high_count";
inline constexpr std::string_view kMaxChunkEntropy   = "max_chunk_entropy";
inline constexpr std::string_view kAvgChunkEntropy   = "avg_chunk_entropy";
inline constexpr std::string_view kHasSsn            = "has_ssn";
inline constexpr std::string_view kHasCcLike         = "has_cc_like";
inline constexpr std::string_view kHasEmail          = "has_email";
inline constexpr std::string_view kHasAwsAccessKey   = "has_aws_access_key";
inline constexpr std::string_view kHasGithubToken    = "has_github_token";
inline constexpr std::string_view kHasSlackToken     = "has_slack_token";
inline constexpr std::string_view kHasJwt            = "has_jwt";
inline constexpr std::string_view kHasSshPrivateKey  = "has_ssh_private_key";
inline constexpr std::string_view kHasKeyValueSecret = "has_key_value_secret";
inline constexpr std::string_view kHasIpv4           = "has_ipv4";
inline constexpr std::string_view kHasInfraContext   = "has_infra_context";
inline constexpr std::string_view kNumTokens         = "num_tokens";
inline constexpr std::string_view kAvgTokenLen       = "avg_token_len";
inline constexpr std::string_view kMaxTokenLen       = "max_token_len";
inline constexpr std::string_view kDigitTokenRatio   = "digit_token_ratio";
inline constexpr std::string_view kUpperTokenRatio   = "upper_token_ratio";
}  // namespace feature

// ---------------------------------------------------------------------------
// FeatureVector
//   특성 이름 → 수치 값. 생성 후 불변.
//   비율은 [0,1], 개수는 >= 0, boolean 은 0/1 로 인코딩한다.
//   matched_keywords 는 설명용(정렬·중복 제거) 키워드 목록.
// ---------------------------------------------------------------------------
class FeatureVector {
public:
    using ValueMap = std::map<std::string, double, std::less<>>;

    FeatureVector() = default;
    FeatureVector(ValueMap values, std::vector<std::string> matched_keywords);

    // 존재하지 않는 특성은 0.0
    [[nodiscard]] double get(std::string_view name) const noexcept;
    [[nodiscard]] bool   flag(std::string_view name) const noexcept { return get(name) != 0.0; }

    [[nodiscard]] const ValueMap& values() const noexcept { return values_; }
    [[nodiscard]] const std::vector<std::string>& matched_keywords() const noexcept {
        return matched_keywords_;
    }

private:
    ValueMap                 values_{};
    std::vector<std::string> matched_keywords_{};
};

// ---------------------------------------------------------------------------
// FeatureExtractor
//   상태 없음. 여러 스레드에서 동일 인스턴스를 동시에 사용해도 안전하다.
// ---------------------------------------------------------------------------
class FeatureExtractor {
public:
    [[nodiscard]] FeatureVector extract(std::string_view normalized_text) const;

    // 키워드 집합 (설명/테스트용 노출)
    [[nodiscard]] static const std::vector<std::string_view>& high_keywords();
    [[nodiscard]] static const std::vector<std::string_view>& medium_keywords();

    // IPv4 와 함께 나타날 때 인프라 정보로 간주하는 문맥 단어
    [[nodiscard]] static const std::vector<std::string_view>& infra_context_words();
};
