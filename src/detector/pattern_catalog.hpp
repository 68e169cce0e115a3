#pragma once

// ---------------------------------------------------------------------------
// pattern_catalog.hpp
//
// 민감정보 정규식 패턴 카탈로그. FeatureExtractor 와 RedactionEngine 이
// 동일한 패턴 집합을 공유한다.
//
// [탐지 대상 패턴]
//  1. SSN 형태            ddd-dd-dddd
//  2. 카드번호 유사 숫자열 13~19자리 (공백/하이픈 허용)
//  3. 이메일 주소
//  4. 클라우드 액세스 키 ID (AKIA/ASIA + 16자)
//  5. 소스 컨트롤 토큰   (ghp_/gho_)
//  6. Pub/Sub 토큰       (xoxb-/xoxp-/...)
//  7. JWT               (base64url 3 세그먼트)
//  8. PEM 개인키 블록     (-----BEGIN ... PRIVATE KEY----- 부터 END 줄까지)
//  9. key=value / key: value 형태 시크릿 할당 (대소문자 무관, 값 구간만 보고)
// 10. IPv4 주소
//
// [오탐/미탐 트레이드오프]
// - 패턴 2 는 임의의 긴 숫자열(주문번호, 전화번호 묶음)에도 매칭된다.
//   양성 판정 전 luhn_check() 로 구조 검증을 거쳐야 한다.
// - 패턴 1 도 validate_ssn() 검증 전에는 양성으로 취급하지 않는다.
// - 패턴 10 은 버전 문자열(1.2.3.4)에도 매칭된다. 점수는 인프라 문맥
//   키워드와 동시 출현할 때만 가산된다 (RuleScorer 참조).
//
// [스레드 안전성]
// - instance() 는 함수 지역 static 으로 1회 컴파일 후 읽기 전용.
//   boost::regex 의 const 검색은 동시 호출 안전하다.
// - 비재귀 매처를 쓰므로 긴 입력에서도 스택이 넘치지 않는다. 매칭 복잡도
//   한도 초과 시 std::runtime_error 파생 예외를 던진다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class PatternId : std::uint8_t {
    kSsn            = 0,
    kCreditCard     = 1,
    kEmail          = 2,
    kAwsAccessKey   = 3,
    kGithubToken    = 4,
    kSlackToken     = 5,
    kJwt            = 6,
    kSshPrivateKey  = 7,
    kKeyValueSecret = 8,
    kIpv4           = 9,
};

inline constexpr std::size_t kPatternCount = 10;

inline constexpr std::array<PatternId, kPatternCount> kAllPatternIds{
    PatternId::kSsn,          PatternId::kCreditCard,  PatternId::kEmail,
    PatternId::kAwsAccessKey, PatternId::kGithubToken, PatternId::kSlackToken,
    PatternId::kJwt,          PatternId::kSshPrivateKey, PatternId::kKeyValueSecret,
    PatternId::kIpv4,
};

// 설정 파일/정책에서 사용하는 식별자 ("ssn", "credit_card", ...)
[[nodiscard]] std::string_view pattern_key(PatternId id) noexcept;

// 토큰화 시 토큰 접두어로 사용하는 이름 ("SSN", "CC", ...)
[[nodiscard]] std::string_view vault_name(PatternId id) noexcept;

// pattern_key 역변환. "cc_like" 는 "credit_card" 의 별칭으로 허용한다.
[[nodiscard]] std::optional<PatternId> parse_pattern_id(std::string_view key);

// ---------------------------------------------------------------------------
// PatternMatch
//   원문 기준 바이트 오프셋에 묶인 매칭 결과.
//   치환은 반드시 offset/length 기준으로 수행한다 (문자열 검색 치환 금지).
// ---------------------------------------------------------------------------
struct PatternMatch {
    PatternId   id{PatternId::kSsn};
    std::size_t offset{0};
    std::size_t length{0};
    std::string value{};
};

class PatternCatalog {
public:
    [[nodiscard]] static const PatternCatalog& instance();

    ~PatternCatalog();

    PatternCatalog(const PatternCatalog&)            = delete;
    PatternCatalog& operator=(const PatternCatalog&) = delete;

    // 매칭 존재 여부만 확인 (첫 매칭에서 종료)
    [[nodiscard]] bool contains(PatternId id, std::string_view text) const;

    // 겹치지 않는 모든 매칭을 왼쪽부터 반환
    [[nodiscard]] std::vector<PatternMatch> find_all(PatternId id, std::string_view text) const;

private:
    PatternCatalog();

    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
};
