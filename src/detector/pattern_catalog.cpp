// ---------------------------------------------------------------------------
// pattern_catalog.cpp
//
// [CompiledPattern 구현 주의사항]
// 헤더에서 CompiledPattern 을 전방 선언만 하므로 boost::regex 는
// shared_ptr 로 보관하고, PatternCatalog 소멸자는 이 파일에서 정의한다.
//
// [정규식 엔진]
// boost::regex (perl 문법). 비재귀 매처라 입력 길이에 비례해 스택이
// 늘지 않는다. 매칭 복잡도 한도를 넘으면 std::runtime_error 파생 예외를
// 던지며, 호출 경계(DlpEngine::analyze)에서 kInternalError 로 변환된다.
//
// [컴파일 실패 처리]
// 내장 패턴이 컴파일에 실패하면 에러 로그 후 해당 패턴을 비활성화한다.
// 나머지 패턴은 계속 적용된다.
// 비활성 패턴은 contains()=false, find_all()=빈 목록을 반환한다 (false negative).
// ---------------------------------------------------------------------------

#include "detector/pattern_catalog.hpp"

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

struct PatternCatalog::CompiledPattern {
    PatternId                     id{PatternId::kSsn};
    std::string                   source_pattern{};
    int                           report_group{0};
    std::shared_ptr<boost::regex> compiled{};
};

namespace {

struct PatternSource {
    PatternId               id;
    const char*             regex;
    boost::regex::flag_type flags;
    int                     report_group;  // find_all 이 보고하는 캡처 그룹 (0 = 전체 매칭)
};

constexpr boost::regex::flag_type kDefaultFlags = boost::regex::perl;
constexpr boost::regex::flag_type kIcaseFlags   = boost::regex::perl | boost::regex::icase;

// kAllPatternIds 와 같은 순서 (인덱스 = PatternId 값)
//
// PEM: BEGIN 헤더부터 같은 종류의 END 줄까지. END 가 없으면 입력 끝까지.
// key=value: 키 이름은 남기고 값(그룹 1)만 보고한다.
const std::array<PatternSource, kPatternCount> kPatternSources{{
    {PatternId::kSsn,            R"(\b\d{3}-\d{2}-\d{4}\b)", kDefaultFlags, 0},
    {PatternId::kCreditCard,     R"(\b(?:\d[ -]*?){13,19}\b)", kDefaultFlags, 0},
    {PatternId::kEmail,          R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", kDefaultFlags, 0},
    {PatternId::kAwsAccessKey,   R"(\b(?:AKIA|ASIA)[A-Z0-9]{16}\b)", kDefaultFlags, 0},
    {PatternId::kGithubToken,    R"(\bghp_[A-Za-z0-9]{20,}\b|\bgho_[A-Za-z0-9]{20,}\b)", kDefaultFlags, 0},
    {PatternId::kSlackToken,     R"(\bxox[baprs]-[0-9A-Za-z-]{10,}\b)", kDefaultFlags, 0},
    {PatternId::kJwt,            R"(\beyJ[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\b)", kDefaultFlags, 0},
    {PatternId::kSshPrivateKey,  R"(-----BEGIN (OPENSSH|RSA|DSA|EC) PRIVATE KEY-----(?:[\s\S]*?-----END \1 PRIVATE KEY-----|[\s\S]*))", kDefaultFlags, 0},
    {PatternId::kKeyValueSecret, R"(\b(?:api[_-]?key|secret|token|password|pass|client_secret)\s*[:=]\s*([^\s,;]{6,}))", kIcaseFlags, 1},
    {PatternId::kIpv4,           R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", kDefaultFlags, 0},
}};

}  // namespace

std::string_view pattern_key(PatternId id) noexcept {
    switch (id) {
        case PatternId::kSsn:            return "ssn";
        case PatternId::kCreditCard:     return "credit_card";
        case PatternId::kEmail:          return "email";
        case PatternId::kAwsAccessKey:   return "aws_access_key";
        case PatternId::kGithubToken:    return "github_token";
        case PatternId::kSlackToken:     return "slack_token";
        case PatternId::kJwt:            return "jwt";
        case PatternId::kSshPrivateKey:  return "ssh_private_key";
        case PatternId::kKeyValueSecret: return "key_value_secret";
        case PatternId::kIpv4:           return "ipv4";
        default:                         return "unknown";
    }
}

std::string_view vault_name(PatternId id) noexcept {
    switch (id) {
        case PatternId::kSsn:            return "SSN";
        case PatternId::kCreditCard:     return "CC";
        case PatternId::kEmail:          return "EMAIL";
        case PatternId::kAwsAccessKey:   return "AWS_KEY";
        case PatternId::kGithubToken:    return "GH_TOKEN";
        case PatternId::kSlackToken:     return "SLACK_TOKEN";
        case PatternId::kJwt:            return "JWT";
        case PatternId::kSshPrivateKey:  return "SSH_KEY";
        case PatternId::kKeyValueSecret: return "SECRET";
        case PatternId::kIpv4:           return "IP";
        default:                         return "UNKNOWN";
    }
}

std::optional<PatternId> parse_pattern_id(std::string_view key) {
    if (key == "cc_like") {
        return PatternId::kCreditCard;
    }
    for (const auto id : kAllPatternIds) {
        if (pattern_key(id) == key) {
            return id;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PatternCatalog
// ---------------------------------------------------------------------------
PatternCatalog::PatternCatalog() {
    compiled_patterns_.reserve(kPatternSources.size());

    for (const auto& src : kPatternSources) {
        CompiledPattern cp{};
        cp.id             = src.id;
        cp.source_pattern = src.regex;
        cp.report_group   = src.report_group;
        try {
            cp.compiled = std::make_shared<boost::regex>(src.regex, src.flags);
        } catch (const boost::regex_error& e) {
            spdlog::error("pattern_catalog: cannot compile pattern '{}' ({}), disabled: {}",
                          pattern_key(src.id), src.regex, e.what());
        }
        compiled_patterns_.push_back(std::move(cp));
    }
}

PatternCatalog::~PatternCatalog() = default;

const PatternCatalog& PatternCatalog::instance() {
    static const PatternCatalog catalog;
    return catalog;
}

bool PatternCatalog::contains(PatternId id, std::string_view text) const {
    const auto& cp = compiled_patterns_[static_cast<std::size_t>(id)];
    if (!cp.compiled) {
        return false;
    }
    return boost::regex_search(text.begin(), text.end(), *cp.compiled);
}

std::vector<PatternMatch> PatternCatalog::find_all(PatternId id, std::string_view text) const {
    std::vector<PatternMatch> matches;

    const auto& cp = compiled_patterns_[static_cast<std::size_t>(id)];
    if (!cp.compiled) {
        return matches;
    }

    const int group = cp.report_group;
    using Iterator = boost::regex_iterator<std::string_view::const_iterator>;
    const Iterator end{};
    for (Iterator it(text.begin(), text.end(), *cp.compiled); it != end; ++it) {
        const auto& m = *it;
        if (!m[group].matched || m.length(group) == 0) {
            continue;
        }
        matches.push_back(PatternMatch{
            id,
            static_cast<std::size_t>(m.position(group)),
            static_cast<std::size_t>(m.length(group)),
            m.str(group),
        });
    }
    return matches;
}
