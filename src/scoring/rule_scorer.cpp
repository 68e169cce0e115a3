// ---------------------------------------------------------------------------
// rule_scorer.cpp
// ---------------------------------------------------------------------------

#include "scoring/rule_scorer.hpp"

#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

RuleDecision RuleScorer::score(const FeatureVector& features) const {
    std::vector<std::string> reasons;
    int score = 0;

    const auto high_count = static_cast<int>(features.get(feature::kKeywordHighCount));
    const auto med_count  = static_cast<int>(features.get(feature::kKeywordMedCount));
    const auto& matched   = features.matched_keywords();

    if (high_count > 0) {
        score += 35 + 10 * high_count;
        reasons.push_back(fmt::format("High-risk keyword(s): {}", fmt::join(matched, ", ")));
    } else if (med_count > 0) {
        score += 15 + 5 * med_count;
        reasons.push_back(fmt::format("Sensitive keyword(s): {}", fmt::join(matched, ", ")));
    }

    if (features.flag(feature::kHasSshPrivateKey)) {
        score += 80;
        reasons.emplace_back("SSH private key marker detected");
    }
    if (features.flag(feature::kHasAwsAccessKey)) {
        score += 70;
        reasons.emplace_back("AWS access key format detected");
    }
    if (features.flag(feature::kHasGithubToken) || features.flag(feature::kHasSlackToken)
        || features.flag(feature::kHasJwt) || features.flag(feature::kHasKeyValueSecret)) {
        score += 55;
        reasons.emplace_back("Token/secret pattern detected");
    }
    if (features.flag(feature::kHasSsn)) {
        score += 60;
        reasons.emplace_back("SSN pattern detected");
    }
    if (features.flag(feature::kHasCcLike)) {
        score += 45;
        reasons.emplace_back("Card-like number pattern detected");
    }
    if (features.flag(feature::kHasEmail)) {
        score += 10;
        reasons.emplace_back("Email address detected");
    }

    // 내부 IP 는 인프라 문맥 단어와 함께 나타날 때만 가산
    if (features.flag(feature::kHasIpv4) && features.flag(feature::kHasInfraContext)) {
        score += 20;
        reasons.emplace_back("Internal infrastructure info (IP + context) detected");
    }

    // 알려진 형식이 없는 시크릿
    if (features.get(feature::kMaxChunkEntropy) >= kEntropyThreshold
        && features.get(feature::kMaxTokenLen) >= kLongTokenThreshold) {
        score += 25;
        reasons.emplace_back("High-entropy long token detected (possible secret)");
    }

    if (features.get(feature::kTextLen) >= kLongTextThreshold) {
        score += 5;
        reasons.emplace_back("Long message (higher exfil surface)");
    }

    score = clamp_score(score);
    const auto tier = tier_for_score(score);

    if (reasons.empty()) {
        reasons.emplace_back("No sensitive patterns detected");
    }

    return RuleDecision{
        .classification = tier.classification,
        .risk_level     = tier.risk_level,
        .action         = tier.action,
        .risk_score     = score,
        .reasons        = std::move(reasons),
    };
}
