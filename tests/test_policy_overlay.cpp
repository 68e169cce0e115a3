// ---------------------------------------------------------------------------
// test_policy_overlay.cpp
//
// PolicyOverlay 및 컴플라이언스 템플릿 단위 테스트
//
// [테스트 범위]
// - 비활성 정책 무시
// - priority 내림차순, 동순위는 입력 순서 유지
// - 양수/음수 risk_adjustment, [0,100] clamp
// - block_threshold 도달 시 차단 튜플
// - 키워드 매칭: 대소문자 무시, 설정 순서대로 이유 문자열에 나열
// - compliance_template 조회 (대소문자 무시)
// ---------------------------------------------------------------------------

#include "policy/compliance_templates.hpp"
#include "policy/policy_overlay.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

Decision decision_with(int score, const std::string& input) {
    Decision d{};
    apply_tier(d, tier_for_score(score));
    d.risk_score = score;
    d.reasons    = {"rule reason"};
    d.input      = input;
    return d;
}

Policy make_policy(const std::string& name, int priority, int adjustment,
                   std::optional<int> threshold = std::nullopt,
                   std::vector<std::string> keywords = {}) {
    return create_custom_policy(name, "", std::move(keywords), {}, adjustment, threshold, priority);
}

}  // namespace

TEST(PolicyOverlay, NoPoliciesIsIdentity) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(40, "text"), {});
    EXPECT_EQ(d.risk_score, 40);
    EXPECT_EQ(d.reasons.size(), 1u);
}

TEST(PolicyOverlay, DisabledPolicySkipped) {
    auto p = make_policy("Off", 5, 50, 10);
    p.enabled = false;

    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(40, "text"), {p});
    EXPECT_EQ(d.risk_score, 40);
    EXPECT_EQ(d.action, Action::kLog);
}

TEST(PolicyOverlay, PositiveAdjustmentWithReason) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(40, "text"), {make_policy("Boost", 1, 15)});

    EXPECT_EQ(d.risk_score, 55);
    EXPECT_EQ(d.reasons.back(), "Policy 'Boost': +15 risk adjustment");
    // 점수 조정만으로는 티어를 다시 매기지 않는다
    EXPECT_EQ(d.risk_level, RiskLevel::kMedium);
}

TEST(PolicyOverlay, NegativeAdjustmentClampedAtZero) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(10, "text"), {make_policy("Relax", 1, -30)});

    EXPECT_EQ(d.risk_score, 0);
    EXPECT_EQ(d.reasons.back(), "Policy 'Relax': -30 risk adjustment");
}

TEST(PolicyOverlay, AdjustmentClampedAt100) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(95, "text"), {make_policy("Max", 1, 20)});
    EXPECT_EQ(d.risk_score, 100);
}

TEST(PolicyOverlay, BlockThresholdForcesBlock) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(45, "text"), {make_policy("PCI", 10, 10, 50)});

    EXPECT_EQ(d.risk_score, 55);
    EXPECT_EQ(d.risk_level, RiskLevel::kHigh);
    EXPECT_EQ(d.action, Action::kBlock);
    EXPECT_EQ(d.classification, Classification::kHighlyConfidential);
    EXPECT_EQ(d.reasons.back(), "Policy 'PCI': Block threshold (50) exceeded");
}

TEST(PolicyOverlay, BlockThresholdNotReached) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(30, "text"), {make_policy("Strict", 10, 0, 31)});
    EXPECT_EQ(d.action, Action::kLog);
    EXPECT_EQ(d.reasons.size(), 1u) << "zero adjustment must not add a reason";
}

TEST(PolicyOverlay, KeywordsMatchedCaseInsensitively) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(
        decision_with(10, "Patient DIAGNOSIS attached"),
        {make_policy("HIPAA", 1, 0, std::nullopt, {"treatment", "diagnosis", "patient"})});

    EXPECT_EQ(d.reasons.back(), "Policy 'HIPAA': Matched keywords: diagnosis, patient");
    EXPECT_EQ(d.risk_score, 10) << "keyword matches are informational";
}

TEST(PolicyOverlay, PriorityOrderWithStableTies) {
    const PolicyOverlay overlay;
    const std::vector<Policy> policies{
        make_policy("Low", 1, 1),
        make_policy("TieA", 5, 2),
        make_policy("High", 9, 3),
        make_policy("TieB", 5, 4),
    };
    const auto d = overlay.apply(decision_with(0, "text"), policies);

    ASSERT_EQ(d.reasons.size(), 5u);
    EXPECT_EQ(d.reasons[1], "Policy 'High': +3 risk adjustment");
    EXPECT_EQ(d.reasons[2], "Policy 'TieA': +2 risk adjustment");
    EXPECT_EQ(d.reasons[3], "Policy 'TieB': +4 risk adjustment");
    EXPECT_EQ(d.reasons[4], "Policy 'Low': +1 risk adjustment");
    EXPECT_EQ(d.risk_score, 10);
}

TEST(PolicyOverlay, ThresholdSeesEarlierAdjustments) {
    const PolicyOverlay overlay;
    const std::vector<Policy> policies{
        make_policy("Gate", 1, 0, 60),
        make_policy("Boost", 10, 20),
    };
    const auto d = overlay.apply(decision_with(45, "text"), policies);
    EXPECT_EQ(d.risk_score, 65);
    EXPECT_EQ(d.action, Action::kBlock);
}

TEST(PolicyOverlay, NegativeAdjustmentDoesNotRetier) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(80, "text"), {make_policy("Relax", 1, -50)});
    EXPECT_EQ(d.risk_score, 30);
    EXPECT_EQ(d.action, Action::kBlock);
}

// ---------------------------------------------------------------------------
// 컴플라이언스 템플릿
// ---------------------------------------------------------------------------
TEST(ComplianceTemplates, FourTemplatesAvailable) {
    const auto& all = compliance_templates();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].first, "GDPR");
    EXPECT_EQ(all[2].second.name, "PCI-DSS Compliance");
}

TEST(ComplianceTemplates, LookupIsCaseInsensitive) {
    const auto pci = compliance_template("pci_dss");
    ASSERT_TRUE(pci.has_value());
    EXPECT_EQ(pci->rules.risk_adjustment, 25);
    EXPECT_EQ(pci->rules.block_threshold, 50);
    EXPECT_EQ(pci->priority, 10);

    EXPECT_FALSE(compliance_template("iso27001").has_value());
}

TEST(ComplianceTemplates, PciTemplateBlocksCardMention) {
    const PolicyOverlay overlay;
    const auto d = overlay.apply(decision_with(45, "card 4532015112830366"),
                                 {*compliance_template("PCI_DSS")});
    EXPECT_EQ(d.risk_score, 70);
    EXPECT_EQ(d.action, Action::kBlock);
    EXPECT_EQ(d.reasons.back(), "Policy 'PCI-DSS Compliance': Matched keywords: card");
}

TEST(ComplianceTemplates, CustomPolicyDefaults) {
    const auto p = create_custom_policy("Custom");
    EXPECT_TRUE(p.enabled);
    EXPECT_EQ(p.priority, 5);
    EXPECT_EQ(p.rules.block_threshold, 70);
    EXPECT_EQ(p.rules.risk_adjustment, 0);
}
