// ---------------------------------------------------------------------------
// test_policy_loader.cpp
//
// PolicyLoader / parse_policy 단위 테스트
//
// [테스트 범위]
// - 정상 파일 로드 (필드 매핑, 기본값)
// - 항목 하나라도 실패 → 파일 전체 거부 (all-or-nothing)
// - 이름 중복 거부
// - 파일 없음 / YAML 문법 오류 / policies 섹션 없음
// - 필드별 검증 오류 메시지
// - 저장소 기본 정책 파일(config/policies.yaml) 로드
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"
#include "policy/policy_validator.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

class PolicyLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "dlpgate_test_policies" / info->name();
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write_file(const std::string& yaml) const {
        const auto path = dir_ / "policies.yaml";
        std::ofstream out(path);
        out << yaml;
        return path;
    }

    fs::path dir_;
};

TEST_F(PolicyLoaderTest, LoadsPoliciesInFileOrder) {
    const auto path = write_file(R"(
policies:
  - name: PCI
    description: cards
    priority: 10
    rules:
      keywords: [card, Card, payment]
      pattern_ids: [credit_card]
      risk_adjustment: 25
      block_threshold: 50
  - name: Quiet
    enabled: false
    rules:
      risk_adjustment: -5
)");

    const auto loaded = PolicyLoader::load(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    ASSERT_EQ(loaded->size(), 2u);

    const auto& pci = (*loaded)[0];
    EXPECT_EQ(pci.name, "PCI");
    EXPECT_EQ(pci.description, "cards");
    EXPECT_TRUE(pci.enabled);
    EXPECT_EQ(pci.priority, 10);
    EXPECT_EQ(pci.rules.keywords, (std::vector<std::string>{"card", "Card", "payment"}));
    ASSERT_EQ(pci.rules.pattern_ids.size(), 1u);
    EXPECT_EQ(pci.rules.pattern_ids[0], PatternId::kCreditCard);
    EXPECT_EQ(pci.rules.risk_adjustment, 25);
    EXPECT_EQ(pci.rules.block_threshold, 50);

    const auto& quiet = (*loaded)[1];
    EXPECT_FALSE(quiet.enabled);
    EXPECT_EQ(quiet.priority, 0);
    EXPECT_EQ(quiet.rules.risk_adjustment, -5);
    EXPECT_FALSE(quiet.rules.block_threshold.has_value());
}

TEST_F(PolicyLoaderTest, OneInvalidEntryRejectsWholeFile) {
    const auto path = write_file(R"(
policies:
  - name: Good
    rules: {risk_adjustment: 5}
  - name: Bad
    rules: {risk_adjustment: 500}
)");

    const auto loaded = PolicyLoader::load(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("policies[1]"), std::string::npos) << loaded.error();
    EXPECT_NE(loaded.error().find("Risk adjustment"), std::string::npos) << loaded.error();
}

TEST_F(PolicyLoaderTest, DuplicateNamesRejected) {
    const auto path = write_file(R"(
policies:
  - name: Same
    rules: {}
  - name: Same
    rules: {}
)");

    const auto loaded = PolicyLoader::load(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("duplicate"), std::string::npos) << loaded.error();
}

TEST_F(PolicyLoaderTest, MissingFileFails) {
    EXPECT_FALSE(PolicyLoader::load(dir_ / "nope.yaml").has_value());
}

TEST_F(PolicyLoaderTest, SyntaxErrorReportsLine) {
    const auto path = write_file("policies:\n  - name: [unterminated\n");
    const auto loaded = PolicyLoader::load(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("line"), std::string::npos) << loaded.error();
}

TEST_F(PolicyLoaderTest, MissingSectionIsEmptyList) {
    const auto loaded = PolicyLoader::load(write_file("other: 1\n"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->empty());
}

TEST_F(PolicyLoaderTest, PoliciesMustBeSequence) {
    EXPECT_FALSE(PolicyLoader::load(write_file("policies: {name: x}\n")).has_value());
}

TEST(PolicyLoaderBundled, RepositoryPolicyFileLoads) {
    const auto loaded = PolicyLoader::load("config/policies.yaml");
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_FALSE(loaded->empty());
}

// ---------------------------------------------------------------------------
// parse_policy 필드 검증
// ---------------------------------------------------------------------------
TEST(PolicyParse, MissingNameRejected) {
    const auto parsed = parse_policy(YAML::Load("{rules: {}}"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, PolicyErrorCode::kMissingName);
    EXPECT_EQ(parsed.error().message, "Policy name is required");
}

TEST(PolicyParse, MissingRulesRejected) {
    const auto parsed = parse_policy(YAML::Load("{name: X}"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, PolicyErrorCode::kMissingRules);
    EXPECT_EQ(parsed.error().field, "rules");
}

TEST(PolicyParse, NonIntegerPriorityRejected) {
    const auto parsed = parse_policy(YAML::Load("{name: X, priority: high, rules: {}}"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().message, "Priority must be an integer");
}

TEST(PolicyParse, NonBooleanEnabledRejected) {
    const auto parsed = parse_policy(YAML::Load("{name: X, enabled: maybe, rules: {}}"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, PolicyErrorCode::kInvalidField);
    EXPECT_EQ(parsed.error().field, "enabled");
    EXPECT_EQ(parsed.error().message, "Enabled must be a boolean");
}

TEST(PolicyParse, EnabledDefaultsToTrue) {
    const auto on = parse_policy(YAML::Load("{name: X, rules: {}}"));
    ASSERT_TRUE(on.has_value());
    EXPECT_TRUE(on->enabled);

    const auto off = parse_policy(YAML::Load("{name: X, enabled: false, rules: {}}"));
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(off->enabled);
}

TEST(PolicyParse, ThresholdOutOfRangeRejected) {
    const auto parsed = parse_policy(YAML::Load("{name: X, rules: {block_threshold: 101}}"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().field, "rules.block_threshold");
}

TEST(PolicyParse, UnknownPatternIdRejected) {
    const auto parsed = parse_policy(YAML::Load("{name: X, rules: {pattern_ids: [phone]}}"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().message, "Unknown pattern id 'phone'");
}

TEST(PolicyParse, DuplicateKeywordsCollapsed) {
    const auto parsed = parse_policy(YAML::Load("{name: X, rules: {keywords: [a, b, a]}}"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->rules.keywords, (std::vector<std::string>{"a", "b"}));
}
