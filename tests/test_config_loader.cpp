// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader 단위 테스트
//
// [테스트 범위]
// - 섹션별 필드 매핑, 누락 필드 기본값
// - 범위 밖 값 → 경고 후 기본값
// - 파일 없음 / YAML 문법 오류
// - 환경변수 우선 (DLPGATE_*)
// - 설정 파일 경로 결정 순서
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "dlpgate_test_config" / info->name();
        fs::create_directories(dir_);
        clear_env();
    }

    void TearDown() override {
        clear_env();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static void clear_env() {
        for (const char* name : {"DLPGATE_CONFIG", "DLPGATE_LOG_LEVEL", "DLPGATE_LOG_PATH",
                                 "DLPGATE_MODEL_PATH", "DLPGATE_POLICY_PATH",
                                 "DLPGATE_BATCH_WORKERS"}) {
            ::unsetenv(name);
        }
    }

    fs::path write_config(const std::string& yaml) const {
        const auto path = dir_ / "dlpgate.yaml";
        std::ofstream out(path);
        out << yaml;
        return path;
    }

    fs::path dir_;
};

TEST_F(ConfigLoaderTest, LoadsAllSections) {
    const auto cfg = ConfigLoader::load(write_config(R"(
global:
  log_level: debug
  log_path: /tmp/x/audit.log
engine:
  strong_confidence: 0.9
  batch_workers: 8
classifier:
  model_path: models/m.yaml
policy:
  policy_path: policies.yaml
  templates: [GDPR, HIPAA]
)"));

    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->log_level, "debug");
    EXPECT_EQ(cfg->log_path, "/tmp/x/audit.log");
    EXPECT_DOUBLE_EQ(cfg->strong_confidence, 0.9);
    EXPECT_EQ(cfg->batch_workers, 8u);
    EXPECT_EQ(cfg->model_path, "models/m.yaml");
    EXPECT_EQ(cfg->policy_path, "policies.yaml");
    ASSERT_EQ(cfg->templates.size(), 2u);
    EXPECT_EQ(cfg->templates[1], "HIPAA");
}

TEST_F(ConfigLoaderTest, MissingFieldsUseDefaults) {
    const auto cfg = ConfigLoader::load(write_config("global:\n  log_level: warn\n"));
    ASSERT_TRUE(cfg.has_value());

    const AppConfig defaults{};
    EXPECT_EQ(cfg->log_level, "warn");
    EXPECT_DOUBLE_EQ(cfg->strong_confidence, defaults.strong_confidence);
    EXPECT_EQ(cfg->batch_workers, defaults.batch_workers);
    EXPECT_TRUE(cfg->model_path.empty());
    EXPECT_TRUE(cfg->templates.empty());
}

TEST_F(ConfigLoaderTest, OutOfRangeValuesReset) {
    const auto cfg = ConfigLoader::load(write_config(R"(
global: {log_level: chatty}
engine: {strong_confidence: 1.5, batch_workers: 0}
)"));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log_level, "info");
    EXPECT_DOUBLE_EQ(cfg->strong_confidence, 0.80);
    EXPECT_EQ(cfg->batch_workers, 4u);
}

TEST_F(ConfigLoaderTest, NonNumericValueFallsBack) {
    const auto cfg = ConfigLoader::load(write_config("engine: {strong_confidence: high}\n"));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->strong_confidence, 0.80);
}

TEST_F(ConfigLoaderTest, MissingFileFails) {
    const auto cfg = ConfigLoader::load(dir_ / "absent.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("not found"), std::string::npos) << cfg.error();
}

TEST_F(ConfigLoaderTest, SyntaxErrorFails) {
    const auto cfg = ConfigLoader::load(write_config("global: [unterminated\n"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("line"), std::string::npos) << cfg.error();
}

TEST_F(ConfigLoaderTest, EmptyFileUsesDefaults) {
    const auto cfg = ConfigLoader::load(write_config(""));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log_level, "info");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    auto cfg = ConfigLoader::load(write_config("global: {log_level: info}\nengine: {batch_workers: 2}\n"));
    ASSERT_TRUE(cfg.has_value());

    ::setenv("DLPGATE_LOG_LEVEL", "error", 1);
    ::setenv("DLPGATE_MODEL_PATH", "/opt/model.yaml", 1);
    ::setenv("DLPGATE_BATCH_WORKERS", "16", 1);
    ConfigLoader::apply_env_overrides(*cfg);

    EXPECT_EQ(cfg->log_level, "error");
    EXPECT_EQ(cfg->model_path, "/opt/model.yaml");
    EXPECT_EQ(cfg->batch_workers, 16u);
}

TEST_F(ConfigLoaderTest, InvalidEnvironmentValueIgnored) {
    AppConfig cfg{};
    ::setenv("DLPGATE_BATCH_WORKERS", "lots", 1);
    ConfigLoader::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.batch_workers, 4u);

    ::setenv("DLPGATE_BATCH_WORKERS", "100000", 1);
    ConfigLoader::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.batch_workers, 4u) << "out-of-range worker count must be reset";
}

TEST_F(ConfigLoaderTest, ResolvePathOrder) {
    EXPECT_EQ(ConfigLoader::resolve_path(""), fs::path{ConfigLoader::kDefaultConfigPath});
    EXPECT_EQ(ConfigLoader::resolve_path("cli.yaml"), fs::path{"cli.yaml"});

    ::setenv("DLPGATE_CONFIG", "env.yaml", 1);
    EXPECT_EQ(ConfigLoader::resolve_path("cli.yaml"), fs::path{"env.yaml"});
}

TEST(ConfigLoaderBundled, RepositoryConfigLoads) {
    const auto cfg = ConfigLoader::load("config/dlpgate.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->model_path, "config/dlp_model.yaml");
    EXPECT_FALSE(cfg->templates.empty());
}
