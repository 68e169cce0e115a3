#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// 애플리케이션 설정(config/dlpgate.yaml) 로더.
//
// [파일 형식]
//   global:
//     log_level: info            # debug | info | warn | error
//     log_path: /tmp/dlpgate.log # 빈 문자열이면 파일 로그 생략
//   engine:
//     strong_confidence: 0.80    # [0, 1]
//     batch_workers: 4           # [1, 256]
//   classifier:
//     model_path: config/dlp_model.yaml
//   policy:
//     policy_path: config/policies.yaml
//     templates: [GDPR, PCI_DSS]
//
// [우선순위]
//   환경변수 > 설정 파일 > 구조체 기본값
//   DLPGATE_CONFIG, DLPGATE_LOG_LEVEL, DLPGATE_LOG_PATH, DLPGATE_MODEL_PATH,
//   DLPGATE_POLICY_PATH, DLPGATE_BATCH_WORKERS
//
// [실패 처리]
// - 파일 없음/YAML 파싱 오류 → std::unexpected(message)
// - 범위를 벗어난 값 → warn 로그 후 기본값 (기동을 막지 않는다)
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

struct AppConfig {
    // global
    std::string log_level{"info"};
    std::string log_path{};

    // engine
    double      strong_confidence{0.80};
    std::size_t batch_workers{4};

    // classifier
    std::string model_path{};

    // policy
    std::string              policy_path{};
    std::vector<std::string> templates{};
};

class ConfigLoader {
public:
    inline static constexpr const char* kDefaultConfigPath = "config/dlpgate.yaml";
    inline static constexpr std::size_t kMaxBatchWorkers   = 256;

    [[nodiscard]] static std::expected<AppConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 환경변수 값을 cfg 에 덮어쓴다 (DLPGATE_CONFIG 제외).
    static void apply_env_overrides(AppConfig& cfg);

    // 설정 파일 경로 결정: DLPGATE_CONFIG > 인자 > kDefaultConfigPath
    [[nodiscard]] static std::filesystem::path resolve_path(const std::string& cli_path);
};
