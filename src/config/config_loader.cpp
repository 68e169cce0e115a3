// ---------------------------------------------------------------------------
// config_loader.cpp
//
// [설계 원칙]
// - 섹션별 try-catch 로 yaml-cpp 예외를 오류 메시지로 변환한다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 설정 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include "logger/log_types.hpp"  // parse_log_level

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 스칼라 읽기. 없거나 형식이 다르면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] double read_double(const YAML::Node& node, double fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: '{}' is not a number, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] long read_long(const YAML::Node& node, long fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<long>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: '{}' is not an integer, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::size_t env_size(const char* name, std::size_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    const std::string_view sv{val};
    std::size_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
    return parsed;
}

// 범위 검증: 벗어나면 경고 후 기본값
void sanitize(AppConfig& cfg) {
    const AppConfig defaults{};

    if (!parse_log_level(cfg.log_level)) {
        spdlog::warn("config_loader: unknown log_level '{}', using '{}'",
                     cfg.log_level, defaults.log_level);
        cfg.log_level = defaults.log_level;
    }
    if (!(cfg.strong_confidence >= 0.0 && cfg.strong_confidence <= 1.0)) {
        spdlog::warn("config_loader: engine.strong_confidence {} out of range [0,1], using {}",
                     cfg.strong_confidence, defaults.strong_confidence);
        cfg.strong_confidence = defaults.strong_confidence;
    }
    if (cfg.batch_workers < 1 || cfg.batch_workers > ConfigLoader::kMaxBatchWorkers) {
        spdlog::warn("config_loader: engine.batch_workers {} out of range [1,{}], using {}",
                     cfg.batch_workers, ConfigLoader::kMaxBatchWorkers, defaults.batch_workers);
        cfg.batch_workers = defaults.batch_workers;
    }
}

}  // namespace

std::expected<AppConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        const std::string err = fmt::format("config_loader: config file '{}' not found",
                                            config_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            config_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error in '{}': {}",
                                            config_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    AppConfig cfg{};
    if (!root || root.IsNull()) {
        spdlog::warn("config_loader: '{}' is empty, using defaults", config_path.string());
        return cfg;
    }
    if (!root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", config_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        const YAML::Node global = root["global"];
        if (global && global.IsMap()) {
            cfg.log_level = read_string(global["log_level"], cfg.log_level);
            cfg.log_path  = read_string(global["log_path"], cfg.log_path);
        }

        const YAML::Node engine = root["engine"];
        if (engine && engine.IsMap()) {
            cfg.strong_confidence = read_double(engine["strong_confidence"], cfg.strong_confidence);
            const long workers = read_long(engine["batch_workers"],
                                           static_cast<long>(cfg.batch_workers));
            cfg.batch_workers = workers < 0 ? 0 : static_cast<std::size_t>(workers);
        }

        const YAML::Node classifier = root["classifier"];
        if (classifier && classifier.IsMap()) {
            cfg.model_path = read_string(classifier["model_path"], cfg.model_path);
        }

        const YAML::Node policy = root["policy"];
        if (policy && policy.IsMap()) {
            cfg.policy_path = read_string(policy["policy_path"], cfg.policy_path);
            cfg.templates   = read_string_sequence(policy["templates"]);
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: error parsing '{}': {}",
                                            config_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    sanitize(cfg);
    spdlog::info("config_loader: loaded '{}'", config_path.string());
    return cfg;
}

void ConfigLoader::apply_env_overrides(AppConfig& cfg) {
    cfg.log_level     = env_str("DLPGATE_LOG_LEVEL",   cfg.log_level);
    cfg.log_path      = env_str("DLPGATE_LOG_PATH",    cfg.log_path);
    cfg.model_path    = env_str("DLPGATE_MODEL_PATH",  cfg.model_path);
    cfg.policy_path   = env_str("DLPGATE_POLICY_PATH", cfg.policy_path);
    cfg.batch_workers = env_size("DLPGATE_BATCH_WORKERS", cfg.batch_workers);
    sanitize(cfg);
}

std::filesystem::path ConfigLoader::resolve_path(const std::string& cli_path) {
    const std::string fallback = cli_path.empty() ? std::string{kDefaultConfigPath} : cli_path;
    return env_str("DLPGATE_CONFIG", fallback);
}
