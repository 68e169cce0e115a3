#include "classifier/classifier_loader.hpp"
#include "config/config_loader.hpp"
#include "engine/dlp_engine.hpp"
#include "engine/json_writer.hpp"
#include "logger/structured_logger.hpp"
#include "policy/compliance_templates.hpp"
#include "policy/policy_loader.hpp"
#include "policy/policy_store.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// dlpgate CLI
//
//   dlpgate [--config <path>] analyze [text]          (text 생략 시 stdin)
//   dlpgate [--config <path>] batch <file>            (한 줄 = 텍스트 하나)
//   dlpgate [--config <path>] redact <mode> [text] [--placeholder P] [--show-last N]
//   dlpgate [--config <path>] policies
//   dlpgate [--config <path>] modes
//
// 결과 JSON 은 stdout, 진단/감사 로그는 stderr (및 설정된 로그 파일).
// 종료 코드: 0 성공, 1 분석/검증 실패, 2 사용법 오류
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct CliArgs {
    std::string              config_path{};
    std::string              command{};
    std::vector<std::string> positional{};
    std::optional<std::string> placeholder{};
    std::optional<int>         show_last{};
};

void print_usage() {
    std::cerr <<
        "usage: dlpgate [--config <path>] <command> [args]\n"
        "  analyze [text]                      analyze text (stdin when omitted)\n"
        "  batch <file>                        analyze each line of <file>\n"
        "  redact <mode> [text] [--placeholder P] [--show-last N]\n"
        "  policies                            list loaded policies\n"
        "  modes                               list redaction modes\n";
}

[[nodiscard]] std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args{};
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--placeholder" && has_value) {
            args.placeholder = argv[++i];
        } else if (arg == "--show-last" && has_value) {
            const std::string_view value{argv[++i]};
            int parsed = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                spdlog::error("main: --show-last expects an integer, got '{}'", value);
                return std::nullopt;
            }
            args.show_last = parsed;
        } else if (arg.starts_with("--")) {
            spdlog::error("main: unknown option '{}'", arg);
            return std::nullopt;
        } else if (args.command.empty()) {
            args.command = std::string(arg);
        } else {
            args.positional.emplace_back(arg);
        }
    }
    if (args.command.empty()) {
        return std::nullopt;
    }
    return args;
}

[[nodiscard]] std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

// ---------------------------------------------------------------------------
// 정책 스토어 구성: 템플릿 → 정책 파일 순서로 등록.
// 개별 정책 등록 실패는 경고 후 건너뛴다 (나머지 정책으로 기동).
// ---------------------------------------------------------------------------
void populate_policies(const AppConfig& cfg, PolicyStore& store) {
    for (const auto& key : cfg.templates) {
        auto tmpl = compliance_template(key);
        if (!tmpl) {
            spdlog::warn("main: unknown compliance template '{}', skipped", key);
            continue;
        }
        if (auto created = store.create(std::move(*tmpl)); !created) {
            spdlog::warn("main: template '{}' rejected: {}", key, created.error().message);
        }
    }

    if (cfg.policy_path.empty()) {
        return;
    }
    auto loaded = PolicyLoader::load(cfg.policy_path);
    if (!loaded) {
        spdlog::warn("main: policy file not applied: {}", loaded.error());
        return;
    }
    for (auto& policy : *loaded) {
        const std::string name = policy.name;
        if (auto created = store.create(std::move(policy)); !created) {
            spdlog::warn("main: policy '{}' rejected: {}", name, created.error().message);
        }
    }
}

[[nodiscard]] int run_analyze(const DlpEngine& engine, const PolicyStore& store, const CliArgs& args) {
    const std::string text = args.positional.empty() ? read_stdin() : args.positional.front();
    const auto policies = store.snapshot();

    const auto decision = engine.analyze(text, *policies);
    if (!decision) {
        std::cout << to_json(decision.error()) << '\n';
        return kExitError;
    }
    std::cout << to_json(*decision) << '\n';
    return kExitOk;
}

[[nodiscard]] int run_batch(const DlpEngine& engine, const PolicyStore& store, const CliArgs& args) {
    if (args.positional.empty()) {
        spdlog::error("main: batch requires an input file");
        return kExitUsage;
    }
    std::ifstream in(args.positional.front(), std::ios::binary);
    if (!in) {
        spdlog::error("main: cannot open batch file '{}'", args.positional.front());
        return kExitError;
    }

    std::vector<std::string> texts;
    for (std::string line; std::getline(in, line);) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        texts.push_back(std::move(line));
    }

    const auto policies = store.snapshot();
    std::cout << to_json(engine.analyze_batch(texts, *policies)) << '\n';
    return kExitOk;
}

[[nodiscard]] int run_redact(const DlpEngine& engine, const CliArgs& args) {
    if (args.positional.empty()) {
        spdlog::error("main: redact requires a mode");
        return kExitUsage;
    }
    const std::string& mode = args.positional.front();
    const std::string text  = args.positional.size() > 1 ? args.positional[1] : read_stdin();

    RedactionParams params{};
    if (args.placeholder) {
        params.placeholder = *args.placeholder;
    }
    if (args.show_last) {
        params.show_last = *args.show_last;
    }

    const auto result = engine.redact(text, mode, params);
    if (!result) {
        std::cout << to_json(result.error()) << '\n';
        return kExitError;
    }
    std::cout << to_json(*result) << '\n';
    return kExitOk;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    // stdout 은 JSON 결과 전용
    spdlog::set_default_logger(spdlog::stderr_color_mt("dlpgate_diag"));

    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return kExitUsage;
    }

    try {
        // ── 설정 로드 (환경변수 우선, 파일, 기본값 fallback) ────────────
        const auto config_path = ConfigLoader::resolve_path(args->config_path);
        AppConfig cfg{};
        if (std::filesystem::exists(config_path)) {
            auto loaded = ConfigLoader::load(config_path);
            if (!loaded) {
                std::cerr << loaded.error() << '\n';
                return kExitError;
            }
            cfg = std::move(*loaded);
        } else {
            spdlog::warn("main: config '{}' not found, using defaults", config_path.string());
        }
        ConfigLoader::apply_env_overrides(cfg);

        // ── 로깅 초기화 ─────────────────────────────────────────────────
        const LogLevel level = parse_log_level(cfg.log_level).value_or(LogLevel::kInfo);
        spdlog::set_level(level == LogLevel::kDebug ? spdlog::level::debug
                        : level == LogLevel::kWarn  ? spdlog::level::warn
                        : level == LogLevel::kError ? spdlog::level::err
                                                    : spdlog::level::info);
        auto logger = std::make_shared<StructuredLogger>(level, cfg.log_path);

        if (args->command == "modes") {
            std::cout << modes_to_json() << '\n';
            return kExitOk;
        }

        // ── 정책 / 분류기 / 엔진 ────────────────────────────────────────
        PolicyStore store;
        populate_policies(cfg, store);

        if (args->command == "policies") {
            std::cout << policies_to_json(store.list()) << '\n';
            return kExitOk;
        }

        const std::optional<std::filesystem::path> model_path =
            cfg.model_path.empty() ? std::nullopt
                                   : std::optional<std::filesystem::path>{cfg.model_path};
        auto classifier = ClassifierLoader::load_or_null(model_path);

        const DlpEngine engine{std::move(classifier),
                               EngineOptions{cfg.strong_confidence, cfg.batch_workers},
                               logger};

        int rc = kExitUsage;
        if (args->command == "analyze") {
            rc = run_analyze(engine, store, *args);
        } else if (args->command == "batch") {
            rc = run_batch(engine, store, *args);
        } else if (args->command == "redact") {
            rc = run_redact(engine, *args);
        } else {
            spdlog::error("main: unknown command '{}'", args->command);
            print_usage();
        }
        logger->flush();
        return rc;

    } catch (const std::exception& e) {
        spdlog::critical("main: fatal error: {}", e.what());
        return kExitError;
    }
}
