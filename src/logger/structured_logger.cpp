// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/json_util.hpp"
#include "normalizer/text_normalizer.hpp"  // ascii_lower

#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::info;
    }
}

void write_reasons(std::ostringstream& json, const std::vector<std::string>& reasons) {
    json << '[';
    for (std::size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(reasons[i]) << '"';
    }
    json << ']';
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    const std::string lowered = ascii_lower(name);
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Stderr sink
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (!log_path_.empty()) {
            // 로그 디렉터리 생성
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }

            // Rotating file sink (100MB, 3개 파일 유지)
            const std::size_t max_file_size = 100 * 1024 * 1024;  // 100MB
            const std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        // 레지스트리에 등록하지 않는다 (테스트에서 여러 인스턴스 공존)
        logger_ = std::make_shared<spdlog::logger>("dlpgate", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 경보는 즉시 파일에 반영
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() = default;

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// JSON 직렬화
// ---------------------------------------------------------------------------
std::string StructuredLogger::to_json(const DecisionLog& entry) {
    std::ostringstream json;
    json << R"({"event":"dlp_decision","classification":")" << to_string(entry.classification)
         << R"(","risk_level":")" << to_string(entry.risk_level)
         << R"(","action":")" << to_string(entry.action)
         << R"(","risk_score":)" << entry.risk_score << R"(,"reasons":)";
    write_reasons(json, entry.reasons);
    json << R"(,"input":")" << escape_json_string(entry.redacted_input)
         << R"(","ml_assisted":)" << (entry.ml_assisted ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';
    return json.str();
}

std::string StructuredLogger::to_json(const AlertLog& entry) {
    std::ostringstream json;
    json << R"({"event":"dlp_alert","classification":")" << to_string(entry.classification)
         << R"(","risk_score":)" << entry.risk_score << R"(,"reasons":)";
    write_reasons(json, entry.reasons);
    json << R"(,"input":")" << escape_json_string(entry.redacted_input)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    return json.str();
}

std::string StructuredLogger::to_json(const RedactionLog& entry) {
    std::ostringstream json;
    json << R"({"event":"redaction","mode":")" << escape_json_string(entry.mode)
         << R"(","input_length":)" << entry.input_length
         << R"(,"output_length":)" << entry.output_length
         << R"(,"token_count":)" << entry.token_count
         << R"(,"reversible":)" << (entry.reversible ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    return json.str();
}

void StructuredLogger::log_decision(const DecisionLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }
    logger_->info(to_json(entry));
}

void StructuredLogger::log_alert(const AlertLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }
    logger_->warn(to_json(entry));
}

void StructuredLogger::log_redaction(const RedactionLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }
    logger_->info(to_json(entry));
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
