#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   DlpEngine 은 shared_ptr<StructuredLogger> 를 주입받는다.
// - 감사 로그 한 줄 = JSON 객체 하나. 모듈 진단 로그는 spdlog 기본 로거 사용.
// - 원문 입력을 받지 않는다. 호출자가 FULL 마스킹한 텍스트만 전달한다.
//
// [싱크]
// - stderr (stdout 은 CLI 의 JSON 결과 출력에 쓰인다)
// - rotating file (100MB x 3). log_path 가 비어 있으면 파일 싱크 생략.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로, 빈 경로 허용)
    //   초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path = {});

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_decision
    //   MEDIUM 판정을 JSON 으로 기록한다 (info).
    void log_decision(const DecisionLog& entry);

    // log_alert
    //   HIGH 판정 경보를 JSON 으로 기록한다 (warn).
    void log_alert(const AlertLog& entry);

    // log_redaction
    //   마스킹 요청을 JSON 으로 기록한다 (info).
    void log_redaction(const RedactionLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

    // 버퍼에 남은 로그를 싱크로 내보낸다 (종료 직전, 테스트)
    void flush();

    // JSON 직렬화 (테스트에서 직접 검증)
    [[nodiscard]] static std::string to_json(const DecisionLog& entry);
    [[nodiscard]] static std::string to_json(const AlertLog& entry);
    [[nodiscard]] static std::string to_json(const RedactionLog& entry);

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
