#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 수작업 JSON 직렬화 헬퍼. 감사 로그와 CLI 출력이 같은 이스케이프 규칙을 쓴다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <string>
#include <string_view>

// '"', '\\', 제어 문자(< 0x20) 이스케이프. UTF-8 멀티바이트는 그대로 둔다.
[[nodiscard]] std::string escape_json_string(std::string_view str);

// "2026-01-02T03:04:05.678Z" (UTC, 밀리초)
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
