#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 로드하여 Policy 목록으로 파싱하는 로더.
//
// [파일 형식]
//   policies:
//     - name: Internal Secrets
//       priority: 7
//       rules:
//         keywords: [confidential]
//         risk_adjustment: 10
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 기존 정책을 유지하거나 정책 없이 기동해야 한다.
// - All-or-nothing: 항목 하나라도 검증에 실패하거나 이름이 중복되면
//   파일 전체를 거부한다. 부분 정책을 반환하지 않는다.
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것
//   (정책 키워드 자체가 민감할 수 있다).
// ---------------------------------------------------------------------------

#include "policy/policy.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

class PolicyLoader {
public:
    // load
    //   성공: 파일에 적힌 순서대로의 Policy 목록 (빈 목록 허용)
    //   실패: 파일 없음, YAML 파싱 오류, 항목 검증 실패, 이름 중복
    [[nodiscard]] static std::expected<std::vector<Policy>, std::string>
    load(const std::filesystem::path& policy_path);
};
