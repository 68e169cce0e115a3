// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 Policy 목록으로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 항목별 검증은 parse_policy 에 위임한다 (스토어 CRUD 와 같은 규칙).
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
// - policies 키가 없거나 null 이면 빈 목록 (정책 없음은 정상 상태).
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include "policy/policy_validator.hpp"

#include <string>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

std::expected<std::vector<Policy>, std::string>
PolicyLoader::load(const std::filesystem::path& policy_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(policy_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve policy path '{}': {}",
            policy_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policies from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    std::vector<Policy> policies;
    const YAML::Node list = root["policies"];
    if (!list || list.IsNull()) {
        spdlog::warn("policy_loader: '{}' has no 'policies' section", canonical_path.string());
        return policies;
    }
    if (!list.IsSequence()) {
        const std::string err = fmt::format(
            "policy_loader: 'policies' in '{}' must be a sequence", canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 항목별 파싱 (try-catch: YAML 예외 안전)
    std::unordered_set<std::string> seen;
    policies.reserve(list.size());
    std::size_t index = 0;
    for (const auto& entry : list) {
        std::expected<Policy, PolicyError> parsed;
        try {
            parsed = parse_policy(entry);
        } catch (const YAML::Exception& e) {
            const std::string err = fmt::format(
                "policy_loader: error parsing policies[{}]: {}", index, e.what());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
        if (!parsed) {
            const std::string err = fmt::format(
                "policy_loader: policies[{}] rejected ({}): {}",
                index, parsed.error().field, parsed.error().message);
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
        if (!seen.insert(parsed->name).second) {
            const std::string err = fmt::format(
                "policy_loader: policies[{}] duplicate policy name '{}'", index, parsed->name);
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
        policies.push_back(std::move(*parsed));
        ++index;
    }

    spdlog::info("policy_loader: loaded {} policies", policies.size());
    return policies;
}
