#pragma once

// ---------------------------------------------------------------------------
// policy_store.hpp
//
// 프로세스 내 정책 저장소 (CRUD). 영속화는 외부 협력자의 몫이다.
//
// [설계 원칙]
// - create/update 는 항상 validate_policy 를 통과해야 한다.
//   검증 실패 또는 이름 중복 정책은 저장되지 않는다.
// - 목록은 삽입 순서를 유지한다. 우선순위 정렬은 PolicyOverlay 의 몫.
//
// [스레드 안전성]
// - 내부 목록은 copy-on-write: 쓰기마다 새 벡터를 만들어 shared_ptr 를 교체한다.
// - snapshot() 은 shared_ptr 복사만 하므로 진행 중인 analyze() 는
//   쓰기와 경쟁 없이 호출 시점의 정책 집합을 끝까지 사용한다.
// - 쓰기는 unique_lock, 읽기는 shared_lock (std::shared_mutex).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/policy.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

class PolicyStore {
public:
    using Snapshot = std::shared_ptr<const std::vector<Policy>>;

    PolicyStore();

    PolicyStore(const PolicyStore&)            = delete;
    PolicyStore& operator=(const PolicyStore&) = delete;

    [[nodiscard]] std::expected<void, PolicyError> create(Policy policy);

    // name 으로 찾은 정책을 policy 로 교체한다. 이름 변경 시 새 이름도 중복 검사.
    [[nodiscard]] std::expected<void, PolicyError> update(std::string_view name, Policy policy);

    [[nodiscard]] std::expected<void, PolicyError> remove(std::string_view name);

    [[nodiscard]] std::optional<Policy> get(std::string_view name) const;

    [[nodiscard]] std::vector<Policy> list(bool enabled_only = false) const;

    // 전체 교체 (파일 로드 결과 반영). 하나라도 실패하면 기존 목록 유지.
    [[nodiscard]] std::expected<void, PolicyError> replace_all(std::vector<Policy> policies);

    [[nodiscard]] Snapshot snapshot() const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    Snapshot                  policies_;
};
