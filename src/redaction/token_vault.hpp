#pragma once

// ---------------------------------------------------------------------------
// token_vault.hpp
//
// 토큰화(TOKENIZE) 모드의 가역 매핑 저장소: 생성된 토큰 → 원문 부분 문자열.
//
// [소유권]
// - 기본은 요청 단위: redact(kTokenize) 가 내부에서 생성하고 스냅샷을 반환한다.
// - 요청 간 역변환이 필요한 경우 호출자가 하나의 TokenVault 를 소유하고
//   tokenize()/detokenize() 에 참조로 넘긴다.
//
// [스레드 안전성]
// - insert 는 unique_lock, 조회/스냅샷은 shared_lock (std::shared_mutex).
// - snapshot() 은 호출 시점의 일관된 복사본이다. 이후 insert 는 반영되지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

class TokenVault {
public:
    using Map = std::map<std::string, std::string, std::less<>>;

    TokenVault() = default;

    TokenVault(const TokenVault&)            = delete;
    TokenVault& operator=(const TokenVault&) = delete;

    // 이미 같은 토큰이 있으면 false (기존 값 유지)
    [[nodiscard]] bool insert(std::string token, std::string original);

    [[nodiscard]] bool contains(std::string_view token) const;

    [[nodiscard]] std::optional<std::string> find(std::string_view token) const;

    [[nodiscard]] Map snapshot() const;

    [[nodiscard]] std::size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    Map                       entries_;
};
