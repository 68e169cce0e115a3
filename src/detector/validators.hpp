#pragma once

// ---------------------------------------------------------------------------
// validators.hpp
//
// 정규식 매칭 결과의 구조 검증 및 엔트로피 계산.
//
// [오탐 억제]
// - luhn_check   : 카드번호 유사 숫자열 중 체크섬이 맞는 것만 양성 처리.
// - validate_ssn : area != 000/666, area < 900, group != 00, serial != 0000.
// ---------------------------------------------------------------------------

#include <string_view>

// 숫자 이외 문자를 제거한 뒤 13~19자리 + Luhn 합계 mod 10 == 0
[[nodiscard]] bool luhn_check(std::string_view candidate) noexcept;

// candidate 는 정확히 "ddd-dd-dddd" 형태여야 한다. 그 외 형태는 false.
[[nodiscard]] bool validate_ssn(std::string_view candidate) noexcept;

// Shannon 엔트로피 (bit/char). 빈 문자열은 0.0
[[nodiscard]] double shannon_entropy(std::string_view text) noexcept;
