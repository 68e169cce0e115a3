#pragma once

// ---------------------------------------------------------------------------
// text_normalizer.hpp
//
// 원문 텍스트를 두 가지 정규화 형태로 변환한다.
//
// [정규화 형태]
// - structural    : 앞뒤 공백 제거 + 내부 공백 연속 구간을 공백 1개로 축약.
//                   대소문자/구두점은 그대로 유지한다.
//                   (sk-, AKIA, 하이픈 포함 SSN/카드번호 형태 보존)
// - classification: structural + ASCII 소문자화. 분류기/키워드 매칭 입력.
//
// [설계 원칙]
// - 순수 함수. 예외를 던지지 않는다.
// - 입력 부재(nullptr)는 오류가 아니라 빈 문자열로 정규화한다.
// - 공백 집합은 ASCII 공백(space, \t \n \v \f \r)만 인정한다.
//   유니코드 공백(U+00A0 등)은 축약 대상이 아니다 (알려진 한계).
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

[[nodiscard]] std::string normalize_structural(std::string_view text);
[[nodiscard]] std::string normalize_structural(const char* text);

[[nodiscard]] std::string normalize_for_classification(std::string_view text);
[[nodiscard]] std::string normalize_for_classification(const char* text);

// ASCII 소문자화 (바이트 단위, 비 ASCII 바이트는 그대로)
[[nodiscard]] std::string ascii_lower(std::string_view text);

// ---------------------------------------------------------------------------
// is_valid_utf8
//   UTF-8 구조 검증. overlong 인코딩, 서러게이트(U+D800..U+DFFF),
//   U+10FFFF 초과 코드포인트, 잘린 시퀀스를 모두 거부한다.
//   엔진이 "malformed bytes" 입력을 건별 실패로 보고할 때 사용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;
