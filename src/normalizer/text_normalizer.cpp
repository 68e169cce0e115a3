// ---------------------------------------------------------------------------
// text_normalizer.cpp
// ---------------------------------------------------------------------------

#include "normalizer/text_normalizer.hpp"

#include <cstdint>

namespace {

[[nodiscard]] constexpr bool is_ascii_space(unsigned char ch) noexcept {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

[[nodiscard]] constexpr bool is_continuation(unsigned char ch) noexcept {
    return (ch & 0xC0u) == 0x80u;
}

}  // namespace

std::string normalize_structural(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (const char c : text) {
        const auto ch = static_cast<unsigned char>(c);
        if (is_ascii_space(ch)) {
            // 선두 공백은 버리고, 내부 공백은 다음 비공백 문자 직전에 1개만 출력
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    // 후미 공백은 pending 상태로 남고 출력되지 않는다.
    return result;
}

std::string normalize_structural(const char* text) {
    if (text == nullptr) {
        return {};
    }
    return normalize_structural(std::string_view{text});
}

std::string normalize_for_classification(std::string_view text) {
    return ascii_lower(normalize_structural(text));
}

std::string normalize_for_classification(const char* text) {
    if (text == nullptr) {
        return {};
    }
    return normalize_for_classification(std::string_view{text});
}

std::string ascii_lower(std::string_view text) {
    std::string result(text);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// is_valid_utf8
//   RFC 3629 기준. 리드 바이트로 시퀀스 길이를 결정한 뒤
//   최소 코드포인트(overlong 방지)와 상한을 함께 검사한다.
// ---------------------------------------------------------------------------
bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80u) {
            ++i;
            continue;
        }

        std::size_t   length{0};
        std::uint32_t code_point{0};
        std::uint32_t min_code_point{0};

        if ((lead & 0xE0u) == 0xC0u) {
            length         = 2;
            code_point     = lead & 0x1Fu;
            min_code_point = 0x80u;
        } else if ((lead & 0xF0u) == 0xE0u) {
            length         = 3;
            code_point     = lead & 0x0Fu;
            min_code_point = 0x800u;
        } else if ((lead & 0xF8u) == 0xF0u) {
            length         = 4;
            code_point     = lead & 0x07u;
            min_code_point = 0x10000u;
        } else {
            return false;  // 고아 continuation 바이트 또는 0xF8 이상
        }

        if (i + length > n) {
            return false;  // 잘린 시퀀스
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if (!is_continuation(cont)) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3Fu);
        }

        if (code_point < min_code_point) {
            return false;  // overlong
        }
        if (code_point > 0x10FFFFu) {
            return false;
        }
        if (code_point >= 0xD800u && code_point <= 0xDFFFu) {
            return false;  // 서러게이트
        }
        i += length;
    }
    return true;
}
