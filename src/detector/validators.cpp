// ---------------------------------------------------------------------------
// validators.cpp
// ---------------------------------------------------------------------------

#include "detector/validators.hpp"

#include <array>
#include <cmath>
#include <cstddef>

namespace {

[[nodiscard]] constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// 고정 길이 숫자 필드 파싱. 숫자가 아닌 문자가 있으면 -1
[[nodiscard]] int parse_digits(std::string_view field) noexcept {
    int value = 0;
    for (const char c : field) {
        if (!is_digit(c)) {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace

bool luhn_check(std::string_view candidate) noexcept {
    // 숫자만 추출 (최대 19자리까지만 의미 있음)
    std::array<int, 20> digits{};
    std::size_t count = 0;
    for (const char c : candidate) {
        if (!is_digit(c)) {
            continue;
        }
        if (count == digits.size()) {
            return false;  // 19자리 초과
        }
        digits[count++] = c - '0';
    }

    if (count < 13 || count > 19) {
        return false;
    }

    // 오른쪽부터 두 번째 자리마다 2배, 9 초과 시 -9
    int total = 0;
    for (std::size_t i = 0; i < count; ++i) {
        int n = digits[count - 1 - i];
        if (i % 2 == 1) {
            n *= 2;
            if (n > 9) {
                n -= 9;
            }
        }
        total += n;
    }
    return total % 10 == 0;
}

bool validate_ssn(std::string_view candidate) noexcept {
    if (candidate.size() != 11 || candidate[3] != '-' || candidate[6] != '-') {
        return false;
    }

    const int area   = parse_digits(candidate.substr(0, 3));
    const int group  = parse_digits(candidate.substr(4, 2));
    const int serial = parse_digits(candidate.substr(7, 4));
    if (area < 0 || group < 0 || serial < 0) {
        return false;
    }

    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (group == 0) {
        return false;
    }
    return serial != 0;
}

double shannon_entropy(std::string_view text) noexcept {
    if (text.empty()) {
        return 0.0;
    }

    std::array<std::size_t, 256> freq{};
    for (const char c : text) {
        ++freq[static_cast<unsigned char>(c)];
    }

    const auto length = static_cast<double>(text.size());
    double entropy = 0.0;
    for (const auto count : freq) {
        if (count == 0) {
            continue;
        }
        const double p = static_cast<double>(count) / length;
        entropy -= p * std::log2(p);
    }
    return entropy;
}
