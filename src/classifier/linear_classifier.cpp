// ---------------------------------------------------------------------------
// linear_classifier.cpp
//
// [토큰화]
// 2자 이상 단어 문자([a-z0-9_] 및 비 ASCII 바이트) 연속 구간을 단어로 본다.
// unigram 과 인접 단어쌍 bigram("a b")을 모두 항(term)으로 사용한다.
// 항 빈도 벡터는 L2 정규화한다 (긴 텍스트가 점수를 독점하지 않도록).
//
// [수치 안정성]
// softmax 는 최댓값을 빼고 계산한다.
// ---------------------------------------------------------------------------

#include "classifier/linear_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

[[nodiscard]] constexpr bool is_word_char(unsigned char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '_' || c >= 0x80u;
}

[[nodiscard]] std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && is_word_char(static_cast<unsigned char>(text[j]))) {
            ++j;
        }
        if (j - i >= 2) {
            words.emplace_back(text.substr(i, j - i));
        }
        i = j;
    }
    return words;
}

[[nodiscard]] std::unordered_map<std::string, double> term_frequencies(std::string_view text) {
    const auto words = split_words(text);

    std::unordered_map<std::string, double> tf;
    for (std::size_t i = 0; i < words.size(); ++i) {
        tf[words[i]] += 1.0;
        if (i + 1 < words.size()) {
            tf[words[i] + " " + words[i + 1]] += 1.0;
        }
    }

    double norm = 0.0;
    for (const auto& [term, count] : tf) {
        norm += count * count;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& [term, count] : tf) {
            count /= norm;
        }
    }
    return tf;
}

[[nodiscard]] Classification label_at(std::size_t index) noexcept {
    switch (index) {
        case 1:  return Classification::kSensitive;
        case 2:  return Classification::kHighlyConfidential;
        default: return Classification::kSafe;
    }
}

}  // namespace

LinearClassifier::LinearClassifier(LinearModel model)
    : model_(std::move(model))
{}

std::optional<ClassifierSignal> LinearClassifier::predict(std::string_view text) const {
    LabelWeights z = model_.bias;

    for (const auto& [term, weight] : term_frequencies(text)) {
        const auto it = model_.term_weights.find(term);
        if (it == model_.term_weights.end()) {
            continue;
        }
        for (std::size_t k = 0; k < kLabelCount; ++k) {
            z[k] += weight * it->second[k];
        }
    }

    const auto features = extractor_.extract(text);
    for (const auto& [name, weights] : model_.numeric_weights) {
        const double value = features.get(name);
        if (value == 0.0) {
            continue;
        }
        for (std::size_t k = 0; k < kLabelCount; ++k) {
            z[k] += value * weights[k];
        }
    }

    const double z_max = *std::max_element(z.begin(), z.end());
    std::vector<double> proba(kLabelCount, 0.0);
    double sum = 0.0;
    for (std::size_t k = 0; k < kLabelCount; ++k) {
        proba[k] = std::exp(z[k] - z_max);
        sum += proba[k];
    }
    for (auto& p : proba) {
        p /= sum;
    }

    const auto best = static_cast<std::size_t>(
        std::distance(proba.begin(), std::max_element(proba.begin(), proba.end())));

    return ClassifierSignal{
        .label        = label_at(best),
        .confidence   = proba[best],
        .distribution = std::move(proba),
    };
}
