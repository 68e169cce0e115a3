#pragma once

// ---------------------------------------------------------------------------
// linear_classifier.hpp
//
// 학습된 아티팩트 기반 다항 로지스틱 회귀 분류기.
//
// [입력 특성]
// - 분류용 정규화 텍스트의 단어 unigram / bigram 출현 빈도 (term_weights)
// - 동일 텍스트의 FeatureVector 수치 특성 (numeric_weights)
//
// [출력]
//   z_k = bias_k + Σ tf(term) · w_term,k + Σ feature · w_feature,k
//   p   = softmax(z)
//   label = argmax(p), confidence = max(p), distribution = p
//
// 모델 가중치는 생성 후 불변. predict() 는 동시 호출 안전.
// 학습 절차는 이 저장소의 범위 밖이다 (오프라인 학습 결과 YAML 만 소비).
// ---------------------------------------------------------------------------

#include "classifier/classifier.hpp"
#include "detector/feature_extractor.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

inline constexpr std::size_t kLabelCount = 3;

using LabelWeights = std::array<double, kLabelCount>;

struct LinearModel {
    LabelWeights                                     bias{};
    std::map<std::string, LabelWeights, std::less<>> term_weights{};
    std::map<std::string, LabelWeights, std::less<>> numeric_weights{};
};

class LinearClassifier final : public IClassifier {
public:
    explicit LinearClassifier(LinearModel model);

    [[nodiscard]] std::optional<ClassifierSignal> predict(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "linear"; }

    [[nodiscard]] const LinearModel& model() const noexcept { return model_; }

private:
    LinearModel      model_;
    FeatureExtractor extractor_{};
};
