#pragma once

// ---------------------------------------------------------------------------
// classifier.hpp
//
// 외부 보조 분류기(secondary classifier) 추상화.
//
// [설계 원칙]
// - 분류기는 프로세스 시작 시 1회 선택된다 (ClassifierLoader 참조).
//   요청마다 선택/로드하지 않는다.
// - 분류기 부재는 오류가 아니다. NullClassifier 는 항상 std::nullopt 를
//   반환하며 파이프라인은 규칙 전용 모드로 동작한다.
// - predict() 는 const 이며 공유 불변 모델에 대해 동시 호출 안전해야 한다.
//   서빙 중 재학습/모델 변경 금지.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ClassifierSignal
//   label       : 예측 라벨
//   confidence  : [0,1], 일반적으로 distribution 의 최댓값
//   distribution: 라벨 순서(SAFE, SENSITIVE, HIGHLY_CONFIDENTIAL)별 확률, 합 = 1
// ---------------------------------------------------------------------------
struct ClassifierSignal {
    Classification                     label{Classification::kSafe};
    double                             confidence{0.0};
    std::optional<std::vector<double>> distribution{};
};

class IClassifier {
public:
    virtual ~IClassifier() = default;

    // text: normalize_for_classification() 결과
    [[nodiscard]] virtual std::optional<ClassifierSignal> predict(std::string_view text) const = 0;

    // 로그/진단용 이름
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

class NullClassifier final : public IClassifier {
public:
    [[nodiscard]] std::optional<ClassifierSignal> predict(std::string_view /*text*/) const override {
        return std::nullopt;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "null"; }
};
