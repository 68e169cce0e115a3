#pragma once

// ---------------------------------------------------------------------------
// classifier_loader.hpp
//
// 분류기 모델 아티팩트(YAML)를 로드하여 IClassifier 를 만든다.
//
// [아티팩트 형식: format_version 1]
//   format_version: 1
//   labels: [SAFE, SENSITIVE, HIGHLY_CONFIDENTIAL]
//   bias: [b0, b1, b2]
//   numeric_weights:            # 특성 이름 → 라벨별 가중치 3개
//     has_ssn: [-1.2, 0.4, 1.1]
//   term_weights:               # 단어/단어쌍 → 라벨별 가중치 3개
//     password: [-0.8, 0.2, 0.9]
//     "api key": [-0.5, 0.1, 0.7]
//
// [실패 처리]
// - load()         : 실패 원인을 std::unexpected(message) 로 반환.
// - load_or_null() : 절대 실패하지 않는다. 경로 미지정/파일 없음/파싱 오류/
//                    버전 불일치 모두 warn 로그 후 NullClassifier 반환.
//                    로드 실패를 요청 경로로 전파하지 않는다.
// ---------------------------------------------------------------------------

#include "classifier/classifier.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

class ClassifierLoader {
public:
    static constexpr int kSupportedFormatVersion = 1;

    [[nodiscard]] static std::expected<std::shared_ptr<const IClassifier>, std::string>
    load(const std::filesystem::path& model_path);

    [[nodiscard]] static std::shared_ptr<const IClassifier>
    load_or_null(const std::optional<std::filesystem::path>& model_path);
};
