// ---------------------------------------------------------------------------
// classifier_loader.cpp
//
// [설계 원칙]
// - All-or-nothing: 가중치 하나라도 형식이 틀리면 모델 전체를 거부한다.
//   부분 로드된 모델은 예측 분포를 왜곡하므로 사용하지 않는다.
// - 아티팩트 내용 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "classifier/classifier_loader.hpp"

#include "classifier/linear_classifier.hpp"

#include <array>
#include <cmath>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr std::array<std::string_view, kLabelCount> kExpectedLabels{
    "SAFE", "SENSITIVE", "HIGHLY_CONFIDENTIAL",
};

// 라벨별 가중치 3개 시퀀스 파싱. 실패 시 오류 메시지.
[[nodiscard]] std::expected<LabelWeights, std::string>
parse_label_weights(const YAML::Node& node, std::string_view what) {
    if (!node || !node.IsSequence() || node.size() != kLabelCount) {
        return std::unexpected(fmt::format("'{}' must be a sequence of {} numbers", what, kLabelCount));
    }
    LabelWeights weights{};
    for (std::size_t k = 0; k < kLabelCount; ++k) {
        try {
            weights[k] = node[k].as<double>();
        } catch (const YAML::Exception&) {
            return std::unexpected(fmt::format("'{}' element {} is not a number", what, k));
        }
        if (!std::isfinite(weights[k])) {
            return std::unexpected(fmt::format("'{}' element {} is not finite", what, k));
        }
    }
    return weights;
}

[[nodiscard]] std::expected<std::map<std::string, LabelWeights, std::less<>>, std::string>
parse_weight_map(const YAML::Node& node, std::string_view section) {
    std::map<std::string, LabelWeights, std::less<>> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("'{}' must be a map", section));
    }
    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        auto weights = parse_label_weights(entry.second, fmt::format("{}.{}", section, key));
        if (!weights) {
            return std::unexpected(weights.error());
        }
        result.emplace(key, *weights);
    }
    return result;
}

[[nodiscard]] std::expected<LinearModel, std::string> parse_model(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        return std::unexpected(std::string{"model artifact is not a YAML map"});
    }

    // 1. 버전 호환성
    int version = 0;
    try {
        version = root["format_version"].as<int>();
    } catch (const YAML::Exception&) {
        return std::unexpected(std::string{"missing or non-integer 'format_version'"});
    }
    if (version != ClassifierLoader::kSupportedFormatVersion) {
        return std::unexpected(fmt::format("incompatible format_version {} (supported: {})",
                                           version, ClassifierLoader::kSupportedFormatVersion));
    }

    // 2. 라벨 순서. 출력 분포의 의미가 라벨 순서에 묶여 있으므로 정확히 일치해야 한다
    const auto labels = root["labels"];
    if (!labels || !labels.IsSequence() || labels.size() != kLabelCount) {
        return std::unexpected(std::string{"'labels' must list SAFE, SENSITIVE, HIGHLY_CONFIDENTIAL"});
    }
    for (std::size_t k = 0; k < kLabelCount; ++k) {
        if (labels[k].as<std::string>() != kExpectedLabels[k]) {
            return std::unexpected(fmt::format("unexpected label '{}' at position {}",
                                               labels[k].as<std::string>(), k));
        }
    }

    LinearModel model{};

    auto bias = parse_label_weights(root["bias"], "bias");
    if (!bias) {
        return std::unexpected(bias.error());
    }
    model.bias = *bias;

    auto numeric = parse_weight_map(root["numeric_weights"], "numeric_weights");
    if (!numeric) {
        return std::unexpected(numeric.error());
    }
    model.numeric_weights = std::move(*numeric);

    auto terms = parse_weight_map(root["term_weights"], "term_weights");
    if (!terms) {
        return std::unexpected(terms.error());
    }
    model.term_weights = std::move(*terms);

    return model;
}

}  // namespace

std::expected<std::shared_ptr<const IClassifier>, std::string>
ClassifierLoader::load(const std::filesystem::path& model_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(model_path, ec)) {
        return std::unexpected(fmt::format("classifier_loader: model artifact '{}' not found",
                                           model_path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(model_path.string());
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format(
            "classifier_loader: YAML parse error in '{}' at line {}, col {}: {}",
            model_path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("classifier_loader: cannot read '{}': {}",
                                           model_path.string(), e.what()));
    }

    std::expected<LinearModel, std::string> model;
    try {
        model = parse_model(root);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("classifier_loader: malformed artifact '{}': {}",
                                           model_path.string(), e.what()));
    }
    if (!model) {
        return std::unexpected(fmt::format("classifier_loader: invalid artifact '{}': {}",
                                           model_path.string(), model.error()));
    }

    spdlog::info("classifier_loader: loaded model '{}' (terms={}, numeric_features={})",
                 model_path.string(), model->term_weights.size(), model->numeric_weights.size());

    return std::make_shared<const LinearClassifier>(std::move(*model));
}

std::shared_ptr<const IClassifier>
ClassifierLoader::load_or_null(const std::optional<std::filesystem::path>& model_path) {
    if (!model_path || model_path->empty()) {
        spdlog::info("classifier_loader: no model configured, running rule-only");
        return std::make_shared<const NullClassifier>();
    }

    auto loaded = load(*model_path);
    if (!loaded) {
        spdlog::warn("{}, running rule-only", loaded.error());
        return std::make_shared<const NullClassifier>();
    }
    return std::move(*loaded);
}
