// ---------------------------------------------------------------------------
// dlp_engine.cpp
// ---------------------------------------------------------------------------

#include "engine/dlp_engine.hpp"

#include "normalizer/text_normalizer.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

DlpEngine::DlpEngine(std::shared_ptr<const IClassifier> classifier,
                     EngineOptions                      options,
                     std::shared_ptr<StructuredLogger>  logger)
    : classifier_(classifier ? std::move(classifier)
                             : std::make_shared<const NullClassifier>())
    , options_(options)
    , logger_(std::move(logger))
    , merger_(options.strong_confidence)
{
    spdlog::info("dlp_engine: initialized (classifier={}, strong_confidence={:.2f}, batch_workers={})",
                 classifier_->name(), options_.strong_confidence, options_.batch_workers);
}

// ---------------------------------------------------------------------------
// run_pipeline
//   유효한 UTF-8 입력에 대해 항상 Decision 을 만든다.
// ---------------------------------------------------------------------------
Decision DlpEngine::run_pipeline(std::string_view text, const std::vector<Policy>& policies) const {
    const std::string structural = normalize_structural(text);
    const FeatureVector features = extractor_.extract(structural);
    RuleDecision rules           = scorer_.score(features);

    const auto signal = classifier_->predict(normalize_for_classification(text));

    Decision merged = merger_.merge(std::move(rules), signal);
    merged.input    = std::string(text);

    return overlay_.apply(std::move(merged), policies);
}

std::expected<Decision, AnalysisError>
DlpEngine::analyze(std::string_view text, const std::vector<Policy>& policies) const {
    if (!is_valid_utf8(text)) {
        spdlog::warn("dlp_engine: rejected input of {} bytes (invalid UTF-8)", text.size());
        return std::unexpected(AnalysisError{AnalysisErrorCode::kMalformedInput,
                                             "input is not valid UTF-8"});
    }

    const auto started = std::chrono::steady_clock::now();
    try {
        Decision decision = run_pipeline(text, policies);
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        audit(decision, elapsed);
        return decision;
    } catch (const std::exception& e) {
        spdlog::error("dlp_engine: analysis failed: {}", e.what());
        return std::unexpected(AnalysisError{AnalysisErrorCode::kInternalError,
                                             std::string("analysis failed: ") + e.what()});
    }
}

std::vector<std::expected<Decision, AnalysisError>>
DlpEngine::analyze_batch(const std::vector<std::string>& texts,
                         const std::vector<Policy>&      policies) const {
    std::vector<std::expected<Decision, AnalysisError>> results(texts.size());
    if (texts.empty()) {
        return results;
    }

    const std::size_t workers =
        std::clamp<std::size_t>(options_.batch_workers, 1, texts.size());
    boost::asio::thread_pool pool(workers);

    // 각 작업은 자기 인덱스에만 쓴다 (동기화 불필요)
    for (std::size_t i = 0; i < texts.size(); ++i) {
        boost::asio::post(pool, [this, &texts, &policies, &results, i] {
            results[i] = analyze(texts[i], policies);
        });
    }
    pool.join();

    const auto failed = std::count_if(results.begin(), results.end(),
                                      [](const auto& r) { return !r.has_value(); });
    spdlog::info("dlp_engine: batch of {} analyzed ({} failed, workers={})",
                 texts.size(), failed, workers);
    return results;
}

std::expected<RedactionResult, RedactionError>
DlpEngine::redact(std::string_view text, std::string_view mode_name,
                  const RedactionParams& params) const {
    const auto mode = parse_redaction_mode(mode_name);
    if (!mode) {
        return std::unexpected(mode.error());
    }

    auto result = redaction_.redact(text, *mode, params);
    if (!result) {
        return result;
    }

    if (logger_) {
        RedactionLog entry{};
        entry.mode          = std::string(to_string(result->mode));
        entry.input_length  = text.size();
        entry.output_length = result->sanitized_text.size();
        entry.token_count   = result->token_vault ? result->token_vault->size() : 0;
        entry.reversible    = result->reversible;
        entry.timestamp     = std::chrono::system_clock::now();
        logger_->log_redaction(entry);
    }
    return result;
}

// ---------------------------------------------------------------------------
// audit
//   원문이 아닌 FULL 마스킹 결과만 로그에 남긴다.
// ---------------------------------------------------------------------------
void DlpEngine::audit(const Decision& decision, std::chrono::microseconds duration) const {
    if (decision.risk_level == RiskLevel::kLow || !logger_) {
        spdlog::debug("dlp_engine: {} decision, score={}, {} reasons",
                      to_string(decision.risk_level), decision.risk_score, decision.reasons.size());
        return;
    }

    const auto masked = redaction_.redact(decision.input, RedactionMode::kFull);
    std::string redacted_input = masked ? masked->sanitized_text : std::string{};

    if (decision.risk_level == RiskLevel::kHigh) {
        AlertLog entry{};
        entry.classification = decision.classification;
        entry.risk_score     = decision.risk_score;
        entry.reasons        = decision.reasons;
        entry.redacted_input = std::move(redacted_input);
        entry.timestamp      = std::chrono::system_clock::now();
        logger_->log_alert(entry);
        return;
    }

    DecisionLog entry{};
    entry.classification = decision.classification;
    entry.risk_level     = decision.risk_level;
    entry.action         = decision.action;
    entry.risk_score     = decision.risk_score;
    entry.reasons        = decision.reasons;
    entry.redacted_input = std::move(redacted_input);
    entry.ml_assisted    = decision.ml_assist.has_value();
    entry.timestamp      = std::chrono::system_clock::now();
    entry.duration       = duration;
    logger_->log_decision(entry);
}
