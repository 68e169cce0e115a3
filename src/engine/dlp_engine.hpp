#pragma once

// ---------------------------------------------------------------------------
// dlp_engine.hpp
//
// 판정 파이프라인 오케스트레이션.
//
//   raw text ─ UTF-8 검증 ─ Normalizer ─ FeatureExtractor ─ RuleScorer ─┐
//            └──────────── normalize_for_classification ─ IClassifier ─┤
//                                                          AssistMerger ┘
//                                                                │
//                                                          PolicyOverlay ─ Decision
//
// RedactionEngine 은 판정과 독립적으로 redact() 로 호출된다.
//
// [오류 처리]
// - 잘못된 UTF-8 → AnalysisError{kMalformedInput}. 빈 입력은 오류가 아니다 (SAFE).
// - 파이프라인 내부 예외(정규식 복잡도 초과 등)는 analyze() 경계에서
//   AnalysisError{kInternalError} 로 변환한다. 예외가 호출자로 넘어가지 않는다.
// - 분류기 없음은 오류가 아니다 (NullClassifier, ml_assist = null).
//
// [스레드 안전성]
// - analyze()/redact() 는 const 이며 공유 가변 상태가 없다. 동시 호출 안전.
// - analyze_batch() 는 boost::asio::thread_pool 에서 텍스트별로 analyze() 를
//   실행한다. 결과는 입력과 같은 위치에 담기며, 한 건의 실패가 다른 건을
//   중단시키지 않는다.
//
// [감사 로그]
// - HIGH   → StructuredLogger::log_alert  (warn)
// - MEDIUM → StructuredLogger::log_decision (info)
// - LOW    → spdlog debug 만
// - 기록되는 입력은 항상 FULL 마스킹 결과다.
// ---------------------------------------------------------------------------

#include "classifier/classifier.hpp"
#include "common/types.hpp"
#include "decision/assist_merger.hpp"
#include "decision/decision.hpp"
#include "detector/feature_extractor.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy.hpp"
#include "policy/policy_overlay.hpp"
#include "redaction/redaction_engine.hpp"
#include "scoring/rule_scorer.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct EngineOptions {
    double      strong_confidence{AssistMerger::kDefaultStrongConfidence};
    std::size_t batch_workers{4};
};

class DlpEngine {
public:
    // classifier 가 nullptr 이면 NullClassifier 로 대체한다.
    // logger 가 nullptr 이면 감사 로그를 남기지 않는다.
    DlpEngine(std::shared_ptr<const IClassifier> classifier,
              EngineOptions                      options,
              std::shared_ptr<StructuredLogger>  logger);

    DlpEngine(const DlpEngine&)            = delete;
    DlpEngine& operator=(const DlpEngine&) = delete;

    [[nodiscard]] std::expected<Decision, AnalysisError>
    analyze(std::string_view text, const std::vector<Policy>& policies = {}) const;

    [[nodiscard]] std::vector<std::expected<Decision, AnalysisError>>
    analyze_batch(const std::vector<std::string>& texts,
                  const std::vector<Policy>&      policies = {}) const;

    // 모드 문자열을 해석해 마스킹하고 감사 로그를 남긴다.
    [[nodiscard]] std::expected<RedactionResult, RedactionError>
    redact(std::string_view text, std::string_view mode_name,
           const RedactionParams& params = {}) const;

    [[nodiscard]] const RedactionEngine& redaction_engine() const noexcept { return redaction_; }
    [[nodiscard]] const EngineOptions&   options() const noexcept { return options_; }
    [[nodiscard]] const IClassifier&     classifier() const noexcept { return *classifier_; }

private:
    [[nodiscard]] Decision run_pipeline(std::string_view text, const std::vector<Policy>& policies) const;

    void audit(const Decision& decision, std::chrono::microseconds duration) const;

    std::shared_ptr<const IClassifier> classifier_;
    EngineOptions                      options_;
    std::shared_ptr<StructuredLogger>  logger_;

    FeatureExtractor extractor_;
    RuleScorer       scorer_;
    AssistMerger     merger_;
    PolicyOverlay    overlay_;
    RedactionEngine  redaction_;
};
