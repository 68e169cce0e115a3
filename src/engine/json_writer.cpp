// ---------------------------------------------------------------------------
// json_writer.cpp
//
// fmt::format 기반 수동 직렬화. 문자열 값은 모두 escape_json_string 을 거친다.
// 실수는 fmt 의 최단 왕복 표현("{}")으로 출력한다.
// ---------------------------------------------------------------------------

#include "engine/json_writer.hpp"

#include "common/json_util.hpp"

#include <cstddef>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

[[nodiscard]] std::string quoted(std::string_view value) {
    return fmt::format(R"("{}")", escape_json_string(value));
}

[[nodiscard]] std::string string_array(const std::vector<std::string>& values) {
    std::vector<std::string> items;
    items.reserve(values.size());
    for (const auto& v : values) {
        items.push_back(quoted(v));
    }
    return fmt::format("[{}]", fmt::join(items, ","));
}

[[nodiscard]] std::string ml_assist_json(const std::optional<ClassifierSignal>& signal) {
    if (!signal) {
        return "null";
    }
    std::string proba;
    if (signal->distribution) {
        proba = fmt::format(R"("proba":[{}],)", fmt::join(*signal->distribution, ","));
    }
    return fmt::format(R"({{"pred_label":{},"label":"{}",{}"confidence":{}}})",
                       static_cast<int>(signal->label), to_string(signal->label),
                       proba, signal->confidence);
}

}  // namespace

std::string to_json(const Decision& decision) {
    return fmt::format(
        R"({{"classification":"{}","risk_level":"{}","action":"{}","risk_score":{},)"
        R"("reasons":{},"ml_assist":{},"input":{}}})",
        to_string(decision.classification),
        to_string(decision.risk_level),
        to_string(decision.action),
        decision.risk_score,
        string_array(decision.reasons),
        ml_assist_json(decision.ml_assist),
        quoted(decision.input)
    );
}

std::string to_json(const RedactionResult& result) {
    std::string token_map;
    if (result.token_vault) {
        std::vector<std::string> entries;
        entries.reserve(result.token_vault->size());
        for (const auto& [token, original] : *result.token_vault) {
            entries.push_back(fmt::format("{}:{}", quoted(token), quoted(original)));
        }
        token_map = fmt::format(R"("token_map":{{{}}},)", fmt::join(entries, ","));
    }
    return fmt::format(R"({{"redacted_text":{},"mode":"{}",{}"reversible":{}}})",
                       quoted(result.sanitized_text), to_string(result.mode), token_map,
                       result.reversible);
}

std::string to_json(const AnalysisError& error) {
    return fmt::format(R"({{"error":{},"code":"{}"}})", quoted(error.message), to_string(error.code));
}

std::string to_json(const RedactionError& error) {
    return fmt::format(R"({{"error":{},"code":"{}","mode":{}}})",
                       quoted(error.message), to_string(error.code), quoted(error.mode));
}

std::string to_json(const PolicyError& error) {
    return fmt::format(R"({{"error":{},"code":"{}","field":{}}})",
                       quoted(error.message), to_string(error.code), quoted(error.field));
}

std::string to_json(const Policy& policy) {
    std::vector<std::string> pattern_ids;
    pattern_ids.reserve(policy.rules.pattern_ids.size());
    for (const auto id : policy.rules.pattern_ids) {
        pattern_ids.emplace_back(pattern_key(id));
    }
    const std::string threshold = policy.rules.block_threshold
        ? fmt::format("{}", *policy.rules.block_threshold)
        : std::string{"null"};

    return fmt::format(
        R"({{"name":{},"description":{},"enabled":{},"priority":{},)"
        R"("rules":{{"keywords":{},"pattern_ids":{},"risk_adjustment":{},"block_threshold":{}}}}})",
        quoted(policy.name), quoted(policy.description), policy.enabled, policy.priority,
        string_array(policy.rules.keywords), string_array(pattern_ids),
        policy.rules.risk_adjustment, threshold
    );
}

std::string to_json(const std::vector<std::expected<Decision, AnalysisError>>& results) {
    std::vector<std::string> items;
    items.reserve(results.size());
    for (const auto& r : results) {
        items.push_back(r ? to_json(*r) : to_json(r.error()));
    }
    return fmt::format("[{}]", fmt::join(items, ","));
}

std::string policies_to_json(const std::vector<Policy>& policies) {
    std::vector<std::string> items;
    items.reserve(policies.size());
    for (const auto& p : policies) {
        items.push_back(to_json(p));
    }
    return fmt::format("[{}]", fmt::join(items, ","));
}

std::string modes_to_json() {
    std::vector<std::string> items;
    for (const auto& info : RedactionEngine::available_modes()) {
        items.push_back(fmt::format(R"({{"mode":"{}","description":{},"reversible":{}}})",
                                    to_string(info.mode), quoted(info.description),
                                    info.reversible));
    }
    return fmt::format("[{}]", fmt::join(items, ","));
}
