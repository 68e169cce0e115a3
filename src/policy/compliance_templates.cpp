// ---------------------------------------------------------------------------
// compliance_templates.cpp
// ---------------------------------------------------------------------------

#include "policy/compliance_templates.hpp"

#include "normalizer/text_normalizer.hpp"  // ascii_lower

#include <algorithm>
#include <utility>

const std::vector<std::pair<std::string, Policy>>& compliance_templates() {
    static const std::vector<std::pair<std::string, Policy>> templates{
        {"GDPR",
         create_custom_policy("GDPR Compliance",
                              "General Data Protection Regulation - Focus on PII detection",
                              {"personal", "gdpr", "consent", "data subject"},
                              {PatternId::kEmail, PatternId::kSsn},
                              15, 60, 10)},
        {"HIPAA",
         create_custom_policy("HIPAA Compliance",
                              "Health Insurance Portability and Accountability Act - Healthcare data protection",
                              {"patient", "medical", "health", "diagnosis", "treatment", "phi"},
                              {PatternId::kSsn, PatternId::kEmail},
                              20, 55, 10)},
        {"PCI_DSS",
         create_custom_policy("PCI-DSS Compliance",
                              "Payment Card Industry Data Security Standard - Payment card data protection",
                              {"card", "payment", "cvv", "cardholder"},
                              {PatternId::kCreditCard},
                              25, 50, 10)},
        {"SOC2",
         create_custom_policy("SOC2 Compliance",
                              "Service Organization Control 2 - Security controls",
                              {"confidential", "internal", "proprietary", "security"},
                              {PatternId::kAwsAccessKey, PatternId::kGithubToken,
                               PatternId::kSlackToken, PatternId::kJwt, PatternId::kSshPrivateKey},
                              15, 65, 8)},
    };
    return templates;
}

std::optional<Policy> compliance_template(std::string_view key) {
    const std::string wanted = ascii_lower(key);
    const auto& all = compliance_templates();
    const auto it = std::find_if(all.begin(), all.end(), [&wanted](const auto& entry) {
        return ascii_lower(entry.first) == wanted;
    });
    if (it == all.end()) {
        return std::nullopt;
    }
    return it->second;
}

Policy create_custom_policy(std::string name,
                            std::string description,
                            std::vector<std::string> keywords,
                            std::vector<PatternId> pattern_ids,
                            int risk_adjustment,
                            std::optional<int> block_threshold,
                            int priority) {
    Policy p{};
    p.name                  = std::move(name);
    p.description           = std::move(description);
    p.enabled               = true;
    p.priority              = priority;
    p.rules.keywords        = std::move(keywords);
    p.rules.pattern_ids     = std::move(pattern_ids);
    p.rules.risk_adjustment = risk_adjustment;
    p.rules.block_threshold = block_threshold;
    return p;
}
