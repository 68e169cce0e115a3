#pragma once

// ---------------------------------------------------------------------------
// compliance_templates.hpp
//
// 사전 정의된 컴플라이언스 정책 템플릿과 사용자 정의 정책 빌더.
//
//   키        이름                  priority  adjustment  block_threshold
//   GDPR      GDPR Compliance       10        +15         60
//   HIPAA     HIPAA Compliance      10        +20         55
//   PCI_DSS   PCI-DSS Compliance    10        +25         50
//   SOC2      SOC2 Compliance        8        +15         65
//
// 설정 파일의 policy.templates 목록에 키를 적으면 기동 시 스토어에 등록된다.
// ---------------------------------------------------------------------------

#include "policy/policy.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// 키 순서: GDPR, HIPAA, PCI_DSS, SOC2
[[nodiscard]] const std::vector<std::pair<std::string, Policy>>& compliance_templates();

// 키는 대소문자를 구분하지 않는다 ("pci_dss" 허용).
[[nodiscard]] std::optional<Policy> compliance_template(std::string_view key);

// create_custom_policy
//   기본값: enabled, priority 5, risk_adjustment 0, block_threshold 70.
//   검증은 하지 않는다. 스토어 등록 시 validate_policy 를 거친다.
[[nodiscard]] Policy create_custom_policy(std::string name,
                                          std::string description          = {},
                                          std::vector<std::string> keywords = {},
                                          std::vector<PatternId> pattern_ids = {},
                                          int risk_adjustment              = 0,
                                          std::optional<int> block_threshold = 70,
                                          int priority                     = 5);
