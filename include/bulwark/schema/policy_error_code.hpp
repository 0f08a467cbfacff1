#pragma once

#include <bulwark/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: policy error code.
// Access workflow: Stable numeric failure taxonomy shared by local validation
// and remote mutation paths.
namespace bulwark::schema {

enum class policy_error_code : uint32_t {
  unknown_protocol = 1,
  unknown_permission = 2,
  policy_not_found = 3,
  principal_already_allowed = 4,
  principal_not_allowed = 5,
  timelock_not_expired = 6,
  nothing_staged = 7,
  delegate_not_found = 8,
  remote_mutation_rejected = 9,
  invalid_policy_data = 10,
  integration_not_enabled = 11,
  integration_already_enabled = 12,
  protocol_not_enabled = 13,
  vault_missing = 14,
  vault_exists = 15,
  precondition_mismatch = 16,
  invalid_argument = 17,
};

inline constexpr auto kPolicyErrorCodeMappings = std::array{
    std::pair<std::string_view, policy_error_code>{
        "unknown_protocol", policy_error_code::unknown_protocol},
    std::pair<std::string_view, policy_error_code>{
        "unknown_permission", policy_error_code::unknown_permission},
    std::pair<std::string_view, policy_error_code>{
        "policy_not_found", policy_error_code::policy_not_found},
    std::pair<std::string_view, policy_error_code>{
        "principal_already_allowed",
        policy_error_code::principal_already_allowed},
    std::pair<std::string_view, policy_error_code>{
        "principal_not_allowed", policy_error_code::principal_not_allowed},
    std::pair<std::string_view, policy_error_code>{
        "timelock_not_expired", policy_error_code::timelock_not_expired},
    std::pair<std::string_view, policy_error_code>{
        "nothing_staged", policy_error_code::nothing_staged},
    std::pair<std::string_view, policy_error_code>{
        "delegate_not_found", policy_error_code::delegate_not_found},
    std::pair<std::string_view, policy_error_code>{
        "remote_mutation_rejected",
        policy_error_code::remote_mutation_rejected},
    std::pair<std::string_view, policy_error_code>{
        "invalid_policy_data", policy_error_code::invalid_policy_data},
    std::pair<std::string_view, policy_error_code>{
        "integration_not_enabled", policy_error_code::integration_not_enabled},
    std::pair<std::string_view, policy_error_code>{
        "integration_already_enabled",
        policy_error_code::integration_already_enabled},
    std::pair<std::string_view, policy_error_code>{
        "protocol_not_enabled", policy_error_code::protocol_not_enabled},
    std::pair<std::string_view, policy_error_code>{
        "vault_missing", policy_error_code::vault_missing},
    std::pair<std::string_view, policy_error_code>{
        "vault_exists", policy_error_code::vault_exists},
    std::pair<std::string_view, policy_error_code>{
        "precondition_mismatch", policy_error_code::precondition_mismatch},
    std::pair<std::string_view, policy_error_code>{
        "invalid_argument", policy_error_code::invalid_argument},
};

inline constexpr std::string_view to_string(const policy_error_code value) {
  return to_string(value, kPolicyErrorCodeMappings).value_or("unknown");
}

}  // namespace bulwark::schema
