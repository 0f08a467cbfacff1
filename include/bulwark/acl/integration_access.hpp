#pragma once
#include <bulwark/schema/integration_acl.hpp>
#include <bulwark/schema/policy_error_code.hpp>
#include <bulwark/schema/primitives.hpp>

#include <optional>
#include <vector>

namespace bulwark::acl {

using integration_acls_t = std::vector<bulwark::schema::integration_acl_t>;

/// std::nullopt on success, otherwise the reason the edit was refused. The
/// input is left untouched on failure.
using edit_result_t = std::optional<bulwark::schema::policy_error_code>;

/// integration_already_enabled when the program already has an entry.
edit_result_t enable_integration(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocols_bitmask_t mask);

/// Clears every protocol bit; stored policies stay behind, dormant.
/// integration_not_enabled when the program has no entry.
edit_result_t disable_integration(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program);

/// Set or clear `mask` in the program's protocol bits.
edit_result_t set_protocols(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocols_bitmask_t mask,
    bool enabled);

std::optional<bulwark::schema::integration_acl_t> find_integration(
    const integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program);

bool is_protocol_enabled(const integration_acls_t& acls,
                         const bulwark::schema::integration_program_t& program,
                         bulwark::schema::protocol_bitflag_t bitflag);

std::optional<bulwark::schema::bytes_t> find_policy(
    const integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocol_bitflag_t bitflag);

/// Insert or replace the policy for one protocol. The protocol must be
/// enabled (integration_not_enabled / protocol_not_enabled otherwise).
edit_result_t set_protocol_policy(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocol_bitflag_t bitflag,
    bulwark::schema::bytes_t data);

}  // namespace bulwark::acl
