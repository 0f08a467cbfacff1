#pragma once
#include <bulwark/schema/delegate_acl.hpp>
#include <bulwark/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <vector>

// Delegate ACL edits. Every function works on a full copy of the field so the
// caller can stage or write the result as one replacement value.
namespace bulwark::acl {

using delegate_acls_t = std::vector<bulwark::schema::delegate_acl_t>;

/// OR `mask` into the delegate's entry for (program, bitflag), creating the
/// delegate record (expires_at 0) and the entry when missing.
void grant(delegate_acls_t& acls,
           const bulwark::schema::pubkey_t& delegate,
           const bulwark::schema::integration_program_t& program,
           bulwark::schema::protocol_bitflag_t bitflag,
           bulwark::schema::permissions_bitmask_t mask);

/// Clear `mask` from the delegate's entry. A missing record or entry is a
/// no-op; entries reaching zero are dropped but the delegate record stays.
void revoke(delegate_acls_t& acls,
            const bulwark::schema::pubkey_t& delegate,
            const bulwark::schema::integration_program_t& program,
            bulwark::schema::protocol_bitflag_t bitflag,
            bulwark::schema::permissions_bitmask_t mask);

/// Remove the delegate record entirely. false when there is none.
bool revoke_all(delegate_acls_t& acls,
                const bulwark::schema::pubkey_t& delegate);

/// false when there is no record for the delegate.
bool set_expiry(delegate_acls_t& acls,
                const bulwark::schema::pubkey_t& delegate,
                bulwark::schema::timestamp_seconds_t expires_at);

bool is_expired(const bulwark::schema::delegate_acl_t& acl,
                bulwark::schema::timestamp_seconds_t now);

bool has_permission(const delegate_acls_t& acls,
                    const bulwark::schema::pubkey_t& delegate,
                    const bulwark::schema::integration_program_t& program,
                    bulwark::schema::protocol_bitflag_t bitflag,
                    bulwark::schema::permissions_bitmask_t permission,
                    bulwark::schema::timestamp_seconds_t now);

/// Returns the number of expired records removed.
std::size_t purge_expired(delegate_acls_t& acls,
                          bulwark::schema::timestamp_seconds_t now);

std::optional<bulwark::schema::delegate_acl_t> find_delegate(
    const delegate_acls_t& acls,
    const bulwark::schema::pubkey_t& delegate);

/// Granted bits for (program, bitflag); 0 when absent.
bulwark::schema::permissions_bitmask_t granted(
    const bulwark::schema::delegate_acl_t& acl,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocol_bitflag_t bitflag);

}  // namespace bulwark::acl
