#include <bulwark/acl/delegate_access.hpp>

#include <algorithm>
#include <iterator>

namespace bulwark::acl {

namespace {

template <typename Range, typename Predicate>
auto find_in(Range& range, Predicate predicate) {
  return std::find_if(std::begin(range), std::end(range), predicate);
}

auto by_pubkey(const bulwark::schema::pubkey_t& delegate) {
  return [&delegate](const auto& acl) { return acl.pubkey == delegate; };
}

auto by_program(const bulwark::schema::integration_program_t& program) {
  return [&program](const auto& entry) {
    return entry.integration_program == program;
  };
}

auto by_bitflag(const bulwark::schema::protocol_bitflag_t bitflag) {
  return [bitflag](const auto& entry) {
    return entry.protocol_bitflag == bitflag;
  };
}

}  // namespace

void grant(delegate_acls_t& acls,
           const bulwark::schema::pubkey_t& delegate,
           const bulwark::schema::integration_program_t& program,
           const bulwark::schema::protocol_bitflag_t bitflag,
           const bulwark::schema::permissions_bitmask_t mask) {
  auto acl = find_in(acls, by_pubkey(delegate));
  if (acl == std::end(acls)) {
    acls.push_back(bulwark::schema::delegate_acl_t{.pubkey = delegate});
    acl = std::prev(std::end(acls));
  }

  auto& integrations = acl->integration_permissions;
  auto integration = find_in(integrations, by_program(program));
  if (integration == std::end(integrations)) {
    integrations.push_back(bulwark::schema::integration_permissions_t{
        .integration_program = program});
    integration = std::prev(std::end(integrations));
  }

  auto& protocols = integration->protocol_permissions;
  auto protocol = find_in(protocols, by_bitflag(bitflag));
  if (protocol == std::end(protocols)) {
    protocols.push_back(
        bulwark::schema::protocol_permissions_t{.protocol_bitflag = bitflag});
    protocol = std::prev(std::end(protocols));
  }
  protocol->permissions_bitmask |= mask;
}

void revoke(delegate_acls_t& acls,
            const bulwark::schema::pubkey_t& delegate,
            const bulwark::schema::integration_program_t& program,
            const bulwark::schema::protocol_bitflag_t bitflag,
            const bulwark::schema::permissions_bitmask_t mask) {
  auto acl = find_in(acls, by_pubkey(delegate));
  if (acl == std::end(acls)) {
    return;
  }
  auto& integrations = acl->integration_permissions;
  auto integration = find_in(integrations, by_program(program));
  if (integration == std::end(integrations)) {
    return;
  }
  auto& protocols = integration->protocol_permissions;
  auto protocol = find_in(protocols, by_bitflag(bitflag));
  if (protocol == std::end(protocols)) {
    return;
  }

  protocol->permissions_bitmask &= ~mask;
  if (protocol->permissions_bitmask == 0) {
    protocols.erase(protocol);
  }
  if (protocols.empty()) {
    integrations.erase(integration);
  }
}

bool revoke_all(delegate_acls_t& acls,
                const bulwark::schema::pubkey_t& delegate) {
  auto acl = find_in(acls, by_pubkey(delegate));
  if (acl == std::end(acls)) {
    return false;
  }
  acls.erase(acl);
  return true;
}

bool set_expiry(delegate_acls_t& acls,
                const bulwark::schema::pubkey_t& delegate,
                const bulwark::schema::timestamp_seconds_t expires_at) {
  auto acl = find_in(acls, by_pubkey(delegate));
  if (acl == std::end(acls)) {
    return false;
  }
  acl->expires_at = expires_at;
  return true;
}

bool is_expired(const bulwark::schema::delegate_acl_t& acl,
                const bulwark::schema::timestamp_seconds_t now) {
  return acl.expires_at != 0 && now >= acl.expires_at;
}

bool has_permission(const delegate_acls_t& acls,
                    const bulwark::schema::pubkey_t& delegate,
                    const bulwark::schema::integration_program_t& program,
                    const bulwark::schema::protocol_bitflag_t bitflag,
                    const bulwark::schema::permissions_bitmask_t permission,
                    const bulwark::schema::timestamp_seconds_t now) {
  auto acl = find_in(acls, by_pubkey(delegate));
  if (acl == std::end(acls) || is_expired(*acl, now) || permission == 0) {
    return false;
  }
  return (granted(*acl, program, bitflag) & permission) == permission;
}

std::size_t purge_expired(delegate_acls_t& acls,
                          const bulwark::schema::timestamp_seconds_t now) {
  return static_cast<std::size_t>(std::erase_if(
      acls, [now](const auto& acl) { return is_expired(acl, now); }));
}

std::optional<bulwark::schema::delegate_acl_t> find_delegate(
    const delegate_acls_t& acls,
    const bulwark::schema::pubkey_t& delegate) {
  auto acl = find_in(acls, by_pubkey(delegate));
  if (acl == std::end(acls)) {
    return std::nullopt;
  }
  return *acl;
}

bulwark::schema::permissions_bitmask_t granted(
    const bulwark::schema::delegate_acl_t& acl,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocol_bitflag_t bitflag) {
  auto integration = find_in(acl.integration_permissions, by_program(program));
  if (integration == std::end(acl.integration_permissions)) {
    return 0;
  }
  auto protocol =
      find_in(integration->protocol_permissions, by_bitflag(bitflag));
  if (protocol == std::end(integration->protocol_permissions)) {
    return 0;
  }
  return protocol->permissions_bitmask;
}

}  // namespace bulwark::acl
