#include <bulwark/acl/integration_access.hpp>

#include <algorithm>
#include <iterator>

namespace bulwark::acl {

namespace {

template <typename Acls>
auto find_acl(Acls& acls,
              const bulwark::schema::integration_program_t& program) {
  return std::find_if(std::begin(acls), std::end(acls), [&](const auto& acl) {
    return acl.integration_program == program;
  });
}

}  // namespace

edit_result_t enable_integration(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocols_bitmask_t mask) {
  if (find_acl(acls, program) != std::end(acls)) {
    return bulwark::schema::policy_error_code::integration_already_enabled;
  }
  acls.push_back(bulwark::schema::integration_acl_t{
      .integration_program = program, .protocols_bitmask = mask});
  return std::nullopt;
}

edit_result_t disable_integration(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program) {
  auto acl = find_acl(acls, program);
  if (acl == std::end(acls)) {
    return bulwark::schema::policy_error_code::integration_not_enabled;
  }
  acl->protocols_bitmask = 0;
  return std::nullopt;
}

edit_result_t set_protocols(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocols_bitmask_t mask,
    const bool enabled) {
  auto acl = find_acl(acls, program);
  if (acl == std::end(acls)) {
    return bulwark::schema::policy_error_code::integration_not_enabled;
  }
  if (enabled) {
    acl->protocols_bitmask =
        static_cast<bulwark::schema::protocols_bitmask_t>(
            acl->protocols_bitmask | mask);
  } else {
    acl->protocols_bitmask =
        static_cast<bulwark::schema::protocols_bitmask_t>(
            acl->protocols_bitmask & ~mask);
  }
  return std::nullopt;
}

std::optional<bulwark::schema::integration_acl_t> find_integration(
    const integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program) {
  auto acl = find_acl(acls, program);
  if (acl == std::end(acls)) {
    return std::nullopt;
  }
  return *acl;
}

bool is_protocol_enabled(const integration_acls_t& acls,
                         const bulwark::schema::integration_program_t& program,
                         const bulwark::schema::protocol_bitflag_t bitflag) {
  auto acl = find_acl(acls, program);
  return acl != std::end(acls) && bitflag != 0 &&
         (acl->protocols_bitmask & bitflag) == bitflag;
}

std::optional<bulwark::schema::bytes_t> find_policy(
    const integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocol_bitflag_t bitflag) {
  auto acl = find_acl(acls, program);
  if (acl == std::end(acls)) {
    return std::nullopt;
  }
  for (const auto& policy : acl->protocol_policies) {
    if (policy.protocol_bitflag == bitflag) {
      return policy.data;
    }
  }
  return std::nullopt;
}

edit_result_t set_protocol_policy(
    integration_acls_t& acls,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocol_bitflag_t bitflag,
    bulwark::schema::bytes_t data) {
  auto acl = find_acl(acls, program);
  if (acl == std::end(acls)) {
    return bulwark::schema::policy_error_code::integration_not_enabled;
  }
  if ((acl->protocols_bitmask & bitflag) == 0) {
    return bulwark::schema::policy_error_code::protocol_not_enabled;
  }
  auto& policies = acl->protocol_policies;
  auto policy = std::find_if(
      std::begin(policies), std::end(policies),
      [&](const auto& entry) { return entry.protocol_bitflag == bitflag; });
  if (policy == std::end(policies)) {
    policies.push_back(bulwark::schema::protocol_policy_t{
        .protocol_bitflag = bitflag, .data = std::move(data)});
  } else {
    policy->data = std::move(data);
  }
  return std::nullopt;
}

}  // namespace bulwark::acl
