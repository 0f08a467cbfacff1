#pragma once

#include <bulwark/schema/delegate_acl.hpp>
#include <bulwark/schema/enum_string.hpp>
#include <bulwark/schema/integration_acl.hpp>
#include <bulwark/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: state field.
// Access workflow: The timelock protected fields of a vault and the typed
// full-replacement value proposed for each of them.
namespace bulwark::schema {

enum class state_field_t : uint8_t {
  integration_acls = 0,
  delegate_acls = 1,
  assets = 2,
  borrowable = 3,
  timelock_duration = 4
};

inline constexpr auto kStateFieldMappings = std::array{
    std::pair<std::string_view, state_field_t>{
        "integrationAcls", state_field_t::integration_acls},
    std::pair<std::string_view, state_field_t>{"delegateAcls",
                                               state_field_t::delegate_acls},
    std::pair<std::string_view, state_field_t>{"assets",
                                               state_field_t::assets},
    std::pair<std::string_view, state_field_t>{"borrowable",
                                               state_field_t::borrowable},
    std::pair<std::string_view, state_field_t>{
        "timelockDuration", state_field_t::timelock_duration},
};

inline constexpr std::string_view to_string(const state_field_t value) {
  return to_string(value, kStateFieldMappings).value_or("unknown");
}

struct integration_acls_update_t final {
  std::vector<integration_acl_t> value;
  bool operator==(const integration_acls_update_t&) const = default;
};

struct delegate_acls_update_t final {
  std::vector<delegate_acl_t> value;
  bool operator==(const delegate_acls_update_t&) const = default;
};

struct assets_update_t final {
  std::vector<pubkey_t> value;
  bool operator==(const assets_update_t&) const = default;
};

struct borrowable_update_t final {
  std::vector<pubkey_t> value;
  bool operator==(const borrowable_update_t&) const = default;
};

struct timelock_duration_update_t final {
  duration_seconds_t value{};
  bool operator==(const timelock_duration_update_t&) const = default;
};

// Alternative index matches state_field_t.
using field_update_t = std::variant<integration_acls_update_t,
                                    delegate_acls_update_t,
                                    assets_update_t,
                                    borrowable_update_t,
                                    timelock_duration_update_t>;

inline state_field_t field_of(const field_update_t& update) {
  return static_cast<state_field_t>(update.index());
}

}  // namespace bulwark::schema
