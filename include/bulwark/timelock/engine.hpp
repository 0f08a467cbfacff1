#pragma once
#include <bulwark/schema/enum_string.hpp>
#include <bulwark/schema/policy_error_code.hpp>
#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/state_field.hpp>
#include <bulwark/schema/state_mutation.hpp>
#include <bulwark/schema/vault_state.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Staging queue in front of the live vault fields. A vault is idle (nothing
// staged), staged (waiting on expires_at) or ready (now >= expires_at); ready
// is computed and never stored.
namespace bulwark::timelock {

enum class timelock_status_t : uint8_t { idle = 0, staged = 1, ready = 2 };

inline constexpr auto kTimelockStatusMappings = std::array{
    std::pair<std::string_view, timelock_status_t>{"idle",
                                                   timelock_status_t::idle},
    std::pair<std::string_view, timelock_status_t>{"staged",
                                                   timelock_status_t::staged},
    std::pair<std::string_view, timelock_status_t>{"ready",
                                                   timelock_status_t::ready},
};

inline constexpr std::string_view to_string(const timelock_status_t value) {
  return bulwark::schema::to_string(value, kTimelockStatusMappings)
      .value_or("unknown");
}

using timelock_result_t = std::optional<bulwark::schema::policy_error_code>;

timelock_status_t status(const bulwark::schema::vault_state_t& state,
                         bulwark::schema::timestamp_seconds_t now);

/// Seconds until the staged changes can be applied; 0 when idle or ready.
uint64_t remaining_seconds(const bulwark::schema::vault_state_t& state,
                           bulwark::schema::timestamp_seconds_t now);

/// Upsert `update` into the pending queue. The first staged update starts
/// the clock (expires_at = now + duration); later ones never move it.
void stage(bulwark::schema::vault_state_t& state,
           bulwark::schema::field_update_t update,
           bulwark::schema::timestamp_seconds_t now);

/// Write straight to live state when the duration is 0, stage otherwise.
/// An update equal to the projected value is dropped.
void submit(bulwark::schema::vault_state_t& state,
            bulwark::schema::field_update_t update,
            bulwark::schema::timestamp_seconds_t now);

void write_live(bulwark::schema::vault_state_t& state,
                bulwark::schema::field_update_t update);

bulwark::schema::field_update_t live_value(
    const bulwark::schema::vault_state_t& state,
    bulwark::schema::state_field_t field);

std::optional<bulwark::schema::field_update_t> staged_value(
    const bulwark::schema::vault_state_t& state,
    bulwark::schema::state_field_t field);

/// The staged value when there is one, the live value otherwise. Edits are
/// built on top of this so successive staged changes accumulate.
bulwark::schema::field_update_t projected(
    const bulwark::schema::vault_state_t& state,
    bulwark::schema::state_field_t field);

/// nothing_staged or timelock_not_expired, otherwise commits every pending
/// update to live state and clears the queue.
timelock_result_t apply(bulwark::schema::vault_state_t& state,
                        bulwark::schema::timestamp_seconds_t now);

/// nothing_staged, otherwise clears the queue. Live state is not touched.
timelock_result_t cancel(bulwark::schema::vault_state_t& state);

/// Single write taking the authority from `before` to `after`: the live
/// fields that differ, plus the pending queue when it changed.
bulwark::schema::state_mutation_t make_mutation(
    const bulwark::schema::vault_state_t& before,
    const bulwark::schema::vault_state_t& after);

/// Authority side of make_mutation. Does not touch the revision.
void apply_mutation(bulwark::schema::vault_state_t& state,
                    const bulwark::schema::state_mutation_t& mutation);

}  // namespace bulwark::timelock
