#include <bulwark/timelock/engine.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace bulwark::timelock {

namespace {

auto find_update(std::vector<bulwark::schema::field_update_t>& updates,
                 const bulwark::schema::state_field_t field) {
  return std::find_if(std::begin(updates), std::end(updates),
                      [field](const auto& update) {
                        return bulwark::schema::field_of(update) == field;
                      });
}

}  // namespace

timelock_status_t status(const bulwark::schema::vault_state_t& state,
                         const bulwark::schema::timestamp_seconds_t now) {
  if (state.pending.updates.empty()) {
    return timelock_status_t::idle;
  }
  if (now < state.pending.expires_at) {
    return timelock_status_t::staged;
  }
  return timelock_status_t::ready;
}

uint64_t remaining_seconds(const bulwark::schema::vault_state_t& state,
                           const bulwark::schema::timestamp_seconds_t now) {
  if (status(state, now) != timelock_status_t::staged) {
    return 0;
  }
  return state.pending.expires_at - now;
}

void stage(bulwark::schema::vault_state_t& state,
           bulwark::schema::field_update_t update,
           const bulwark::schema::timestamp_seconds_t now) {
  auto& updates = state.pending.updates;
  if (updates.empty()) {
    state.pending.expires_at = now + state.timelock_duration;
  }
  auto field = bulwark::schema::field_of(update);
  auto existing = find_update(updates, field);
  if (existing != std::end(updates)) {
    *existing = std::move(update);
    return;
  }
  // keep the queue ordered by field
  auto position = std::find_if(
      std::begin(updates), std::end(updates), [field](const auto& staged) {
        return bulwark::schema::field_of(staged) > field;
      });
  updates.insert(position, std::move(update));
}

void submit(bulwark::schema::vault_state_t& state,
            bulwark::schema::field_update_t update,
            const bulwark::schema::timestamp_seconds_t now) {
  // an update matching the projected value must not arm a timelock
  if (update == projected(state, bulwark::schema::field_of(update))) {
    return;
  }
  if (state.timelock_duration == 0) {
    write_live(state, std::move(update));
    return;
  }
  stage(state, std::move(update), now);
}

void write_live(bulwark::schema::vault_state_t& state,
                bulwark::schema::field_update_t update) {
  std::visit(
      overloaded{
          [&](bulwark::schema::integration_acls_update_t& value) {
            state.integration_acls = std::move(value.value);
          },
          [&](bulwark::schema::delegate_acls_update_t& value) {
            state.delegate_acls = std::move(value.value);
          },
          [&](bulwark::schema::assets_update_t& value) {
            state.assets = std::move(value.value);
          },
          [&](bulwark::schema::borrowable_update_t& value) {
            state.borrowable = std::move(value.value);
          },
          [&](bulwark::schema::timelock_duration_update_t& value) {
            state.timelock_duration = value.value;
          }},
      update);
}

bulwark::schema::field_update_t live_value(
    const bulwark::schema::vault_state_t& state,
    const bulwark::schema::state_field_t field) {
  switch (field) {
    case bulwark::schema::state_field_t::integration_acls:
      return bulwark::schema::integration_acls_update_t{state.integration_acls};
    case bulwark::schema::state_field_t::delegate_acls:
      return bulwark::schema::delegate_acls_update_t{state.delegate_acls};
    case bulwark::schema::state_field_t::assets:
      return bulwark::schema::assets_update_t{state.assets};
    case bulwark::schema::state_field_t::borrowable:
      return bulwark::schema::borrowable_update_t{state.borrowable};
    case bulwark::schema::state_field_t::timelock_duration:
      break;
  }
  return bulwark::schema::timelock_duration_update_t{state.timelock_duration};
}

std::optional<bulwark::schema::field_update_t> staged_value(
    const bulwark::schema::vault_state_t& state,
    const bulwark::schema::state_field_t field) {
  for (const auto& update : state.pending.updates) {
    if (bulwark::schema::field_of(update) == field) {
      return update;
    }
  }
  return std::nullopt;
}

bulwark::schema::field_update_t projected(
    const bulwark::schema::vault_state_t& state,
    const bulwark::schema::state_field_t field) {
  if (auto staged = staged_value(state, field)) {
    return std::move(*staged);
  }
  return live_value(state, field);
}

timelock_result_t apply(bulwark::schema::vault_state_t& state,
                        const bulwark::schema::timestamp_seconds_t now) {
  switch (status(state, now)) {
    case timelock_status_t::idle:
      return bulwark::schema::policy_error_code::nothing_staged;
    case timelock_status_t::staged:
      return bulwark::schema::policy_error_code::timelock_not_expired;
    case timelock_status_t::ready:
      break;
  }
  auto pending = std::exchange(state.pending, bulwark::schema::pending_state_t{});
  for (auto& update : pending.updates) {
    write_live(state, std::move(update));
  }
  return std::nullopt;
}

timelock_result_t cancel(bulwark::schema::vault_state_t& state) {
  if (state.pending.updates.empty()) {
    return bulwark::schema::policy_error_code::nothing_staged;
  }
  state.pending = bulwark::schema::pending_state_t{};
  return std::nullopt;
}

bulwark::schema::state_mutation_t make_mutation(
    const bulwark::schema::vault_state_t& before,
    const bulwark::schema::vault_state_t& after) {
  auto mutation = bulwark::schema::state_mutation_t{};
  mutation.vault_id = before.vault_id;
  mutation.expected_revision = before.revision;
  for (const auto field : {bulwark::schema::state_field_t::integration_acls,
                           bulwark::schema::state_field_t::delegate_acls,
                           bulwark::schema::state_field_t::assets,
                           bulwark::schema::state_field_t::borrowable,
                           bulwark::schema::state_field_t::timelock_duration}) {
    auto next = live_value(after, field);
    if (next != live_value(before, field)) {
      mutation.live_updates.push_back(std::move(next));
    }
  }
  if (after.pending != before.pending) {
    mutation.pending = after.pending;
  }
  return mutation;
}

void apply_mutation(bulwark::schema::vault_state_t& state,
                    const bulwark::schema::state_mutation_t& mutation) {
  for (const auto& update : mutation.live_updates) {
    write_live(state, update);
  }
  if (mutation.pending) {
    state.pending = *mutation.pending;
  }
}

}  // namespace bulwark::timelock
