#pragma once
#include <bulwark/ledger/state_store.hpp>
#include <bulwark/policy/registry.hpp>
#include <bulwark/schema/enum_string.hpp>
#include <bulwark/schema/operation_result.hpp>
#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/vault_state.hpp>
#include <bulwark/timelock/engine.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bulwark::execution {

using clock_fn_t = std::function<bulwark::schema::timestamp_seconds_t()>;

/// Every allowlist an operator can edit, one per (protocol, list).
enum class allowlist_target_t : uint8_t {
  transfer_destination = 0,
  swap_token = 1,
  cctp_destination = 2,
  drift_spot_market = 3,
  drift_perp_market = 4,
  drift_borrow = 5,
  drift_vault = 6,
  kamino_market = 7,
  kamino_borrow = 8,
  kamino_vault = 9
};

inline constexpr auto kAllowlistTargetMappings = std::array{
    std::pair<std::string_view, allowlist_target_t>{
        "transfer-destination", allowlist_target_t::transfer_destination},
    std::pair<std::string_view, allowlist_target_t>{
        "swap-token", allowlist_target_t::swap_token},
    std::pair<std::string_view, allowlist_target_t>{
        "cctp-destination", allowlist_target_t::cctp_destination},
    std::pair<std::string_view, allowlist_target_t>{
        "drift-spot-market", allowlist_target_t::drift_spot_market},
    std::pair<std::string_view, allowlist_target_t>{
        "drift-perp-market", allowlist_target_t::drift_perp_market},
    std::pair<std::string_view, allowlist_target_t>{
        "drift-borrow", allowlist_target_t::drift_borrow},
    std::pair<std::string_view, allowlist_target_t>{
        "drift-vault", allowlist_target_t::drift_vault},
    std::pair<std::string_view, allowlist_target_t>{
        "kamino-market", allowlist_target_t::kamino_market},
    std::pair<std::string_view, allowlist_target_t>{
        "kamino-borrow", allowlist_target_t::kamino_borrow},
    std::pair<std::string_view, allowlist_target_t>{
        "kamino-vault", allowlist_target_t::kamino_vault},
};

inline constexpr std::string_view to_string(const allowlist_target_t value) {
  return bulwark::schema::to_string(value, kAllowlistTargetMappings)
      .value_or("unknown");
}

struct listing_t final {
  bulwark::schema::operation_result_t result;
  std::vector<std::string> lines;
};

struct timelock_report_t final {
  bulwark::schema::operation_result_t result;
  bulwark::timelock::timelock_status_t status{
      bulwark::timelock::timelock_status_t::idle};
  bulwark::schema::duration_seconds_t duration{};
  bulwark::schema::timestamp_seconds_t expires_at{};
  uint64_t remaining{};
  std::vector<std::string> lines;
};

/// Runs operator requests against a vault: local validation, fetch, compute
/// the next state, one mutation, one retry on a stale read.
class controller final {
 public:
  controller(bulwark::ledger::state_reader& reader,
             bulwark::ledger::state_mutator& mutator,
             const bulwark::policy::registry& protocols,
             clock_fn_t clock);

  bulwark::schema::operation_result_t grant_permissions(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& delegate,
      std::string_view protocol,
      const std::vector<std::string>& permissions);

  bulwark::schema::operation_result_t revoke_permissions(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& delegate,
      std::string_view protocol,
      const std::vector<std::string>& permissions);

  /// Emergency lockout: removes the delegate from live state at once,
  /// bypassing the timelock, and from any staged delegate list.
  bulwark::schema::operation_result_t revoke_all(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& delegate);

  bulwark::schema::operation_result_t set_delegate_expiry(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& delegate,
      bulwark::schema::timestamp_seconds_t expires_at);

  bulwark::schema::operation_result_t purge_expired_delegates(
      const bulwark::schema::pubkey_t& vault);

  /// Enables the named protocols of one integration; all of its protocols
  /// when `protocols` is empty.
  bulwark::schema::operation_result_t enable_integration(
      const bulwark::schema::pubkey_t& vault,
      std::string_view integration,
      const std::vector<std::string>& protocols);

  bulwark::schema::operation_result_t disable_integration(
      const bulwark::schema::pubkey_t& vault,
      std::string_view integration);

  /// Toggle individual protocols of an already enabled integration.
  bulwark::schema::operation_result_t set_protocols_enabled(
      const bulwark::schema::pubkey_t& vault,
      const std::vector<std::string>& protocols,
      bool enabled);

  bulwark::schema::operation_result_t allowlist_add(
      const bulwark::schema::pubkey_t& vault,
      allowlist_target_t target,
      std::string_view principal);

  bulwark::schema::operation_result_t allowlist_remove(
      const bulwark::schema::pubkey_t& vault,
      allowlist_target_t target,
      std::string_view principal);

  bulwark::schema::operation_result_t set_max_slippage(
      const bulwark::schema::pubkey_t& vault,
      uint16_t max_slippage_bps);

  /// Empties the swap allowlist, which makes swaps unrestricted again.
  bulwark::schema::operation_result_t clear_swap_allowlist(
      const bulwark::schema::pubkey_t& vault);

  bulwark::schema::operation_result_t add_asset(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& asset);

  bulwark::schema::operation_result_t remove_asset(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& asset);

  bulwark::schema::operation_result_t add_borrowable(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& asset);

  bulwark::schema::operation_result_t remove_borrowable(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& asset);

  bulwark::schema::operation_result_t set_timelock_duration(
      const bulwark::schema::pubkey_t& vault,
      bulwark::schema::duration_seconds_t duration);

  bulwark::schema::operation_result_t apply_timelock(
      const bulwark::schema::pubkey_t& vault);

  bulwark::schema::operation_result_t cancel_timelock(
      const bulwark::schema::pubkey_t& vault);

  timelock_report_t timelock_report(const bulwark::schema::pubkey_t& vault);

  /// Decoded live policy of one protocol; policy_not_found when none was
  /// ever written.
  listing_t view_policy(const bulwark::schema::pubkey_t& vault,
                        std::string_view protocol);

  listing_t list_integrations(const bulwark::schema::pubkey_t& vault);
  listing_t list_delegates(const bulwark::schema::pubkey_t& vault);

 private:
  // Error result, or std::nullopt when `next` holds the state to submit.
  using compute_fn_t =
      std::function<std::optional<bulwark::schema::operation_result_t>(
          bulwark::schema::vault_state_t& next,
          bulwark::schema::timestamp_seconds_t now)>;

  bulwark::schema::operation_result_t execute(
      const bulwark::schema::pubkey_t& vault,
      std::string_view operation,
      const std::string& context,
      const compute_fn_t& compute);

  bulwark::schema::operation_result_t edit_permissions(
      const bulwark::schema::pubkey_t& vault,
      const bulwark::schema::pubkey_t& delegate,
      std::string_view protocol,
      const std::vector<std::string>& permissions,
      bool grant);

  bulwark::schema::operation_result_t edit_allowlist(
      const bulwark::schema::pubkey_t& vault,
      allowlist_target_t target,
      std::string_view principal,
      bool add);

  bulwark::schema::operation_result_t edit_pubkey_set(
      const bulwark::schema::pubkey_t& vault,
      bulwark::schema::state_field_t field,
      const bulwark::schema::pubkey_t& key,
      bool add);

  std::optional<bulwark::schema::vault_state_t> fetch(
      const bulwark::schema::pubkey_t& vault);

  bulwark::ledger::state_reader& reader_;
  bulwark::ledger::state_mutator& mutator_;
  const bulwark::policy::registry& protocols_;
  clock_fn_t clock_;
};

}  // namespace bulwark::execution
