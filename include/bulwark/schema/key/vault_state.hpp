#pragma once
#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/state_mutation.hpp>
#include <bulwark/schema/vault_state.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <iterator>
#include <string_view>

// Schema key type: vault state.
// Access workflow: Keys for the live vault record and its accepted mutation
// log. Prefixes are raw bytes so a vault's log can be listed by prefix.
namespace bulwark::schema::key {

inline constexpr auto kVaultStatePrefix = std::string_view{"VAULT|STATE|"};
inline constexpr auto kVaultLogPrefix = std::string_view{"VAULT|TX|"};

template <typename Encoder>
bulwark::schema::bytes_t make_vault_state_key(
    Encoder& encoder,
    const bulwark::schema::pubkey_t& vault_id) {
  auto output = make_bytes(kVaultStatePrefix);
  encoder.encode(vault_id, output);
  return output;
}

template <typename Encoder>
bulwark::schema::bytes_t make_key(
    Encoder& encoder,
    const bulwark::schema::vault_state<1>& value) {
  return make_vault_state_key(encoder, value.vault_id);
}

template <typename Encoder>
bulwark::schema::bytes_t make_vault_log_prefix(
    Encoder& encoder,
    const bulwark::schema::pubkey_t& vault_id) {
  auto output = make_bytes(kVaultLogPrefix);
  encoder.encode(vault_id, output);
  output.push_back('|');
  return output;
}

/// Revision is stored big endian so the log lists in acceptance order.
template <typename Encoder>
bulwark::schema::bytes_t make_vault_log_key(
    Encoder& encoder,
    const bulwark::schema::pubkey_t& vault_id,
    const uint64_t revision) {
  auto output = make_vault_log_prefix(encoder, vault_id);
  auto big = boost::endian::native_to_big(revision);
  auto bytes = reinterpret_cast<const uint8_t*>(&big);
  output.insert(std::end(output), bytes, bytes + sizeof(big));
  return output;
}

}  // namespace bulwark::schema::key
