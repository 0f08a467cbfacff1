#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bulwark::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using pubkey_t = hash32_t;
using integration_program_t = pubkey_t;
using transaction_id_t = hash32_t;

// Protocols of one integration are single bits in a 16-bit mask; permissions
// of one protocol are bits in a 64-bit mask.
using protocol_bitflag_t = uint16_t;
using protocols_bitmask_t = uint16_t;
using permissions_bitmask_t = uint64_t;

using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base58(const bytes_view_t& bytes);
std::string to_base58(const pubkey_t& key);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

/// Parse a public key from base58 (Solana style) or 64-char hex.
std::optional<pubkey_t> try_parse_pubkey(std::string_view text);

/// Shortened base58 form used in diff listings ("AbCdEfGh...").
std::string short_key(const pubkey_t& key);

}  // namespace bulwark::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
