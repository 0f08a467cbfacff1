#pragma once
#include <bulwark/policy/wire.hpp>
#include <bulwark/schema/primitives.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

// Principal kinds that can appear in an allowlist, with their fixed-size
// payload records.
namespace bulwark::policy {

/// Cross-chain destination: both components take part in equality.
struct cctp_destination_t final {
  uint32_t domain{};
  bulwark::schema::pubkey_t address{};

  bool operator==(const cctp_destination_t&) const = default;
};

/// Drift spot or perp market index.
using market_index_t = uint16_t;

template <typename T>
struct principal_traits;

template <>
struct principal_traits<bulwark::schema::pubkey_t> final {
  static constexpr std::size_t kRecordSize = 32;

  static void write(wire::writer& out, const bulwark::schema::pubkey_t& key) {
    out.put(key);
  }

  static std::optional<bulwark::schema::pubkey_t> read(wire::reader& in) {
    return in.get_key();
  }

  static std::optional<bulwark::schema::pubkey_t> try_parse(
      const std::string_view text) {
    return bulwark::schema::try_parse_pubkey(text);
  }

  static std::string to_string(const bulwark::schema::pubkey_t& key) {
    return bulwark::schema::to_base58(key);
  }
};

template <>
struct principal_traits<cctp_destination_t> final {
  static constexpr std::size_t kRecordSize = 36;

  static void write(wire::writer& out, const cctp_destination_t& destination) {
    out.put(destination.domain);
    out.put(destination.address);
  }

  static std::optional<cctp_destination_t> read(wire::reader& in) {
    auto domain = in.get<uint32_t>();
    if (!domain) {
      return std::nullopt;
    }
    auto address = in.get_key();
    if (!address) {
      return std::nullopt;
    }
    return cctp_destination_t{.domain = *domain, .address = *address};
  }

  // "<domain>:<address>"
  static std::optional<cctp_destination_t> try_parse(
      const std::string_view text) {
    auto separator = text.find(':');
    if (separator == std::string_view::npos) {
      return std::nullopt;
    }
    auto domain = uint32_t{};
    auto domain_text = text.substr(0, separator);
    auto [end, ec] = std::from_chars(
        domain_text.data(), domain_text.data() + domain_text.size(), domain);
    if (ec != std::errc{} || end != domain_text.data() + domain_text.size()) {
      return std::nullopt;
    }
    auto address = bulwark::schema::try_parse_pubkey(text.substr(separator + 1));
    if (!address) {
      return std::nullopt;
    }
    return cctp_destination_t{.domain = domain, .address = *address};
  }

  static std::string to_string(const cctp_destination_t& destination) {
    return fmt::format("domain {} address {}", destination.domain,
                       bulwark::schema::to_base58(destination.address));
  }
};

template <>
struct principal_traits<market_index_t> final {
  static constexpr std::size_t kRecordSize = 2;

  static void write(wire::writer& out, const market_index_t market) {
    out.put(market);
  }

  static std::optional<market_index_t> read(wire::reader& in) {
    return in.get<market_index_t>();
  }

  static std::optional<market_index_t> try_parse(const std::string_view text) {
    auto market = market_index_t{};
    auto [end, ec] =
        std::from_chars(text.data(), text.data() + text.size(), market);
    if (text.empty() || ec != std::errc{} ||
        end != text.data() + text.size()) {
      return std::nullopt;
    }
    return market;
  }

  static std::string to_string(const market_index_t market) {
    return std::to_string(market);
  }
};

}  // namespace bulwark::policy
