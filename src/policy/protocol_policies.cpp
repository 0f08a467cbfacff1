#include <bulwark/policy/protocol_policies.hpp>

#include <spdlog/fmt/fmt.h>

namespace bulwark::policy {

namespace {

template <typename T>
void describe_list(std::vector<std::string>& lines,
                   const std::string_view title,
                   const allowlist<T>& list,
                   const empty_allowlist_t semantics) {
  if (list.empty()) {
    lines.push_back(fmt::format("{}: (empty: {})", title,
                                semantics == empty_allowlist_t::unrestricted
                                    ? "all allowed"
                                    : "none allowed"));
    return;
  }
  lines.push_back(fmt::format("{}:", title));
  auto index = std::size_t{0};
  for (const auto& entry : list.entries()) {
    lines.push_back(
        fmt::format("[{}] {}", index++, principal_traits<T>::to_string(entry)));
  }
}

}  // namespace

bulwark::schema::bytes_t drift_protocol_policy_t::encode() const {
  auto out = wire::writer{};
  encode_allowlist(out, spot_markets);
  encode_allowlist(out, perp_markets);
  encode_allowlist(out, borrow_allowlist);
  return out.take();
}

std::optional<drift_protocol_policy_t> drift_protocol_policy_t::try_decode(
    const bulwark::schema::bytes_view_t& bytes) {
  auto in = wire::reader{bytes};
  auto spot = decode_allowlist<market_index_t>(in);
  if (!spot) {
    return std::nullopt;
  }
  auto perp = decode_allowlist<market_index_t>(in);
  if (!perp) {
    return std::nullopt;
  }
  auto borrow = decode_allowlist<bulwark::schema::pubkey_t>(in);
  if (!borrow || !in.exhausted()) {
    return std::nullopt;
  }
  return drift_protocol_policy_t{.spot_markets = std::move(*spot),
                                 .perp_markets = std::move(*perp),
                                 .borrow_allowlist = std::move(*borrow)};
}

bulwark::schema::bytes_t kamino_lending_policy_t::encode() const {
  auto out = wire::writer{};
  encode_allowlist(out, markets);
  encode_allowlist(out, borrow_allowlist);
  return out.take();
}

std::optional<kamino_lending_policy_t> kamino_lending_policy_t::try_decode(
    const bulwark::schema::bytes_view_t& bytes) {
  auto in = wire::reader{bytes};
  auto markets = decode_allowlist<bulwark::schema::pubkey_t>(in);
  if (!markets) {
    return std::nullopt;
  }
  auto borrow = decode_allowlist<bulwark::schema::pubkey_t>(in);
  if (!borrow || !in.exhausted()) {
    return std::nullopt;
  }
  return kamino_lending_policy_t{.markets = std::move(*markets),
                                 .borrow_allowlist = std::move(*borrow)};
}

std::optional<decoded_policy_t> try_decode_policy(
    const policy_schema_t schema,
    const bulwark::schema::bytes_view_t& bytes) {
  auto wrap = [&](auto decoded) -> std::optional<decoded_policy_t> {
    if (!decoded) {
      return std::nullopt;
    }
    return decoded_policy_t{.schema = schema, .value = std::move(*decoded)};
  };

  switch (schema) {
    case policy_schema_t::transfer:
    case policy_schema_t::drift_vaults:
    case policy_schema_t::kamino_vaults:
      return wrap(transfer_policy_t::try_decode(bytes));
    case policy_schema_t::jupiter_swap:
      return wrap(jupiter_swap_policy_t::try_decode(bytes));
    case policy_schema_t::cctp:
      return wrap(cctp_policy_t::try_decode(bytes));
    case policy_schema_t::drift_protocol:
      return wrap(drift_protocol_policy_t::try_decode(bytes));
    case policy_schema_t::kamino_lending:
      return wrap(kamino_lending_policy_t::try_decode(bytes));
    case policy_schema_t::none:
      break;
  }
  return std::nullopt;
}

std::optional<bulwark::schema::bytes_t> default_policy_bytes(
    const policy_schema_t schema) {
  switch (schema) {
    case policy_schema_t::transfer:
    case policy_schema_t::drift_vaults:
    case policy_schema_t::kamino_vaults:
      return transfer_policy_t{}.encode();
    case policy_schema_t::jupiter_swap:
      return jupiter_swap_policy_t{}.encode();
    case policy_schema_t::cctp:
      return cctp_policy_t{}.encode();
    case policy_schema_t::drift_protocol:
      return drift_protocol_policy_t{}.encode();
    case policy_schema_t::kamino_lending:
      return kamino_lending_policy_t{}.encode();
    case policy_schema_t::none:
      break;
  }
  return std::nullopt;
}

std::vector<std::string> describe_policy(const decoded_policy_t& policy,
                                         const empty_allowlist_t semantics) {
  auto lines = std::vector<std::string>{};
  std::visit(
      overloaded{
          [&](const transfer_policy_t& value) {
            auto title = policy.schema == policy_schema_t::transfer
                             ? "Transfer destinations allowlist"
                             : "Vaults allowlist";
            describe_list(lines, title, value.allowed, semantics);
          },
          [&](const jupiter_swap_policy_t& value) {
            lines.push_back(fmt::format("Max slippage: {} bps",
                                        value.trailer.max_slippage_bps));
            describe_list(lines, "Swap allowlist", value.allowed, semantics);
          },
          [&](const cctp_policy_t& value) {
            describe_list(lines, "CCTP destinations allowlist", value.allowed,
                          semantics);
          },
          [&](const drift_protocol_policy_t& value) {
            describe_list(lines, "Spot markets allowlist", value.spot_markets,
                          semantics);
            describe_list(lines, "Perp markets allowlist", value.perp_markets,
                          semantics);
            describe_list(lines, "Borrow allowlist", value.borrow_allowlist,
                          semantics);
          },
          [&](const kamino_lending_policy_t& value) {
            describe_list(lines, "Lending markets allowlist", value.markets,
                          semantics);
            describe_list(lines, "Borrow allowlist", value.borrow_allowlist,
                          semantics);
          }},
      policy.value);
  return lines;
}

}  // namespace bulwark::policy
