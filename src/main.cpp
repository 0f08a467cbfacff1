#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <bulwark/execution/controller.hpp>
#include <bulwark/ledger/local_ledger.hpp>
#include <bulwark/policy/registry.hpp>
#include <bulwark/schema/primitives.hpp>

#include <charconv>
#include <chrono>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

using bulwark::execution::allowlist_target_t;
using bulwark::schema::operation_result_t;

int report(const operation_result_t& result) {
  if (!result.ok()) {
    auto code = static_cast<bulwark::schema::policy_error_code>(result.code);
    std::cerr << "error: " << result.log << " ("
              << bulwark::schema::to_string(code) << ")";
    if (!result.info.empty()) {
      std::cerr << ": " << result.info;
    }
    std::cerr << std::endl;
    return 1;
  }
  if (result.transaction_id) {
    std::cout << "ok " << bulwark::schema::to_hex(*result.transaction_id)
              << std::endl;
  } else {
    std::cout << "ok" << std::endl;
  }
  if (!result.info.empty()) {
    std::cout << result.info << std::endl;
  }
  return 0;
}

int report(const bulwark::execution::listing_t& listing) {
  if (!listing.result.ok()) {
    return report(listing.result);
  }
  for (const auto& line : listing.lines) {
    std::cout << line << std::endl;
  }
  return 0;
}

int usage_error(const std::string_view message) {
  std::cerr << "error: " << message << std::endl;
  return 1;
}

template <typename Integer>
std::optional<Integer> parse_number(const std::string_view text) {
  auto value = Integer{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

struct command_line final {
  std::string group;
  std::string action;
  std::vector<std::string> args;
  std::string protocol;
};

// "<add-verb> <key>" / "<remove-verb> <key>" against one allowlist
std::optional<int> allowlist_command(bulwark::execution::controller& engine,
                                     const bulwark::schema::pubkey_t& vault,
                                     const command_line& command,
                                     const std::string_view add_verb,
                                     const std::string_view remove_verb,
                                     const allowlist_target_t target) {
  if (command.action != add_verb && command.action != remove_verb) {
    return std::nullopt;
  }
  if (command.args.size() != 1) {
    return usage_error("expected exactly one allowlist entry");
  }
  if (command.action == add_verb) {
    return report(engine.allowlist_add(vault, target, command.args.front()));
  }
  return report(engine.allowlist_remove(vault, target, command.args.front()));
}

int dispatch(bulwark::execution::controller& engine,
             bulwark::ledger::local_ledger& ledger,
             const bulwark::schema::pubkey_t& vault,
             const command_line& command) {
  const auto& group = command.group;
  const auto& action = command.action;
  const auto& args = command.args;

  auto single_key = [&]() -> std::optional<bulwark::schema::pubkey_t> {
    if (args.size() != 1) {
      return std::nullopt;
    }
    return bulwark::schema::try_parse_pubkey(args.front());
  };

  if (group == "init") {
    return report(ledger.create_vault(vault));
  }

  if (group == "integration") {
    if (action == "list") {
      return report(engine.list_integrations(vault));
    }
    if (action == "enable" && !args.empty()) {
      auto protocols = std::vector<std::string>(std::next(std::begin(args)),
                                                std::end(args));
      return report(engine.enable_integration(vault, args.front(), protocols));
    }
    if (action == "disable" && args.size() == 1) {
      return report(engine.disable_integration(vault, args.front()));
    }
    if (action == "enable-protocols" || action == "disable-protocols") {
      return report(engine.set_protocols_enabled(
          vault, args, action == "enable-protocols"));
    }
    return usage_error(
        "integration list|enable <integration> [protocols...]|disable "
        "<integration>|enable-protocols <protocols...>|disable-protocols "
        "<protocols...>");
  }

  if (group == "delegate") {
    if (action == "list") {
      return report(engine.list_delegates(vault));
    }
    if (action == "purge-expired") {
      return report(engine.purge_expired_delegates(vault));
    }
    auto delegate = args.empty() ? std::nullopt
                                 : bulwark::schema::try_parse_pubkey(args.front());
    if (!delegate) {
      return usage_error("expected a delegate public key");
    }
    if (action == "grant" || action == "revoke") {
      if (command.protocol.empty()) {
        return usage_error("--protocol is required");
      }
      auto permissions = std::vector<std::string>(std::next(std::begin(args)),
                                                  std::end(args));
      if (action == "grant") {
        return report(engine.grant_permissions(vault, *delegate,
                                               command.protocol, permissions));
      }
      return report(engine.revoke_permissions(vault, *delegate,
                                              command.protocol, permissions));
    }
    if (action == "revoke-all") {
      return report(engine.revoke_all(vault, *delegate));
    }
    if (action == "set-expiry" && args.size() == 2) {
      auto expires_at = parse_number<uint64_t>(args[1]);
      if (!expires_at) {
        return usage_error("expected a unix timestamp");
      }
      return report(engine.set_delegate_expiry(vault, *delegate, *expires_at));
    }
    return usage_error(
        "delegate list|grant|revoke|revoke-all|set-expiry|purge-expired");
  }

  if (group == "transfer") {
    if (action == "view") {
      return report(engine.view_policy(vault, "SplToken"));
    }
    if (auto code = allowlist_command(engine, vault, command,
                                      "allowlist-destination",
                                      "remove-destination",
                                      allowlist_target_t::transfer_destination)) {
      return *code;
    }
    return usage_error(
        "transfer view|allowlist-destination <key>|remove-destination <key>");
  }

  if (group == "jupiter") {
    if (action == "view") {
      return report(engine.view_policy(vault, "JupiterSwap"));
    }
    if (action == "set-max-slippage" && args.size() == 1) {
      auto bps = parse_number<uint16_t>(args.front());
      if (!bps) {
        return usage_error("expected slippage in basis points");
      }
      return report(engine.set_max_slippage(vault, *bps));
    }
    if (action == "clear-allowlist") {
      return report(engine.clear_swap_allowlist(vault));
    }
    if (auto code =
            allowlist_command(engine, vault, command, "allowlist-token",
                              "remove-token", allowlist_target_t::swap_token)) {
      return *code;
    }
    return usage_error(
        "jupiter view|allowlist-token|remove-token|set-max-slippage "
        "<bps>|clear-allowlist");
  }

  if (group == "cctp") {
    if (action == "view") {
      return report(engine.view_policy(vault, "CCTP"));
    }
    if (auto code = allowlist_command(engine, vault, command,
                                      "allowlist-destination",
                                      "remove-destination",
                                      allowlist_target_t::cctp_destination)) {
      return *code;
    }
    return usage_error(
        "cctp view|allowlist-destination <domain:address>|remove-destination "
        "<domain:address>");
  }

  if (group == "drift") {
    if (action == "view") {
      return report(engine.view_policy(vault, "DriftProtocol"));
    }
    if ((action == "allowlist-market" || action == "remove-market") &&
        args.size() == 2) {
      auto target = args[0] == "spot"   ? allowlist_target_t::drift_spot_market
                    : args[0] == "perp" ? allowlist_target_t::drift_perp_market
                                        : std::optional<allowlist_target_t>{};
      if (!target) {
        return usage_error("market type must be spot or perp");
      }
      if (action == "allowlist-market") {
        return report(engine.allowlist_add(vault, *target, args[1]));
      }
      return report(engine.allowlist_remove(vault, *target, args[1]));
    }
    if (auto code = allowlist_command(engine, vault, command,
                                      "allowlist-borrowable",
                                      "remove-borrowable",
                                      allowlist_target_t::drift_borrow)) {
      return *code;
    }
    return usage_error(
        "drift view|allowlist-market <spot|perp> <index>|remove-market "
        "<spot|perp> <index>|allowlist-borrowable|remove-borrowable");
  }

  if (group == "drift-vaults") {
    if (action == "view") {
      return report(engine.view_policy(vault, "DriftVaults"));
    }
    if (auto code = allowlist_command(engine, vault, command, "allowlist-vault",
                                      "remove-vault",
                                      allowlist_target_t::drift_vault)) {
      return *code;
    }
    return usage_error("drift-vaults view|allowlist-vault|remove-vault");
  }

  if (group == "kamino") {
    if (action == "view") {
      return report(engine.view_policy(vault, "KaminoLend"));
    }
    if (auto code = allowlist_command(engine, vault, command,
                                      "allowlist-market", "remove-market",
                                      allowlist_target_t::kamino_market)) {
      return *code;
    }
    if (auto code = allowlist_command(engine, vault, command,
                                      "allowlist-borrowable",
                                      "remove-borrowable",
                                      allowlist_target_t::kamino_borrow)) {
      return *code;
    }
    return usage_error(
        "kamino view|allowlist-market|remove-market|allowlist-borrowable|"
        "remove-borrowable");
  }

  if (group == "kamino-vaults") {
    if (action == "view") {
      return report(engine.view_policy(vault, "KaminoVaults"));
    }
    if (auto code = allowlist_command(engine, vault, command, "allowlist-vault",
                                      "remove-vault",
                                      allowlist_target_t::kamino_vault)) {
      return *code;
    }
    return usage_error("kamino-vaults view|allowlist-vault|remove-vault");
  }

  if (group == "asset" || group == "borrowable") {
    auto key = single_key();
    if (!key || (action != "add" && action != "remove")) {
      return usage_error("expected add|remove <key>");
    }
    if (group == "asset") {
      return report(action == "add" ? engine.add_asset(vault, *key)
                                    : engine.remove_asset(vault, *key));
    }
    return report(action == "add" ? engine.add_borrowable(vault, *key)
                                  : engine.remove_borrowable(vault, *key));
  }

  if (group == "timelock") {
    if (action == "get") {
      auto timelock = engine.timelock_report(vault);
      if (!timelock.result.ok()) {
        return report(timelock.result);
      }
      for (const auto& line : timelock.lines) {
        std::cout << line << std::endl;
      }
      return 0;
    }
    if (action == "set" && args.size() == 1) {
      auto duration = parse_number<uint32_t>(args.front());
      if (!duration) {
        return usage_error("expected a duration in seconds");
      }
      return report(engine.set_timelock_duration(vault, *duration));
    }
    if (action == "apply") {
      return report(engine.apply_timelock(vault));
    }
    if (action == "cancel") {
      return report(engine.cancel_timelock(vault));
    }
    return usage_error("timelock get|set <seconds>|apply|cancel");
  }

  return usage_error("unknown command group " + group);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto vault_text = std::string{};
  auto config_path = std::string{};
  auto log_path = std::string{};
  auto command = command_line{};
  auto positional = std::vector<std::string>{};

  auto description = po::options_description{"bulwark"};
  description.add_options()("help,h", "Show the help message")(
      "db,d", po::value<std::string>(&db_path)->default_value("bulwark.db"),
      "RocksDB directory holding vault state")(
      "vault", po::value<std::string>(&vault_text),
      "Vault public key (base58 or hex)")(
      "now", po::value<uint64_t>(),
      "Override the clock with a unix timestamp in seconds")(
      "protocol,p", po::value<std::string>(&command.protocol),
      "Protocol name for delegate grant/revoke")(
      "config,c", po::value<std::string>(&config_path),
      "INI style file with defaults for the options above")(
      "log-file", po::value<std::string>(&log_path)->default_value("bulwark.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  auto hidden = po::options_description{};
  hidden.add_options()("command",
                       po::value<std::vector<std::string>>(&positional));
  auto all = po::options_description{};
  all.add(description).add(hidden);
  auto positions = po::positional_options_description{};
  positions.add("command", -1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positions)
                  .run(),
              vm);
    if (vm.contains("config") && !vm["config"].as<std::string>().empty()) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  if (vm.contains("help") || positional.empty()) {
    std::cout << "usage: bulwark [options] <group> [action] [args...]\n"
              << description << std::endl;
    return positional.empty() && !vm.contains("help") ? 1 : 0;
  }

  spdlog::init_thread_pool(8192, 1);
  try {
    auto console_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
    auto logger = std::make_shared<spdlog::async_logger>(
        "bulwark", spdlog::sinks_init_list{console_sink, file_sink},
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "error: " << e.what() << std::endl;
    spdlog::shutdown();
    return 1;
  }
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto vault = bulwark::schema::try_parse_pubkey(vault_text);
  if (!vault) {
    spdlog::shutdown();
    return usage_error("--vault must be a base58 or hex public key");
  }

  command.group = positional.front();
  if (positional.size() > 1) {
    command.action = positional[1];
  }
  if (positional.size() > 2) {
    command.args.assign(std::next(std::begin(positional), 2),
                        std::end(positional));
  }

  auto clock = bulwark::execution::clock_fn_t{};
  if (vm.contains("now")) {
    clock = [now = vm["now"].as<uint64_t>()] { return now; };
  } else {
    clock = [] {
      return static_cast<bulwark::schema::timestamp_seconds_t>(
          std::chrono::duration_cast<std::chrono::seconds>(
              std::chrono::system_clock::now().time_since_epoch())
              .count());
    };
  }

  auto ledger = bulwark::ledger::local_ledger{db_path};
  auto engine = bulwark::execution::controller{
      ledger, ledger, bulwark::policy::registry::standard(), clock};
  auto code = dispatch(engine, ledger, *vault, command);

  spdlog::shutdown();
  return code;
}
