#include <boost/program_options.hpp>
#include <perp/common/critical.hpp>
#include <perp/request/assembler.hpp>
#include <perp/request/well_known_accounts.hpp>
#include <perp/schema/instruction.hpp>
#include <perp/schema/position_side.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using perp::schema::public_key_t;

void configure_logging(const bool verbose) {
  // stdout carries the request only; diagnostics go to stderr.
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("request_builder", sink);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

public_key_t parse_key(const std::string_view value,
                       const std::string_view name) {
  auto key = perp::schema::try_make_public_key(value);
  if (!key) {
    perp::common::critical("--{} is not a base58 account identity: {}", name,
                           value);
  }
  return *key;
}

public_key_t get_key(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    perp::common::critical("missing required argument --{}", name);
  }
  return parse_key(vm[name].as<std::string>(), name);
}

std::optional<public_key_t> get_optional_key(const po::variables_map& vm,
                                             const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return parse_key(vm[name].as<std::string>(), name);
}

uint64_t get_u64(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    perp::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<uint64_t>();
}

// program_options reads uint8_t as a character, so narrow integers are
// parsed as uint32_t and range checked here.
template <typename T>
T get_narrow(const po::variables_map& vm, const std::string& name) {
  auto value = vm[name].as<uint32_t>();
  if (value > std::numeric_limits<T>::max()) {
    perp::common::critical("--{} is out of range: {}", name, value);
  }
  return static_cast<T>(value);
}

// "<instance>[:<page>,<page>...]"
perp::request::instance_context_t parse_instance(const std::string& value) {
  auto instance = perp::request::instance_context_t{};
  auto separator = value.find(':');
  instance.instance_account =
      parse_key(std::string_view{value}.substr(0, separator), "instance");
  if (separator == std::string::npos) {
    return instance;
  }
  auto pages = std::string_view{value}.substr(separator + 1);
  while (!pages.empty()) {
    auto comma = pages.find(',');
    instance.memory_pages.push_back(
        parse_key(pages.substr(0, comma), "instance"));
    if (comma == std::string_view::npos) {
      break;
    }
    pages.remove_prefix(comma + 1);
  }
  return instance;
}

perp::request::market_context_t make_market_context(
    const po::variables_map& vm) {
  auto ctx = perp::request::market_context_t{
      .program_id = get_key(vm, "program-id"),
      .signer_nonce = get_narrow<uint8_t>(vm, "signer-nonce"),
      .market_signer_account = get_key(vm, "market-signer"),
      .oracle_account = get_key(vm, "oracle"),
      .market_account = get_key(vm, "market"),
      .admin_account = get_key(vm, "admin"),
      .market_vault = get_key(vm, "vault"),
      .fee_sink = get_key(vm, "fee-sink")};
  if (vm.contains("instance")) {
    for (const auto& value : vm["instance"].as<std::vector<std::string>>()) {
      ctx.instances.push_back(parse_instance(value));
    }
  }
  return ctx;
}

std::vector<public_key_t> get_pages(const po::variables_map& vm) {
  auto pages = std::vector<public_key_t>{};
  if (vm.contains("page")) {
    for (const auto& value : vm["page"].as<std::vector<std::string>>()) {
      pages.push_back(parse_key(value, "page"));
    }
  }
  return pages;
}

std::optional<perp::request::discount_account_t> get_discount(
    const po::variables_map& vm) {
  if (!vm.contains("discount-owner") && !vm.contains("discount-address")) {
    return std::nullopt;
  }
  // One half without the other is passed through as unset and rejected by
  // the assembler.
  auto discount = perp::request::discount_account_t{};
  if (auto owner = get_optional_key(vm, "discount-owner")) {
    discount.owner = *owner;
  }
  if (auto address = get_optional_key(vm, "discount-address")) {
    discount.address = *address;
  }
  return discount;
}

perp::schema::position_side_t get_side(const po::variables_map& vm) {
  auto value = vm["side"].as<std::string>();
  auto side = perp::schema::try_from_string<perp::schema::position_side_t>(
      value);
  if (!side) {
    perp::common::critical(
        "--side must be {}: {}",
        perp::schema::join_names(perp::schema::kPositionSideMappings), value);
  }
  return *side;
}

perp::request::position_info_t get_position(const po::variables_map& vm) {
  return perp::request::position_info_t{
      .user_account = get_key(vm, "user-account"),
      .user_account_owner = get_key(vm, "owner"),
      .instance_index = get_narrow<uint8_t>(vm, "instance-index"),
      .side = get_side(vm)};
}

perp::request::build_result_t build(
    const perp::request::assembler& assembler,
    const perp::request::market_context_t& ctx,
    const perp::schema::instruction_tag_t tag,
    const po::variables_map& vm) {
  using perp::schema::instruction_tag_t;
  switch (tag) {
    case instruction_tag_t::create_market:
      return assembler.create_market(
          ctx, vm["symbol"].as<std::string>(),
          get_u64(vm, "initial-quote-amount"),
          get_narrow<uint8_t>(vm, "coin-decimals"),
          get_narrow<uint8_t>(vm, "quote-decimals"));
    case instruction_tag_t::add_instance:
      return assembler.add_instance(ctx, get_key(vm, "target"),
                                    get_pages(vm));
    case instruction_tag_t::update_oracle_account:
      return assembler.update_oracle_account(ctx, get_key(vm, "mapping"),
                                             get_key(vm, "product"),
                                             get_key(vm, "price"));
    case instruction_tag_t::open_position:
      return assembler.open_position(
          ctx, get_position(vm), get_u64(vm, "collateral"),
          get_u64(vm, "leverage"), get_u64(vm, "predicted-entry-price"),
          get_u64(vm, "max-slippage"), get_discount(vm),
          get_optional_key(vm, "referrer"));
    case instruction_tag_t::add_budget:
      return assembler.add_budget(ctx, get_u64(vm, "amount"),
                                  get_key(vm, "source-owner"),
                                  get_key(vm, "source-token-account"),
                                  get_key(vm, "user-account"));
    case instruction_tag_t::withdraw_budget:
      return assembler.withdraw_budget(ctx, get_u64(vm, "amount"),
                                       get_key(vm, "target"),
                                       get_key(vm, "owner"),
                                       get_key(vm, "user-account"));
    case instruction_tag_t::increase_position:
      return assembler.increase_position(
          ctx, get_u64(vm, "collateral"), get_u64(vm, "leverage"),
          get_narrow<uint8_t>(vm, "instance-index"),
          get_narrow<uint16_t>(vm, "position-index"), get_key(vm, "owner"),
          get_key(vm, "user-account"), get_u64(vm, "predicted-entry-price"),
          get_u64(vm, "max-slippage"), get_discount(vm),
          get_optional_key(vm, "referrer"));
    case instruction_tag_t::close_position:
      return assembler.close_position(
          ctx, get_position(vm), get_u64(vm, "closing-collateral"),
          get_u64(vm, "closing-v-coin"),
          get_narrow<uint16_t>(vm, "position-index"),
          get_u64(vm, "predicted-entry-price"), get_u64(vm, "max-slippage"),
          get_discount(vm), get_optional_key(vm, "referrer"));
    case instruction_tag_t::collect_garbage:
      return assembler.collect_garbage(
          ctx, get_narrow<uint8_t>(vm, "instance-index"),
          get_u64(vm, "max-iterations"), get_key(vm, "target"));
    case instruction_tag_t::crank_liquidation:
      return assembler.crank_liquidation(
          ctx, get_narrow<uint8_t>(vm, "instance-index"),
          get_key(vm, "target"));
    case instruction_tag_t::crank_funding:
      return assembler.crank_funding(ctx);
    case instruction_tag_t::funding_extraction:
      return assembler.funding_extraction(
          ctx, get_narrow<uint8_t>(vm, "instance-index"),
          get_key(vm, "user-account"));
    case instruction_tag_t::change_k:
      return assembler.change_k(ctx, get_u64(vm, "factor"));
    case instruction_tag_t::close_account:
      return assembler.close_account(ctx, get_key(vm, "user-account"),
                                     get_key(vm, "owner"),
                                     get_key(vm, "lamports-target"));
    case instruction_tag_t::add_page:
      return assembler.add_page(ctx, get_narrow<uint8_t>(vm, "instance-index"),
                                get_key(vm, "new-page"));
    case instruction_tag_t::rebalance:
      return assembler.rebalance(ctx, get_key(vm, "user-account"),
                                 get_key(vm, "owner"),
                                 get_narrow<uint8_t>(vm, "instance-index"),
                                 get_u64(vm, "collateral"));
    case instruction_tag_t::transfer_user_account:
      return assembler.transfer_user_account(ctx, get_key(vm, "user-account"),
                                             get_key(vm, "owner"),
                                             get_key(vm, "new-owner"));
    case instruction_tag_t::transfer_position:
      return assembler.transfer_position(
          ctx, get_narrow<uint16_t>(vm, "position-index"),
          get_key(vm, "source-user-account"), get_key(vm, "source-owner"),
          get_key(vm, "destination-user-account"),
          get_key(vm, "destination-owner"));
  }
  perp::common::critical("unsupported operation");
}

void print_request(const perp::request::request_t& request,
                   const std::string& format) {
  if (format == "hex") {
    std::cout << perp::schema::to_hex(request.data) << '\n';
    return;
  }
  if (format == "base64") {
    std::cout << perp::schema::to_base64(request.data) << '\n';
    return;
  }
  std::cout << "program " << perp::schema::to_base58(request.program_id)
            << '\n';
  for (std::size_t i = 0; i < request.accounts.size(); ++i) {
    const auto& account = request.accounts[i];
    std::cout << "account " << i << ' '
              << perp::schema::to_base58(account.pubkey) << ' '
              << (account.is_writable ? "writable" : "readonly") << ' '
              << (account.is_signer ? "signer" : "-") << '\n';
  }
  std::cout << "data " << perp::schema::to_hex(request.data) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  request_builder <operation> [options]\n\n"
            << "Operations:\n  "
            << perp::schema::join_names(perp::schema::kInstructionTagMappings,
                                        "\n  ")
            << "\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto format = std::string{};
  auto options = po::options_description{"request_builder options"};
  options.add_options()("help,h", "show help")(
      "verbose,v", "log at debug level")(
      "command", po::value<std::string>(&command), "operation name")(
      "config", po::value<std::string>(),
      "INI file with market options; command line values win")(
      "format", po::value<std::string>(&format)->default_value("text"),
      "text|hex|base64");

  auto market = po::options_description{"market context"};
  market.add_options()("program-id", po::value<std::string>(),
                       "engine program id")(
      "signer-nonce", po::value<uint32_t>()->default_value(0),
      "market signer nonce")("market-signer", po::value<std::string>(),
                             "market signer account")(
      "oracle", po::value<std::string>(), "oracle price account")(
      "market", po::value<std::string>(), "market account")(
      "admin", po::value<std::string>(), "market admin account")(
      "vault", po::value<std::string>(), "market vault token account")(
      "fee-sink", po::value<std::string>(), "fee sink token account")(
      "instance", po::value<std::vector<std::string>>(),
      "instance as <instance>[:<page>,<page>...], repeatable");

  auto arguments = po::options_description{"operation arguments"};
  arguments.add_options()("instance-index",
                          po::value<uint32_t>()->default_value(0),
                          "instance index")(
      "position-index", po::value<uint32_t>()->default_value(0),
      "position index")("side", po::value<std::string>()->default_value("long"),
                        "short|long")(
      "collateral", po::value<uint64_t>(), "collateral amount")(
      "leverage", po::value<uint64_t>(), "leverage, 32 bit fixed point")(
      "predicted-entry-price", po::value<uint64_t>(),
      "predicted entry price, 32 bit fixed point")(
      "max-slippage", po::value<uint64_t>(),
      "maximum slippage margin, 32 bit fixed point")(
      "closing-collateral", po::value<uint64_t>(), "collateral to release")(
      "closing-v-coin", po::value<uint64_t>(), "virtual coin to close")(
      "amount", po::value<uint64_t>(), "budget amount")(
      "owner", po::value<std::string>(), "user account owner")(
      "user-account", po::value<std::string>(), "user account")(
      "discount-owner", po::value<std::string>(), "discount account owner")(
      "discount-address", po::value<std::string>(), "discount account")(
      "referrer", po::value<std::string>(), "referrer token account")(
      "target", po::value<std::string>(),
      "target token account, or the new instance for add_instance")(
      "page", po::value<std::vector<std::string>>()->multitoken(),
      "pages for add_instance")("new-page", po::value<std::string>(),
                                "page for add_page")(
      "symbol", po::value<std::string>()->default_value(""),
      "market symbol")("initial-quote-amount", po::value<uint64_t>(),
                       "initial virtual quote amount")(
      "coin-decimals", po::value<uint32_t>()->default_value(6),
      "coin decimals")("quote-decimals",
                       po::value<uint32_t>()->default_value(6),
                       "quote decimals")(
      "max-iterations", po::value<uint64_t>(), "garbage collection budget")(
      "factor", po::value<uint64_t>(), "k multiplier, 32 bit fixed point")(
      "mapping", po::value<std::string>(), "oracle mapping account")(
      "product", po::value<std::string>(), "oracle product account")(
      "price", po::value<std::string>(), "oracle price account")(
      "source-owner", po::value<std::string>(), "source owner")(
      "source-token-account", po::value<std::string>(),
      "source token account")("source-user-account", po::value<std::string>(),
                              "source user account")(
      "destination-owner", po::value<std::string>(), "destination owner")(
      "destination-user-account", po::value<std::string>(),
      "destination user account")("new-owner", po::value<std::string>(),
                                  "new user account owner")(
      "lamports-target", po::value<std::string>(),
      "account receiving the closed account's lamports");
  options.add(market).add(arguments);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      po::store(po::parse_config_file<char>(path.c_str(), options), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    configure_logging(false);
    spdlog::error("{}", e.what());
    return 1;
  }

  configure_logging(vm.contains("verbose"));

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto tag = perp::schema::try_from_string<perp::schema::instruction_tag_t>(
      command);
  if (!tag) {
    spdlog::error("unknown operation: {}", command);
    return 1;
  }
  if (format != "text" && format != "hex" && format != "base64") {
    spdlog::error("--format must be text|hex|base64: {}", format);
    return 1;
  }

  auto encoder = perp::request::borsh_encoder_t{};
  auto assembler = perp::request::assembler{encoder};
  auto result = build(assembler, make_market_context(vm), *tag, vm);
  if (!result.ok()) {
    spdlog::error("{} rejected: {} ({})", command,
                  perp::request::to_string(result.code), result.info);
    return 1;
  }

  print_request(*result.request, format);
  return 0;
}
