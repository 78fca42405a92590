#include <gtest/gtest.h>
#include <perp/schema/primitives.hpp>
#include <perp/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef PERP_REQUEST_BUILDER_PATH
#define PERP_REQUEST_BUILDER_PATH ""
#endif

namespace {

using perp::schema::to_base58;
using perp::testing::make_key;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::vector<std::string> split_lines(const std::string& input) {
  auto lines = std::vector<std::string>{};
  auto stream = std::istringstream{input};
  auto line = std::string{};
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

// stderr is discarded so only the request reaches the capture.
std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto full_command = command + " 2>/dev/null";
  auto* pipe = popen(full_command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string market_arguments() {
  auto instance = to_base58(make_key(20)) + ":" + to_base58(make_key(21)) +
                  "," + to_base58(make_key(22));
  return " --program-id " + to_base58(make_key(1)) +
         " --signer-nonce 254"
         " --market-signer " +
         to_base58(make_key(2)) + " --oracle " + to_base58(make_key(3)) +
         " --market " + to_base58(make_key(4)) + " --admin " +
         to_base58(make_key(5)) + " --vault " + to_base58(make_key(6)) +
         " --fee-sink " + to_base58(make_key(7)) + " --instance " + instance;
}

std::string run_builder(const std::string& builder,
                        const std::string_view operation,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{operation} + " " +
                 std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{PERP_REQUEST_BUILDER_PATH};
}

bool builder_available(const std::string& builder) {
  return !builder.empty() && std::filesystem::exists(builder);
}

}  // namespace

TEST(request_builder, collect_garbage_hex_payload) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto output = run_builder(builder, "collect_garbage",
                            market_arguments() +
                                " --format hex --instance-index 0"
                                " --max-iterations 5 --target " +
                                to_base58(make_key(100)));
  EXPECT_EQ(output, "08000500000000000000");
}

TEST(request_builder, collect_garbage_text_lists_accounts) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto output = run_builder(builder, "collect_garbage",
                            market_arguments() +
                                " --instance-index 0 --max-iterations 5"
                                " --target " +
                                to_base58(make_key(100)));
  auto lines = split_lines(output);
  ASSERT_EQ(lines.size(), 10u) << output;
  EXPECT_EQ(lines[0], "program " + to_base58(make_key(1)));
  EXPECT_EQ(lines[2], "account 1 " + to_base58(make_key(4)) + " writable -");
  EXPECT_EQ(lines[5], "account 4 " + to_base58(make_key(2)) + " readonly -");
  EXPECT_EQ(lines[6], "account 5 " + to_base58(make_key(100)) + " writable -");
  EXPECT_EQ(lines[8], "account 7 " + to_base58(make_key(22)) + " writable -");
  EXPECT_EQ(lines[9], "data 08000500000000000000");
}

TEST(request_builder, crank_funding_base64_payload) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto output =
      run_builder(builder, "crank_funding", market_arguments() + " --format base64");
  EXPECT_EQ(output, "Cg==");
}

TEST(request_builder, open_position_marks_owner_as_signer) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto output = run_builder(
      builder, "open_position",
      market_arguments() + " --side short --collateral 100 --leverage 10" +
          " --predicted-entry-price 7 --max-slippage 3" +
          " --owner " + to_base58(make_key(111)) + " --user-account " +
          to_base58(make_key(110)) + " --referrer " +
          to_base58(make_key(130)));
  auto lines = split_lines(output);
  // program, 11 fixed, 2 pages, referrer, data
  ASSERT_EQ(lines.size(), 16u) << output;
  EXPECT_EQ(lines[8], "account 7 " + to_base58(make_key(111)) +
                          " readonly signer");
  EXPECT_EQ(lines[14],
            "account 13 " + to_base58(make_key(130)) + " writable -");
  EXPECT_EQ(lines[15],
            "data 03"
            "00"
            "6400000000000000"
            "00"
            "0a00000000000000"
            "0700000000000000"
            "0300000000000000");
}

TEST(request_builder, config_file_supplies_market_and_command_line_wins) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto directory = perp::testing::make_temp_path("perp_request_builder");
  std::filesystem::create_directories(directory);
  auto config = directory + "/market.ini";
  {
    auto file = std::ofstream{config};
    file << "program-id=" << to_base58(make_key(1)) << '\n'
         << "signer-nonce=7\n"
         << "market-signer=" << to_base58(make_key(2)) << '\n'
         << "oracle=" << to_base58(make_key(3)) << '\n'
         << "market=" << to_base58(make_key(4)) << '\n'
         << "admin=" << to_base58(make_key(5)) << '\n'
         << "vault=" << to_base58(make_key(6)) << '\n'
         << "fee-sink=" << to_base58(make_key(7)) << '\n';
  }

  auto output = run_builder(
      builder, "create_market",
      "--config " + shell_quote(config) + " --program-id " +
          to_base58(make_key(9)) +
          " --symbol AB --initial-quote-amount 1 --coin-decimals 9"
          " --quote-decimals 6");
  perp::testing::remove_path(directory);

  auto lines = split_lines(output);
  ASSERT_EQ(lines.size(), 7u) << output;
  EXPECT_EQ(lines[0], "program " + to_base58(make_key(9)));
  EXPECT_EQ(lines[1], "account 0 " + to_base58(make_key(4)) + " writable -");
  EXPECT_EQ(lines[6],
            "data 00"
            "07"
            "02000000"
            "4142"
            "0100000000000000"
            "09"
            "06");
}

TEST(request_builder, out_of_range_instance_fails) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto command = shell_quote(builder) + " crank_liquidation" +
                 market_arguments() + " --instance-index 3 --target " +
                 to_base58(make_key(100));
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 1);
  EXPECT_TRUE(trim_ascii_whitespace(output).empty()) << output;
}

TEST(request_builder, unknown_operation_fails) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "request_builder binary not available: " << builder;
  }

  auto [exit_code, output] =
      run_capture(shell_quote(builder) + " liquidate_everything");
  EXPECT_EQ(exit_code, 1);
  EXPECT_TRUE(trim_ascii_whitespace(output).empty()) << output;
}
