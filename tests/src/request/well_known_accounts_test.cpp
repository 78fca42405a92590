#include <gtest/gtest.h>
#include <perp/request/well_known_accounts.hpp>
#include <perp/schema/primitives.hpp>
#include <perp/testing/common.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace {

perp::schema::public_key_t key_from_hex(const std::string_view hex) {
  auto bytes = perp::testing::from_hex(hex);
  auto key = perp::schema::public_key_t{};
  EXPECT_EQ(bytes.size(), key.size());
  std::copy(std::begin(bytes), std::end(bytes), std::begin(key));
  return key;
}

}  // namespace

TEST(well_known_accounts, constants_decode_to_exact_identities) {
  auto accounts = perp::request::try_make_well_known_accounts();
  ASSERT_TRUE(accounts.has_value());
  EXPECT_EQ(accounts->token_program,
            key_from_hex("06ddf6e1d765a193d9cbe146ceeb79ac"
                         "1cb485ed5f5b37913a8cf5857eff00a9"));
  EXPECT_EQ(accounts->clock_sysvar,
            key_from_hex("06a7d51718c774c928566398691d5eb6"
                         "8b5eb8a39b4b6d5c73555b2100000000"));
  EXPECT_EQ(accounts->trade_label,
            key_from_hex("06e12941daa960ce6764262f48038d28"
                         "3cfa82d63113696d7832a4be00000000"));
  EXPECT_EQ(accounts->liquidation_label,
            key_from_hex("050d59027f663b20e73744c13550808d"
                         "9cdc43ed500ecb8f3d539b99b8000000"));
  EXPECT_EQ(accounts->funding_label,
            key_from_hex("dd896aa3fb7530b648bb049d5de3341b"
                         "f906d986f2eaac262588c42b00000000"));
  EXPECT_EQ(accounts->funding_extraction_label,
            key_from_hex("dd896aa3fb2622344fd2b257ba756d4a"
                         "a1b12db11333dfdad22c2e6cc8000000"));
}

TEST(well_known_accounts, constants_round_trip_through_base58) {
  const auto& accounts = perp::request::well_known();
  EXPECT_EQ(perp::schema::to_base58(accounts.token_program),
            perp::request::kTokenProgramId);
  EXPECT_EQ(perp::schema::to_base58(accounts.clock_sysvar),
            perp::request::kClockSysvarId);
  EXPECT_EQ(perp::schema::to_base58(accounts.funding_extraction_label),
            perp::request::kFundingExtractionLabel);
}

TEST(well_known_accounts, process_table_is_resolved_once) {
  const auto& first = perp::request::well_known();
  const auto& second = perp::request::well_known();
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(first, *perp::request::try_make_well_known_accounts());
}
