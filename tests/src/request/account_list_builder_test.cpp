#include <gtest/gtest.h>
#include <perp/request/account_list_builder.hpp>
#include <perp/testing/common.hpp>

#include <optional>
#include <vector>

using perp::testing::make_key;
using perp::testing::readonly;
using perp::testing::writable;

TEST(account_list_builder, appends_segments_in_declared_order) {
  auto builder = perp::request::account_list_builder{8};
  builder.fixed(readonly(make_key(1)))
      .fixed(writable(make_key(2), true))
      .pages({make_key(3), make_key(4)})
      .discount(perp::request::discount_account_t{.owner = make_key(5),
                                                  .address = make_key(6)})
      .referrer(make_key(7));
  ASSERT_TRUE(builder.ok());
  EXPECT_EQ(builder.size(), 7u);

  auto accounts = builder.finish();
  ASSERT_TRUE(accounts.has_value());
  auto expected = std::vector<perp::request::account_meta_t>{
      readonly(make_key(1)),     writable(make_key(2), true),
      writable(make_key(3)),     writable(make_key(4)),
      readonly(make_key(6)),     readonly(make_key(5), true),
      writable(make_key(7))};
  EXPECT_EQ(*accounts, expected);
}

TEST(account_list_builder, absent_optional_segments_add_nothing) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1)))
      .pages({})
      .discount(std::nullopt)
      .referrer(std::nullopt);
  auto accounts = builder.finish();
  ASSERT_TRUE(accounts.has_value());
  EXPECT_EQ(accounts->size(), 1u);
}

TEST(account_list_builder, referrer_may_follow_fixed_prefix_directly) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1))).referrer(make_key(2));
  auto accounts = builder.finish();
  ASSERT_TRUE(accounts.has_value());
  EXPECT_EQ(accounts->back(), writable(make_key(2)));
}

TEST(account_list_builder, discount_after_referrer_is_rejected) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1)))
      .referrer(make_key(2))
      .discount(perp::request::discount_account_t{.owner = make_key(3),
                                                  .address = make_key(4)});
  EXPECT_FALSE(builder.ok());
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::missing_optional_account);
  EXPECT_EQ(builder.size(), 0u);
  EXPECT_FALSE(builder.finish().has_value());
}

TEST(account_list_builder, fixed_after_pages_is_out_of_order) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1)))
      .pages({make_key(2)})
      .fixed(readonly(make_key(3)));
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::segment_out_of_order);
  EXPECT_FALSE(builder.info().empty());
  EXPECT_FALSE(builder.finish().has_value());
}

TEST(account_list_builder, repeated_segment_is_out_of_order) {
  auto builder = perp::request::account_list_builder{};
  builder.pages({make_key(1)}).pages({make_key(2)});
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::segment_out_of_order);
}

TEST(account_list_builder, half_set_discount_is_rejected) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1)))
      .discount(perp::request::discount_account_t{
          .owner = make_key(2),
          .address = perp::schema::make_zero_public_key()});
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::missing_optional_account);
  EXPECT_FALSE(builder.finish().has_value());
}

TEST(account_list_builder, zero_referrer_is_rejected) {
  auto builder = perp::request::account_list_builder{};
  builder.referrer(perp::schema::make_zero_public_key());
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::missing_optional_account);
}

TEST(account_list_builder, first_error_is_kept) {
  auto builder = perp::request::account_list_builder{};
  builder.referrer(perp::schema::make_zero_public_key())
      .fixed(readonly(make_key(1)))
      .pages({make_key(2)});
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::missing_optional_account);
  EXPECT_EQ(builder.size(), 0u);
}

TEST(account_list_builder, repeated_key_with_same_flags_is_kept) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1)))
      .fixed(writable(make_key(2)))
      .fixed(readonly(make_key(1)));
  auto accounts = builder.finish();
  ASSERT_TRUE(accounts.has_value());
  EXPECT_EQ(accounts->size(), 3u);
}

TEST(account_list_builder, repeated_key_with_different_writability_is_rejected) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(writable(make_key(1))).fixed(readonly(make_key(1)));
  ASSERT_TRUE(builder.ok());
  EXPECT_FALSE(builder.finish().has_value());
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::conflicting_account_flags);
  EXPECT_FALSE(builder.info().empty());
  EXPECT_EQ(builder.size(), 0u);
}

TEST(account_list_builder, repeated_key_with_different_signer_flag_is_rejected) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1), true)).pages({}).discount(
      perp::request::discount_account_t{.owner = make_key(2),
                                        .address = make_key(1)});
  EXPECT_FALSE(builder.finish().has_value());
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::conflicting_account_flags);
}

TEST(account_list_builder, referrer_reusing_discount_address_is_rejected) {
  auto builder = perp::request::account_list_builder{};
  builder.fixed(readonly(make_key(1)))
      .discount(perp::request::discount_account_t{.owner = make_key(2),
                                                  .address = make_key(3)})
      .referrer(make_key(3));
  EXPECT_FALSE(builder.finish().has_value());
  EXPECT_EQ(builder.code(),
            perp::request::request_error_code::conflicting_account_flags);
}
