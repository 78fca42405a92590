#pragma once
#include <perp/schema/primitives.hpp>
#include <array>
#include <optional>
#include <string_view>

// Constant account identities the engine checks by value: runtime
// programs and the label accounts that tag trade, liquidation and funding
// records.
namespace perp::request {

inline constexpr std::string_view kTokenProgramId{
    "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"};
inline constexpr std::string_view kClockSysvarId{
    "SysvarC1ock11111111111111111111111111111111"};
inline constexpr std::string_view kTradeLabel{
    "TradeRecord11111111111111111111111111111111"};
inline constexpr std::string_view kLiquidationLabel{
    "LiquidationRecord11111111111111111111111111"};
inline constexpr std::string_view kFundingLabel{
    "FundingRecord1111111111111111111111111111111"};
inline constexpr std::string_view kFundingExtractionLabel{
    "FundingExtraction111111111111111111111111111"};

struct well_known_accounts final {
  perp::schema::public_key_t token_program{};
  perp::schema::public_key_t clock_sysvar{};
  perp::schema::public_key_t trade_label{};
  perp::schema::public_key_t liquidation_label{};
  perp::schema::public_key_t funding_label{};
  perp::schema::public_key_t funding_extraction_label{};

  bool operator==(const well_known_accounts&) const = default;
};

using well_known_accounts_t = well_known_accounts;

/// Resolves the constant table from its base58 text; std::nullopt if any
/// entry fails to decode to a 32 byte identity.
std::optional<well_known_accounts_t> try_make_well_known_accounts();

/// Process-wide table, resolved on first use and read-only afterwards.
/// A constant that fails to decode is fatal.
const well_known_accounts_t& well_known();

}  // namespace perp::request
