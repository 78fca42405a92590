#include <perp/common/critical.hpp>
#include <perp/request/well_known_accounts.hpp>

#include <spdlog/spdlog.h>

namespace perp::request {

std::optional<well_known_accounts_t> try_make_well_known_accounts() {
  auto token_program = perp::schema::try_make_public_key(kTokenProgramId);
  auto clock_sysvar = perp::schema::try_make_public_key(kClockSysvarId);
  auto trade_label = perp::schema::try_make_public_key(kTradeLabel);
  auto liquidation_label = perp::schema::try_make_public_key(kLiquidationLabel);
  auto funding_label = perp::schema::try_make_public_key(kFundingLabel);
  auto funding_extraction_label =
      perp::schema::try_make_public_key(kFundingExtractionLabel);
  if (!token_program || !clock_sysvar || !trade_label || !liquidation_label ||
      !funding_label || !funding_extraction_label) {
    return std::nullopt;
  }
  return well_known_accounts_t{
      .token_program = *token_program,
      .clock_sysvar = *clock_sysvar,
      .trade_label = *trade_label,
      .liquidation_label = *liquidation_label,
      .funding_label = *funding_label,
      .funding_extraction_label = *funding_extraction_label};
}

const well_known_accounts_t& well_known() {
  static const auto accounts = [] {
    auto resolved = try_make_well_known_accounts();
    if (!resolved) {
      perp::common::critical("failed to resolve well-known account table");
    }
    spdlog::debug("Resolved well-known accounts: token program {}, clock {}",
                  perp::schema::to_base58(resolved->token_program),
                  perp::schema::to_base58(resolved->clock_sysvar));
    return *resolved;
  }();
  return accounts;
}

}  // namespace perp::request
