#pragma once
#include <perp/request/account_meta.hpp>
#include <perp/request/market_context.hpp>
#include <perp/request/request_error_code.hpp>
#include <perp/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perp::request {

/// Composes an account list from typed segments in their declared order:
///
///   fixed prefix -> position pages -> discount pair -> referrer
///
/// Segments may be skipped but never revisited. The first rejected append
/// latches an error code; later appends are ignored and `finish` returns
/// std::nullopt so no partially valid list ever escapes.
class account_list_builder final {
 public:
  explicit account_list_builder(std::size_t capacity = 0);

  account_list_builder& fixed(const account_meta_t& account);

  /// One writable entry per page, in stored order.
  account_list_builder& pages(
      const std::vector<perp::schema::public_key_t>& memory_pages);

  /// Discount address (read-only) then discount owner (read-only, signer).
  /// Both identities must be set: an all-zero key counts as unset and is
  /// rejected with `missing_optional_account`, even though it is a valid
  /// base58 identity.
  account_list_builder& discount(
      const std::optional<discount_account_t>& maybe_discount);

  /// Writable referrer token account. Must come after `discount`. An
  /// all-zero key counts as unset and is rejected with
  /// `missing_optional_account`.
  account_list_builder& referrer(
      const std::optional<perp::schema::public_key_t>& maybe_referrer);

  bool ok() const { return code_ == request_error_code::ok; }
  request_error_code code() const { return code_; }
  const std::string& info() const { return info_; }
  std::size_t size() const { return accounts_.size(); }

  /// Hands over the list. A key listed more than once must carry the same
  /// writable and signer flags each time, otherwise the build fails with
  /// `conflicting_account_flags`.
  std::optional<std::vector<account_meta_t>> finish();

 private:
  enum class segment : uint8_t {
    fixed = 0,
    pages = 1,
    discount = 2,
    referrer = 3
  };

  bool enter(segment next);
  void reject(request_error_code code, std::string info);

  std::vector<account_meta_t> accounts_;
  segment current_{segment::fixed};
  request_error_code code_{request_error_code::ok};
  std::string info_;
};

}  // namespace perp::request
