#include <perp/request/account_list_builder.hpp>

#include <string>
#include <utility>

namespace perp::request {

account_list_builder::account_list_builder(const std::size_t capacity) {
  accounts_.reserve(capacity);
}

account_list_builder& account_list_builder::fixed(
    const account_meta_t& account) {
  if (enter(segment::fixed)) {
    accounts_.push_back(account);
  }
  return *this;
}

account_list_builder& account_list_builder::pages(
    const std::vector<perp::schema::public_key_t>& memory_pages) {
  if (!enter(segment::pages)) {
    return *this;
  }
  for (const auto& page : memory_pages) {
    accounts_.push_back(make_writable(page));
  }
  return *this;
}

account_list_builder& account_list_builder::discount(
    const std::optional<discount_account_t>& maybe_discount) {
  if (!enter(segment::discount) || !maybe_discount) {
    return *this;
  }
  if (perp::schema::is_zero(maybe_discount->address) ||
      perp::schema::is_zero(maybe_discount->owner)) {
    reject(request_error_code::missing_optional_account,
           "discount account requires both owner and address");
    return *this;
  }
  accounts_.push_back(make_readonly(maybe_discount->address));
  accounts_.push_back(make_readonly(maybe_discount->owner, true));
  return *this;
}

account_list_builder& account_list_builder::referrer(
    const std::optional<perp::schema::public_key_t>& maybe_referrer) {
  if (!enter(segment::referrer) || !maybe_referrer) {
    return *this;
  }
  if (perp::schema::is_zero(*maybe_referrer)) {
    reject(request_error_code::missing_optional_account,
           "referrer account is unset");
    return *this;
  }
  accounts_.push_back(make_writable(*maybe_referrer));
  return *this;
}

std::optional<std::vector<account_meta_t>> account_list_builder::finish() {
  if (!ok()) {
    return std::nullopt;
  }
  for (auto i = std::size_t{0}; i < accounts_.size(); ++i) {
    const auto& first = accounts_[i];
    for (auto j = i + 1; j < accounts_.size(); ++j) {
      const auto& second = accounts_[j];
      if (first.pubkey != second.pubkey) {
        continue;
      }
      if (first.is_writable != second.is_writable ||
          first.is_signer != second.is_signer) {
        reject(request_error_code::conflicting_account_flags,
               "account " + perp::schema::to_base58(first.pubkey) +
                   " listed at " + std::to_string(i) + " and " +
                   std::to_string(j) + " with different flags");
        return std::nullopt;
      }
    }
  }
  return std::move(accounts_);
}

bool account_list_builder::enter(const segment next) {
  if (!ok()) {
    return false;
  }
  if (next == segment::fixed && current_ == segment::fixed) {
    return true;
  }
  if (next > current_) {
    current_ = next;
    return true;
  }
  if (next == segment::discount && current_ == segment::referrer) {
    reject(request_error_code::missing_optional_account,
           "discount accounts must precede the referrer account");
    return false;
  }
  reject(request_error_code::segment_out_of_order,
         "account list segment appended out of order");
  return false;
}

void account_list_builder::reject(const request_error_code code,
                                  std::string info) {
  code_ = code;
  info_ = std::move(info);
  accounts_.clear();
}

}  // namespace perp::request
