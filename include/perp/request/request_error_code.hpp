#pragma once

#include <perp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Request build failure taxonomy. Numeric values are stable so callers
// can log and compare them across releases.
namespace perp::request {

enum class request_error_code : uint32_t {
  ok = 0,
  invalid_instance_index = 1,
  encoding_error = 2,
  missing_optional_account = 3,
  segment_out_of_order = 4,
  conflicting_account_flags = 5,
};

inline constexpr auto kRequestErrorCodeMappings = std::array{
    std::pair<std::string_view, request_error_code>{"ok",
                                                    request_error_code::ok},
    std::pair<std::string_view, request_error_code>{
        "invalid_instance_index", request_error_code::invalid_instance_index},
    std::pair<std::string_view, request_error_code>{
        "encoding_error", request_error_code::encoding_error},
    std::pair<std::string_view, request_error_code>{
        "missing_optional_account",
        request_error_code::missing_optional_account},
    std::pair<std::string_view, request_error_code>{
        "segment_out_of_order", request_error_code::segment_out_of_order},
    std::pair<std::string_view, request_error_code>{
        "conflicting_account_flags",
        request_error_code::conflicting_account_flags}};

inline constexpr std::string_view to_string(const request_error_code value) {
  return perp::schema::to_string(value, kRequestErrorCodeMappings)
      .value_or("unknown");
}

}  // namespace perp::request
