#pragma once

#include <perp/request/request.hpp>
#include <perp/request/request_error_code.hpp>
#include <optional>
#include <string>

namespace perp::request {

/// Outcome of one construction call. `request` is engaged only when
/// `code` is ok; a failed build never carries a partial request.
struct build_result final {
  request_error_code code{request_error_code::ok};
  std::string info;
  std::optional<request_t> request;

  bool ok() const { return code == request_error_code::ok; }
};

using build_result_t = build_result;

}  // namespace perp::request
