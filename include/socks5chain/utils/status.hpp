#pragma once

#include <boost/system/error_code.hpp>
#include <optional>
#include <utility>

namespace socks5chain::utils {

// Error code paired with a result. The result is meaningful only when the
// error code is empty.
template <typename T>
using ErrorOr = std::pair<boost::system::error_code, T>;

template <typename T>
using ErrorOrOpt = ErrorOr<std::optional<T>>;

}  // namespace socks5chain::utils
