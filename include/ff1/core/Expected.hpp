// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// can name the success/error pair consistently. The default error type is
// ff1::Error, which carries the failure kind plus the diagnostics (candidate
// lists, host, timeout) callers need to render a precise message.

#pragma once

#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "ff1/core/Error.hpp"

namespace ff1 {

template <typename T, typename E = Error>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace ff1
