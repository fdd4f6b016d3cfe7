/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Every fallible msgbuf call returns msgbuf_detail::expected<T, E>, so the
 * rest of the codebase does not depend on a specific implementation.
 *
 * - When the standard library ships <expected>: std::expected.
 * - Otherwise: <tl/expected.hpp>, the header-only backport by TartanLlama
 *   (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace msgbuf_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace msgbuf_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
