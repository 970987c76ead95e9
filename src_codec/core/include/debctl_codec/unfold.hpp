#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace debctl::codec {

/// Whitespace removed by trim(); matches the set used when reading values.
inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] std::string_view trim(std::string_view input) noexcept;

/**
 * \brief Turns a raw field value into its logical multi-line text.
 *
 * A value read from a single physical line is returned unchanged. Otherwise the first
 * line is kept as is, every continuation line loses its leading spaces and tabs, and a
 * continuation line consisting of exactly `" ."` becomes an empty line.
 *
 * \code{.txt}
 * "A very nice package\n This package\n .\n Second paragraph"
 *   -> "A very nice package\nThis package\n\nSecond paragraph"
 * \endcode
 */
[[nodiscard]] std::string unfold_value(std::string_view raw);

/**
 * \brief Splits a list value on ',' and trims every item.
 *
 * Commas cannot be escaped. An empty value yields a single empty item.
 */
[[nodiscard]] std::vector<std::string> split_sequence(std::string_view value);

}  // namespace debctl::codec
