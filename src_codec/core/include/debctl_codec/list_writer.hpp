#pragma once

#include "field_writer.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace debctl::codec {

/**
 * \brief Writes a list field as comma-separated, column-aligned lines.
 *
 * \code{.txt}
 * Depends: bitcoind,
 *          python (>= 3.0.0)
 * \endcode
 *
 * Elements are written verbatim; they must contain neither ',' nor '\n'. A list without
 * elements writes nothing, not even the key. The alignment column is measured with
 * `segmenter` when given.
 */
class ListWriter {
public:
    ListWriter(std::ostream& output, std::string key, Segmenter* segmenter = nullptr);

    void write_element(std::string_view element);

    void end();

    [[nodiscard]] bool empty() const noexcept { return !started_; }

private:
    std::ostream& output_;
    std::string key_;
    Segmenter* segmenter_;
    std::size_t indent_{0};
    bool started_{false};
};

}  // namespace debctl::codec
