#pragma once

#include "debctl_codec/control_loader.hpp"
#include "debctl_codec/field_writer.hpp"
#include "debctl_codec/schema.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace debctl::codec {

struct CheckOutcome {
    std::string file;
    std::string status;   ///< PASS / FAIL / ERROR
    std::string message;  ///< Human readable diagnostics
    std::size_t records{0};
};

/**
 * \brief Verifies that control files survive decode followed by encode unchanged.
 *
 * Every file is decoded as a sequence of records, bound through the schema, encoded
 * again and compared byte for byte with the input. PASS means identical output,
 * FAIL reports the first differing line, ERROR carries the decode or encode error.
 */
class RoundTripEngine {
public:
    struct Config {
        Schema schema{};
        FoldConfig fold{};
        /// Blank lines at the end of a file are not reproduced by the encoder.
        bool ignore_trailing_blank_lines{true};
    };

    explicit RoundTripEngine(Config config);

    [[nodiscard]] CheckOutcome check(const ControlFile& file) const;

    [[nodiscard]] std::vector<CheckOutcome> run(const std::vector<ControlFile>& files) const;

private:
    Config config_;
};

}  // namespace debctl::codec
