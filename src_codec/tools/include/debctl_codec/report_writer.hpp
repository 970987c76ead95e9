#pragma once

#include "debctl_codec/roundtrip_engine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace debctl::codec {

/**
 * \brief Emits the machine-readable summary of a round-trip check.
 *
 * The document carries `total`, per-status counts in `by_status` and one entry per
 * file in `files`.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    [[nodiscard]] std::string render_summary(const std::vector<CheckOutcome>& outcomes) const;

    void write_summary(const std::filesystem::path& destination,
                       const std::vector<CheckOutcome>& outcomes) const;
};

}  // namespace debctl::codec
