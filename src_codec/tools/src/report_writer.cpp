#include "debctl_codec/report_writer.hpp"

#include "debctl_codec/file_io.hpp"

#include <filesystem>
#include <ios>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json outcome_to_json(const debctl::codec::CheckOutcome& outcome) {
    return json{
        {"file", outcome.file},
        {"status", outcome.status},
        {"message", outcome.message},
        {"records", outcome.records},
    };
}

json build_summary(const std::vector<debctl::codec::CheckOutcome>& outcomes) {
    json summary = {
        {"total", outcomes.size()},
        {"by_status", json::object()},
        {"files", json::array()},
    };

    auto& by_status = summary["by_status"];
    for (const auto& outcome : outcomes) {
        summary["files"].push_back(outcome_to_json(outcome));
        auto& counter = by_status[outcome.status];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
    }

    return summary;
}

}  // namespace

namespace debctl::codec {

std::string ReportWriter::render_summary(const std::vector<CheckOutcome>& outcomes) const {
    return build_summary(outcomes).dump(2);
}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<CheckOutcome>& outcomes) const {
    auto output = open_output(destination);
    output << render_summary(outcomes) << '\n';
    output.flush();
    if (!output) {
        throw WriteFileError(destination, std::make_error_code(std::io_errc::stream));
    }
}

}  // namespace debctl::codec
