#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "debctl_codec/codec.hpp"
#include "debctl_codec/control_loader.hpp"
#include "debctl_codec/file_io.hpp"
#include "debctl_codec/json_bridge.hpp"
#include "debctl_codec/report_writer.hpp"
#include "debctl_codec/roundtrip_engine.hpp"
#include "debctl_codec/schema.hpp"

using debctl::codec::CheckOutcome;
using debctl::codec::ControlFile;
using debctl::codec::ControlLoader;
using debctl::codec::FoldConfig;
using debctl::codec::OutputRecord;
using debctl::codec::RawRecord;
using debctl::codec::ReportWriter;
using debctl::codec::RoundTripEngine;
using debctl::codec::Schema;
using debctl::codec::UnknownFields;

namespace {

enum class Command { None, ToJson, FromJson, Fmt, Check };

struct Args {
    Command command{Command::None};
    std::vector<std::string> inputs;
    std::vector<std::string> list_keys;
    std::filesystem::path summary_path{};
    FoldConfig fold{};
    bool reject_unknown{false};
    bool single{false};
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Debian control file codec\n"
        << "Usage:\n"
        << "  " << argv0 << " to-json   [--list KEY]... [--reject-unknown] [--single] <file|->\n"
        << "  " << argv0 << " from-json [--wrap] [--width N] <file|->\n"
        << "  " << argv0 << " fmt       [--list KEY]... [--wrap] [--width N] <file|->\n"
        << "  " << argv0 << " check     [--list KEY]... [--summary PATH] <file-or-dir>...\n"
        << "\n"
        << "Options:\n"
        << "  --list KEY        Treat KEY as a comma-separated list (repeatable).\n"
        << "  --reject-unknown  Fail on keys that are not declared with --list.\n"
        << "  --single          Decode only the first record.\n"
        << "  --wrap            Wrap continuation lines on word boundaries.\n"
        << "  --width N         Wrap width in columns (default: 80).\n"
        << "  --summary PATH    Write the JSON check summary to PATH.\n"
        << "  -v, --verbose     Report progress on stderr.\n"
        << "  -h, --help        Show this help message.\n"
        << std::endl;
}

Command parse_command(std::string_view tok) {
    if (tok == "to-json") return Command::ToJson;
    if (tok == "from-json") return Command::FromJson;
    if (tok == "fmt") return Command::Fmt;
    if (tok == "check") return Command::Check;
    throw std::runtime_error("Unknown command: " + std::string(tok));
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (tok == "-h" || tok == "--help") {
            args.help = true;
            break;
        } else if (tok == "-v" || tok == "--verbose") {
            args.verbose = true;
        } else if (tok == "--list") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--list expects a value");
            }
            args.list_keys.emplace_back(argv[++i]);
        } else if (tok == "--summary") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--summary expects a value");
            }
            args.summary_path = std::filesystem::path(argv[++i]);
        } else if (tok == "--width") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--width expects a value");
            }
            const std::string value = argv[++i];
            // Digits only: no sign, no blanks
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                throw std::runtime_error("--width expects a number of columns, got '" + value + "'");
            }
            unsigned long width = 0;
            try {
                width = std::stoul(value);
            } catch (const std::out_of_range&) {
                throw std::runtime_error("--width is out of range: '" + value + "'");
            }
            if (width <= args.fold.continuation_indent) {
                throw std::runtime_error("--width expects a number of columns, got '" + value + "'");
            }
            args.fold.wrap_width = width;
        } else if (tok == "--wrap") {
            args.fold.wrap_long_lines = true;
        } else if (tok == "--reject-unknown") {
            args.reject_unknown = true;
        } else if (tok == "--single") {
            args.single = true;
        } else if (args.command == Command::None) {
            args.command = parse_command(tok);
        } else {
            args.inputs.emplace_back(tok);
        }
    }

    if (args.help) {
        return args;
    }
    if (args.command == Command::None) {
        throw std::runtime_error("No command given");
    }
    if (args.inputs.empty()) {
        if (args.command == Command::Check) {
            throw std::runtime_error("check expects at least one file or directory");
        }
        args.inputs.emplace_back("-");
    }
    if (args.command != Command::Check && args.inputs.size() > 1) {
        throw std::runtime_error("Only one input is accepted by this command");
    }
    return args;
}

Schema build_schema(const Args& args) {
    Schema schema;
    for (const auto& key : args.list_keys) {
        schema.list(key);
    }
    schema.unknown(args.reject_unknown ? UnknownFields::Reject : UnknownFields::AsScalar);
    return schema;
}

std::vector<OutputRecord> decode_stream(std::istream& input, const Schema& schema, bool single) {
    if (single) {
        return {schema.bind(debctl::codec::decode_record(input))};
    }
    debctl::codec::RecordReader reader(input);
    return debctl::codec::read_records(reader, [&schema](const RawRecord& record) { return schema.bind(record); });
}

std::vector<OutputRecord> decode_input(const std::string& input, const Schema& schema, bool single) {
    if (input == "-") {
        return decode_stream(std::cin, schema, single);
    }
    auto file = debctl::codec::open_input(input);
    try {
        return decode_stream(file, schema, single);
    } catch (const debctl::codec::DecodeError& error) {
        throw debctl::codec::ReadFileError(input, error);
    }
}

debctl::codec::json_bridge::json read_json(const std::string& input) {
    if (input == "-") {
        return debctl::codec::json_bridge::json::parse(std::cin);
    }
    auto file = debctl::codec::open_input(input);
    return debctl::codec::json_bridge::json::parse(file);
}

int run_to_json(const Args& args) {
    const auto records = decode_input(args.inputs.front(), build_schema(args), args.single);
    if (args.verbose) {
        std::cerr << "debctl: decoded " << records.size() << " record(s) from " << args.inputs.front() << "\n";
    }
    if (args.single) {
        std::cout << debctl::codec::json_bridge::to_json(records.front()).dump(2) << "\n";
    } else {
        std::cout << debctl::codec::json_bridge::to_json(records).dump(2) << "\n";
    }
    return 0;
}

int run_from_json(const Args& args) {
    const auto records = debctl::codec::json_bridge::records_from_json(read_json(args.inputs.front()));
    if (args.verbose) {
        std::cerr << "debctl: encoding " << records.size() << " record(s)\n";
    }
    debctl::codec::encode_records(std::cout, records, args.fold);
    return 0;
}

int run_fmt(const Args& args) {
    const auto records = decode_input(args.inputs.front(), build_schema(args), args.single);
    if (args.verbose) {
        std::cerr << "debctl: re-encoding " << records.size() << " record(s)\n";
    }
    debctl::codec::encode_records(std::cout, records, args.fold);
    return 0;
}

int aggregate_exit_code(const std::vector<CheckOutcome>& outcomes) {
    for (const auto& o : outcomes) {
        if (o.status == "ERROR" || o.status == "FAIL") return 1;
    }
    return 0;
}

int run_check(const Args& args) {
    ControlLoader loader;
    std::vector<ControlFile> files;
    for (const auto& path : args.inputs) {
        auto loaded = loader.load_directory(path);
        if (args.verbose) {
            std::cerr << "debctl: " << path << ": " << loaded.size() << " file(s)\n";
        }
        files.insert(files.end(),
                     std::make_move_iterator(loaded.begin()),
                     std::make_move_iterator(loaded.end()));
    }

    RoundTripEngine engine(RoundTripEngine::Config{.schema = build_schema(args), .fold = args.fold});
    const auto outcomes = engine.run(files);

    if (!args.summary_path.empty()) {
        ReportWriter writer;
        writer.write_summary(args.summary_path, outcomes);
    }

    std::size_t pass_cnt = 0, fail_cnt = 0, err_cnt = 0;
    for (const auto& o : outcomes) {
        if (o.status == "PASS") ++pass_cnt;
        else if (o.status == "FAIL") ++fail_cnt;
        else if (o.status == "ERROR") ++err_cnt;
        if (o.status != "PASS" || args.verbose) {
            std::cout << o.status << "  " << o.file << ": " << o.message << "\n";
        }
    }

    std::cout << "Round-trip check\n"
              << "  Files: " << outcomes.size() << "\n"
              << "  PASS: " << pass_cnt << "  FAIL: " << fail_cnt << "  ERROR: " << err_cnt << "\n";
    if (!args.summary_path.empty()) {
        std::cout << "Summary: " << args.summary_path << "\n";
    }

    return aggregate_exit_code(outcomes);
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        switch (args.command) {
            case Command::ToJson:
                return run_to_json(args);
            case Command::FromJson:
                return run_from_json(args);
            case Command::Fmt:
                return run_fmt(args);
            case Command::Check:
                return run_check(args);
            case Command::None:
                break;
        }
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;
    }
}
