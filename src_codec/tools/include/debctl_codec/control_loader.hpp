#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace debctl::codec {

/**
 * \brief Raw bytes of one control file, kept verbatim for round-trip comparison.
 */
struct ControlFile {
    std::filesystem::path path;
    std::string contents;
};

/**
 * \brief Loads control files (debian/control, apt `Packages` lists, ...) from disk.
 *
 * load_directory() walks a directory recursively and returns its regular files sorted
 * by path; a plain file yields itself. Hidden files (name starting with '.') are skipped
 * when walking. Decoding is left to the caller.
 */
class ControlLoader {
public:
    ControlLoader() = default;

    [[nodiscard]] ControlFile load(const std::filesystem::path& file) const;

    [[nodiscard]] std::vector<ControlFile> load_directory(const std::filesystem::path& root) const;
};

}  // namespace debctl::codec
