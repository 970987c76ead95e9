#include "debctl_codec/control_loader.hpp"

#include "debctl_codec/file_io.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

bool is_hidden(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

}  // namespace

namespace debctl::codec {

ControlFile ControlLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Control file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Control path is not a regular file: " + file.string());
    }

    auto input = open_input(file);
    std::ostringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        throw std::runtime_error("Unable to read control file: " + file.string());
    }

    return ControlFile{file, contents.str()};
}

std::vector<ControlFile> ControlLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw std::runtime_error("Control root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return {load(root)};
    }

    std::vector<std::filesystem::path> files;
    for (auto it = std::filesystem::recursive_directory_iterator(root);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
        if (is_hidden(it->path())) {
            if (it->is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file()) {
            files.emplace_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());

    std::vector<ControlFile> loaded;
    loaded.reserve(files.size());
    for (const auto& path : files) {
        loaded.emplace_back(load(path));
    }
    return loaded;
}

}  // namespace debctl::codec
