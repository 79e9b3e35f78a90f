// ontoreg list: print every cached ontology file

#include "cli/commands.h"
#include "cli/registry_session.h"
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace ontoreg {
namespace cli {
namespace commands {

namespace {

std::string formatSize(uintmax_t size) {
    if (size >= 1024ULL * 1024 * 1024) {
        return std::to_string(size / (1024ULL * 1024 * 1024)) + " GB";
    }
    if (size >= 1024ULL * 1024) {
        return std::to_string(size / (1024ULL * 1024)) + " MB";
    }
    if (size >= 1024ULL) {
        return std::to_string(size / 1024ULL) + " KB";
    }
    return std::to_string(size) + " B";
}

}  // namespace

int list(const ListOptions& options) {
    auto registry = openRegistry(options.registry_dir);
    const auto files = registry->list();

    std::cout << std::left
              << std::setw(48) << "NAME"
              << std::setw(12) << "SIZE"
              << "PATH"
              << std::endl;

    for (const auto& file : files) {
        const std::filesystem::path path(file);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);

        std::cout << std::left
                  << std::setw(48) << path.filename().string()
                  << std::setw(12) << (ec ? std::string("-") : formatSize(size))
                  << file
                  << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace ontoreg
