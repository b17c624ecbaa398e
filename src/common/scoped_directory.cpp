#include "common/scoped_directory.hpp"
#include "common/logger.hpp"

namespace fs = std::filesystem;

ScopedDirectory::ScopedDirectory(fs::path path, bool create)
    : path_(std::move(path)) {
    if (create) {
        fs::create_directories(path_);
    }
}

ScopedDirectory::~ScopedDirectory() {
    if (removed_) {
        return;
    }
    std::string error = remove();
    if (!error.empty()) {
        Logger::warning("Failed to remove scratch directory " + path_.string() + ": " + error);
    }
}

std::string ScopedDirectory::remove() {
    removed_ = true;
    std::error_code ec;
    fs::remove_all(path_, ec);
    return ec ? ec.message() : std::string();
}
