#pragma once

#include <filesystem>
#include <string>

// Owns a scratch directory and removes it, with everything below it, when
// it goes out of scope.
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::filesystem::path path, bool create = true);
    ~ScopedDirectory();

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string string() const { return path_.string(); }

    // Removes the directory now. Returns an error description, empty on success.
    std::string remove();

private:
    std::filesystem::path path_;
    bool removed_{false};
};
