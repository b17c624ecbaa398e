#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string user;
    std::string password;
    std::string path;   // without the leading '/'
    std::string query;
};

// Parses a URL with libcurl's URL API. Percent-encoded user, password and
// path components come back decoded.
std::optional<ParsedUrl> parseUrl(const std::string& url);

// Lower-case hex SHA-256 of a file's contents; empty string on read failure.
std::string sha256File(const std::string& filePath);
std::string sha256String(const std::string& data);
// For a directory: SHA-256 over "relative/path:sha256" lines in sorted order.
std::string sha256Path(const std::string& path);

// Sorted regular files under a path (the path itself if it is a file).
std::vector<std::string> listFilesRecursive(const std::string& path);

// Size of a file, or the sum of all regular files below a directory.
uint64_t pathSize(const std::string& path);

std::string formatBytes(uint64_t bytes);

TimePoint now();
int64_t toMillis(TimePoint tp);
TimePoint fromMillis(int64_t ms);

// ISO-8601 in UTC with millisecond precision: 2024-01-31T02:00:00.000Z
std::string formatIsoTime(TimePoint tp);
std::optional<TimePoint> parseIsoTime(const std::string& text);

// Compact UTC stamp used in backup ids: 20240131T020000123
std::string compactTimestamp(TimePoint tp);

// "<prefix>-<compact timestamp>-<8 random hex chars>"
std::string generateId(const std::string& prefix);

// ISO-8601 week of a UTC instant, as "YYYY-Www".
std::string isoWeekKey(TimePoint tp);
// Calendar month of a UTC instant, as "YYYY-MM".
std::string monthKey(TimePoint tp);

std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delimiter);
bool endsWith(const std::string& s, const std::string& suffix);

std::optional<std::string> getEnv(const std::string& name);
std::string getEnvOr(const std::string& name, const std::string& fallback);
int getEnvInt(const std::string& name, int fallback);
bool getEnvBool(const std::string& name, bool fallback);

} // namespace utils
