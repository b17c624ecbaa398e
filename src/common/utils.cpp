#include "common/utils.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <memory>
#include <cstdlib>
#include <ctime>
#include <cctype>

namespace fs = std::filesystem;

namespace utils {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

std::string getUrlPart(CURLU* url, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, flags) != CURLUE_OK || !value) {
        return "";
    }
    std::string result(value);
    curl_free(value);
    return result;
}

} // namespace

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
    if (!handle) {
        return std::nullopt;
    }

    // Non-http schemes such as postgresql:// need CURLU_NON_SUPPORT_SCHEME
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = getUrlPart(handle.get(), CURLUPART_SCHEME);
    parsed.host = getUrlPart(handle.get(), CURLUPART_HOST);
    parsed.user = getUrlPart(handle.get(), CURLUPART_USER, CURLU_URLDECODE);
    parsed.password = getUrlPart(handle.get(), CURLUPART_PASSWORD, CURLU_URLDECODE);
    parsed.path = getUrlPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE);
    parsed.query = getUrlPart(handle.get(), CURLUPART_QUERY);

    std::string port = getUrlPart(handle.get(), CURLUPART_PORT);
    if (!port.empty()) {
        try {
            parsed.port = std::stoi(port);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    if (!parsed.path.empty() && parsed.path.front() == '/') {
        parsed.path.erase(0, 1);
    }
    return parsed;
}

std::string sha256File(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        Logger::error("Failed to open file for checksum: " + filePath);
        return "";
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        Logger::error("Failed to create OpenSSL digest context");
        return "";
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Failed to initialize SHA-256 digest");
        return "";
    }

    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 &&
            EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            Logger::error("Failed to update digest for " + filePath);
            return "";
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Failed to finalize digest for " + filePath);
        return "";
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string sha256String(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        Logger::error("Failed to compute SHA-256 digest");
        return "";
    }
    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string sha256Path(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return sha256File(path);
    }
    std::string manifest;
    for (const auto& file : listFilesRecursive(path)) {
        manifest += fs::relative(file, path, ec).string() + ":" + sha256File(file) + "\n";
    }
    return sha256String(manifest);
}

std::vector<std::string> listFilesRecursive(const std::string& path) {
    std::vector<std::string> files;
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        files.push_back(path);
        return files;
    }
    if (!fs::is_directory(path, ec)) {
        return files;
    }
    for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

uint64_t pathSize(const std::string& path) {
    uint64_t total = 0;
    std::error_code ec;
    for (const auto& file : listFilesRecursive(path)) {
        auto size = fs::file_size(file, ec);
        if (!ec) {
            total += size;
        }
    }
    return total;
}

std::string formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << " " << units[unit];
    return ss.str();
}

TimePoint now() {
    return std::chrono::system_clock::now();
}

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

namespace {

std::tm toUtcTm(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string formatIsoTime(TimePoint tp) {
    std::tm tm = toUtcTm(tp);
    int64_t ms = toMillis(tp) % 1000;
    if (ms < 0) {
        ms += 1000;
    }
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

std::optional<TimePoint> parseIsoTime(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        digits = (digits + "000").substr(0, 3);
        millis = std::stoi(digits);
    }

    std::time_t t = timegm(&tm);
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

std::string compactTimestamp(TimePoint tp) {
    std::tm tm = toUtcTm(tp);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y%m%dT%H%M%S")
       << std::setw(3) << std::setfill('0') << (toMillis(tp) % 1000);
    return ss.str();
}

std::string generateId(const std::string& prefix) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << prefix << "-" << compactTimestamp(now()) << "-";
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }
    return ss.str();
}

std::string isoWeekKey(TimePoint tp) {
    std::tm tm = toUtcTm(tp);
    char buffer[16];
    // %G is the ISO week-based year, %V the ISO week number
    std::strftime(buffer, sizeof(buffer), "%G-W%V", &tm);
    return buffer;
}

std::string monthKey(TimePoint tp) {
    std::tm tm = toUtcTm(tp);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m", &tm);
    return buffer;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        parts.push_back(item);
    }
    return parts;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> getEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string getEnvOr(const std::string& name, const std::string& fallback) {
    auto value = getEnv(name);
    return value ? *value : fallback;
}

int getEnvInt(const std::string& name, int fallback) {
    auto value = getEnv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(*value);
    } catch (const std::exception&) {
        Logger::warning("Ignoring non-numeric value for " + name + ": " + *value);
        return fallback;
    }
}

bool getEnvBool(const std::string& name, bool fallback) {
    auto value = getEnv(name);
    if (!value) {
        return fallback;
    }
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return fallback;
}

} // namespace utils
