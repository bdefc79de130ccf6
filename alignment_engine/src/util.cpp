#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

namespace {

// Unset variables keep the default; unparsable ones are reported and ignored
template <typename T, typename Parse>
T read_env_number(const std::string& name, T default_value, const char* kind, Parse parse) {
    const char* raw = std::getenv(name.c_str());
    if (!raw) {
        return default_value;
    }
    try {
        std::size_t consumed = 0;
        T parsed = parse(std::string(raw), &consumed);
        if (consumed == std::char_traits<char>::length(raw)) {
            return parsed;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}={}: not a valid {} ({})", name, raw, kind, e.what());
        return default_value;
    }
    spdlog::warn("Ignoring {}={}: trailing characters after {}", name, raw, kind);
    return default_value;
}

} // namespace

int get_env_int(const std::string& name, int default_value) {
    return read_env_number<int>(name, default_value, "integer",
                                [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); });
}

double get_env_double(const std::string& name, double default_value) {
    return read_env_number<double>(name, default_value, "number",
                                   [](const std::string& s, std::size_t* pos) { return std::stod(s, pos); });
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : static_cast<char>(c);
    });
    return out;
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        // Date-only form
        tm = {};
        std::istringstream date_ss(iso_string);
        date_ss >> std::get_time(&tm, "%Y-%m-%d");
        if (date_ss.fail()) {
            throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
        }
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

double clamp_unit(double value) {
    if (!std::isfinite(value)) {
        if (std::isnan(value)) return 0.0;
        return value > 0 ? 1.0 : -1.0;
    }
    return std::max(-1.0, std::min(1.0, value));
}

double clamp_confidence(double value) {
    if (std::isnan(value)) return 0.0;
    return std::max(0.0, std::min(1.0, value));
}

double safe_divide(double numerator, double denominator, double fallback) {
    if (denominator == 0.0 || !std::isfinite(denominator) || !std::isfinite(numerator)) {
        return fallback;
    }
    return numerator / denominator;
}

} // namespace util
