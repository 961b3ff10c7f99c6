#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t current_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto start = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();

    if (start >= end) return "";
    return std::string(start, end);
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::optional<int> parse_hhmm(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) return std::nullopt;

    try {
        int hours = std::stoi(text.substr(0, colon));
        int minutes = std::stoi(text.substr(colon + 1));
        if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
            return std::nullopt;
        }
        return hours * 60 + minutes;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace util
