#pragma once

#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <pwd.h>
#include <unistd.h>

namespace lc::config {

// "250ms", "5s", "2m", "1h"; a bare number is seconds
inline std::chrono::milliseconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");
    if (!std::isdigit(static_cast<unsigned char>(str.front())))
        throw std::invalid_argument("Duration must start with a digit: " + str);

    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(str, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid duration: " + str);
    }

    const auto unit = str.substr(pos);
    if (unit.empty() || unit == "s") return std::chrono::seconds(value);
    if (unit == "ms") return std::chrono::milliseconds(value);
    if (unit == "m") return std::chrono::minutes(value);
    if (unit == "h") return std::chrono::hours(value);

    throw std::invalid_argument("Invalid duration unit '" + unit + "' in: " + str);
}

inline std::string currentUserName() {
    if (const auto* pw = getpwuid(getuid())) return {pw->pw_name};
    throw std::runtime_error("Unable to resolve login name for uid " + std::to_string(getuid()));
}

}
