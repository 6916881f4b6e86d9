#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long long getenv_int_or(const char* key, long long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        std::size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != std::char_traits<char>::length(v)) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw InvalidArgument(std::string(key) + " must be an integer, got '" + v + "'");
    }
}

std::int64_t to_unix_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}
