#pragma once
#include <string>
#include <chrono>
#include <cstdint>

std::string getenv_or(const char* key, const std::string& def);
// Throws InvalidArgument when the variable is set but not an integer.
long long getenv_int_or(const char* key, long long def);

std::int64_t to_unix_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_unix_ms(std::int64_t ms);

std::string to_lower(std::string s);
