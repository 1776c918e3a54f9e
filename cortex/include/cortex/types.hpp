#pragma once
// Core types: the atoms of the kernel
//
// Time, identifiers and the JSON value type that flows through
// every primitive call. Everything else is built from these.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace cortex {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Monotonic clock in fractional milliseconds (for durations only)
inline double monotonic_ms() {
    auto duration = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double, std::milli>(duration).count();
}

// Short prefixed identifier: "mem_1a2b3c4d", "chain_9f8e7d6c", ...
inline std::string generate_id(const char* prefix) {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static thread_local std::uniform_int_distribution<uint32_t> dis;
    char buf[16];
    snprintf(buf, sizeof(buf), "%08x", dis(gen));
    return std::string(prefix) + "_" + buf;
}

// Lowercase copy (ASCII)
inline std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Split on whitespace, dropping words shorter than min_len
inline std::vector<std::string> split_words(const std::string& text, size_t min_len = 1) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        if (word.size() >= min_len) {
            words.push_back(std::move(word));
        }
    }
    return words;
}

// Render a JSON value as plain text (strings unquoted)
inline std::string value_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

// Truncate to at most n bytes without splitting a UTF-8 sequence
inline std::string truncate(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    size_t cut = n;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

} // namespace cortex
