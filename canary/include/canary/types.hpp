#pragma once
// Core types: time, identifiers and text helpers shared by the ledger
//
// Time is intrinsic. Every judgement about staleness is made against
// an explicit Timestamp so a single query never sees two different "nows".

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <optional>
#include <random>
#include <string>

namespace canary {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Source of "now" for a session. Injected so expiry can be driven by tests.
using Clock = std::function<Timestamp()>;

inline Clock system_clock() {
    return [] { return now(); };
}

// Short identifier: 8 lowercase hex chars, the token cited in answers as [id]
inline std::string generate_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint32_t> dis;
    char buf[9];
    snprintf(buf, sizeof(buf), "%08x", dis(gen));
    return buf;
}

// ISO-8601 UTC with millisecond precision: 2024-05-01T12:30:00.250Z
inline std::string format_timestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

// Accepts YYYY-MM-DDTHH:MM:SS with optional fraction (any precision) and
// optional trailing Z. Naive timestamps are read as UTC.
inline std::optional<Timestamp> parse_timestamp(const std::string& s) {
    int year, mon, day, hour, min, sec;
    int consumed = 0;
    if (sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
               &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (pos < s.size() && s[pos] == 'Z') ++pos;
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t secs = timegm(&tm);
    return static_cast<Timestamp>(secs) * 1000 + millis;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text helpers (UTF-8 aware: excerpts never split a code point)
// ═══════════════════════════════════════════════════════════════════════════

inline size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// First max_chars code points of s
inline std::string excerpt(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) return s.substr(0, i);
            ++chars;
        }
    }
    return s;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Lowercases ASCII only; multi-byte sequences pass through untouched
inline std::string ascii_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

// 0.85 -> "85%"
inline std::string percent(float value) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%.0f%%", value * 100.0f);
    return buf;
}

} // namespace canary
