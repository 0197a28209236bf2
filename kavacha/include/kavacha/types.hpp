#pragma once
// Core types: the atoms of the armor
//
// Time, bounded memory, and text handling shared by every layer.
// Nothing here knows about attacks, minds, or seals.

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <string>
#include <vector>

namespace kavacha {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Confidence values live in [0, 1]
inline float clamp_unit(float value) {
    if (!(value == value)) return 0.0f;  // NaN
    return std::clamp(value, 0.0f, 1.0f);
}

// Monotonic, process-unique identifier with a prefix ("verify_17")
inline std::string next_id(const char* prefix) {
    static std::atomic<uint64_t> counter{0};
    return std::string(prefix) + "_" + std::to_string(now()) + "_" +
           std::to_string(++counter);
}

// Bounded FIFO history: oldest entries fall off the front
template<typename T>
class BoundedHistory {
public:
    explicit BoundedHistory(size_t capacity = 100) : capacity_(std::max<size_t>(capacity, 1)) {}

    void push(T item) {
        items_.push_back(std::move(item));
        while (items_.size() > capacity_) {
            items_.pop_front();
        }
    }

    // Most recent n entries, oldest first
    std::vector<T> recent(size_t n) const {
        size_t count = std::min(n, items_.size());
        return std::vector<T>(items_.end() - static_cast<std::ptrdiff_t>(count), items_.end());
    }

    void set_capacity(size_t capacity) {
        capacity_ = std::max<size_t>(capacity, 1);
        while (items_.size() > capacity_) {
            items_.pop_front();
        }
    }

    size_t capacity() const { return capacity_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    void clear() { items_.clear(); }

private:
    size_t capacity_;
    std::deque<T> items_;
};

namespace text {

inline std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// Cut to at most max_bytes without splitting a UTF-8 sequence
inline std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

// Drop ASCII control characters except tab, newline, carriage return
inline std::string strip_control(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if ((u < 0x20 && c != '\t' && c != '\n' && c != '\r') || u == 0x7F) continue;
        out += c;
    }
    return out;
}

// Lowercased alphanumeric tokens, apostrophes dropped ("don't" -> "dont")
inline std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || u >= 0x80) {
            current += static_cast<char>(std::tolower(u));
        } else if (c == '\'') {
            continue;
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

// Replace invalid UTF-8 bytes with U+FFFD so the text can enter a JSON value
inline std::string valid_utf8(const std::string& input) {
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool ok = len > 0 && i + len <= input.size();
        for (size_t k = 1; ok && k < len; ++k) {
            ok = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (ok) {
            output.append(input, i, len);
            i += len;
        } else {
            output += replacement;
            ++i;
        }
    }
    return output;
}

} // namespace text

// Running 64-bit digest (FNV-1a). Tamper detection only, not a trust root.
class Digest {
public:
    Digest& update(const std::string& s) {
        for (char c : s) {
            state_ ^= static_cast<unsigned char>(c);
            state_ *= 0x100000001b3ULL;
        }
        return *this;
    }

    Digest& update(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            state_ ^= (v >> (i * 8)) & 0xFF;
            state_ *= 0x100000001b3ULL;
        }
        return *this;
    }

    uint64_t value() const { return state_; }

    std::string hex() const {
        char buf[17];
        snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(state_));
        return buf;
    }

private:
    uint64_t state_ = 0xcbf29ce484222325ULL;
};

} // namespace kavacha
