#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <limits>
#include <stdexcept>

int parse_int(const std::string& value, int min, int max, bool& ok) {
    long v = parse_long(value, min, max, ok);
    return ok ? static_cast<int>(v) : 0;
}

long parse_long(const std::string& value, long min, long max, bool& ok) {
    ok = false;
    try {
        size_t pos = 0;
        long v = std::stol(value, &pos);
        if (pos != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    unsigned long long mult = 1;
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("b")) {
        val.pop_back();
    }
    bool num_ok = false;
    size_t base = parse_size_t(val, 0, std::numeric_limits<size_t>::max(), num_ok);
    if (!num_ok)
        return 0;
    if (base != 0 && mult > std::numeric_limits<size_t>::max() / base)
        return 0;
    ok = true;
    return static_cast<size_t>(base * mult);
}

bool parse_bool(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v.empty() || v == "1" || v == "true" || v == "yes" || v == "on";
}
