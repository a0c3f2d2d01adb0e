// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <string>
#include <vector>

#include "robot.h"

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

// Python-like str.split(sep, maxsplit); maxsplit < 0 splits everything.
static std::vector<std::string> split_limited(
    const std::string& s,
    const std::string& sep,
    int maxsplit) {

    std::vector<std::string> parts;
    size_t start = 0;
    int splits = 0;
    while (maxsplit < 0 || splits < maxsplit) {
        const size_t pos = s.find(sep, start);
        if (pos == std::string::npos) break;
        parts.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
        ++splits;
    }
    parts.push_back(s.substr(start));
    return parts;
}

static std::string strip_one_quote(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    if (end > begin && s[begin] == '"') ++begin;
    if (end > begin && s[end - 1] == '"') --end;
    return s.substr(begin, end - begin);
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

std::vector<std::string> split_fields(
    const std::string& payload,
    int fixed_fields,
    int quoted_fields) {

    // Leading numeric fields never contain commas; the last piece carries
    // every quoted string (which may).
    std::vector<std::string> header = split_limited(payload, ",", fixed_fields);
    const std::string tail = header.back();
    header.pop_back();

    std::vector<std::string> tokens = std::move(header);
    for (const auto& piece : split_limited(tail, "\",\"", quoted_fields)) {
        tokens.push_back(strip_one_quote(piece));
    }
    return tokens;
}

}  // namespace mkvrip::detail
