#pragma once

// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#include <cctype>
#include <cstring>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "mkvrip/mkvrip.h"

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

// Helpers shared by every translation unit; inline definitions keep
// internal linkage.
static inline const char* make_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline const char* make_cstr_copy(const char* s) {
    return make_cstr_copy(s ? std::string{s} : std::string{});
}

static inline std::string to_string_or_empty(const char* s) {
    return s ? std::string{s} : std::string{};
}

static inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

// Whole string must be an integer (surrounding whitespace allowed).
static inline bool parse_int_strict(const std::string& s, int& out) {
    const std::string value = trim(s);
    if (value.empty()) return false;
    size_t idx = 0;
    try {
        const int v = std::stoi(value, &idx);
        if (idx != value.size()) return false;
        out = v;
        return true;
    } catch (...) {
        return false;
    }
}

static inline std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

static inline std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += args[i];
    }
    return out;
}

static inline void release_cstr(const char*& s) {
    delete[] s;
    s = nullptr;
}

static inline void set_error(const char** error, const std::string& message) {
    if (!error || *error) return;
    *error = make_cstr_copy(message);
}

static inline void clear_error(const char** error) {
    if (!error) return;
    mkvrip_release_error(*error);
    *error = nullptr;
}

static inline void notify_state(
    const MkvRipCallbacks* callbacks,
    MkvRipJobState state) {

    if (callbacks && callbacks->on_state) {
        callbacks->on_state(state, callbacks->user_data);
    }
}

}  // namespace mkvrip::detail
