// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <glib.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "internal.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static constexpr const char* kGroup = "mkvrip";

static void replace_cstr(
    const char*& target,
    const std::string& value) {

    release_cstr(target);
    target = make_cstr_copy(value);
}

static std::string strip_inline_comment_value(
    const std::string& raw) {

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    for (size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (ch == '\'' && !in_double) {
            in_single = !in_single;
            continue;
        }
        if (ch == '"' && !in_single) {
            in_double = !in_double;
            continue;
        }
        if (!in_single && !in_double && (ch == '#' || ch == ';')) {
            if (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1]))) {
                return trim(raw.substr(0, i));
            }
        }
    }
    return trim(raw);
}

static MkvRipConfig* make_default_config() {
    auto* cfg = new MkvRipConfig{};
    cfg->makemkvcon = nullptr;
    cfg->max_concurrent_info = 1;
    cfg->info_wait_time = 60;
    cfg->poll_interval = 10;
    cfg->info_cache = 1;
    cfg->mkv_args = nullptr;
    cfg->min_length = 600;
    cfg->max_length = 99999;
    cfg->progress_log = nullptr;
    cfg->config_path = nullptr;
    return cfg;
}

// Reads [mkvrip] key; false with err set on failure, true with found=false when absent.
static bool read_string_key(
    GKeyFile* key_file,
    const char* key,
    std::string& out,
    bool& found,
    std::string& err) {

    found = false;
    if (!g_key_file_has_key(key_file, kGroup, key, nullptr)) return true;
    GError* gerr = nullptr;
    char* value = g_key_file_get_string(key_file, kGroup, key, &gerr);
    if (!value) {
        err = std::string{"Failed to parse "} + key +
            (gerr && gerr->message ? std::string{": "} + gerr->message : std::string{});
        if (gerr) g_error_free(gerr);
        return false;
    }
    out = strip_inline_comment_value(value);
    g_free(value);
    found = true;
    return true;
}

static bool read_int_key(
    GKeyFile* key_file,
    const char* key,
    int minimum,
    int& out,
    std::string& err) {

    std::string raw;
    bool found = false;
    if (!read_string_key(key_file, key, raw, found, err)) return false;
    if (!found) return true;
    int parsed = 0;
    if (!parse_int_strict(raw, parsed) || parsed < minimum) {
        err = std::string{"Invalid "} + key + " value: " + raw;
        return false;
    }
    out = parsed;
    return true;
}

static bool read_path_key(
    GKeyFile* key_file,
    const char* key,
    const char*& out,
    std::string& err) {

    std::string raw;
    bool found = false;
    if (!read_string_key(key_file, key, raw, found, err)) return false;
    if (!found) return true;
    if (raw.empty()) {
        release_cstr(out);
    } else {
        replace_cstr(out, raw);
    }
    return true;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

MkvRipConfig* mkvrip_load_config(
    const char* path,
    const char** error) {

    clear_error(error);

    auto* cfg = make_default_config();
    GKeyFile* key_file = g_key_file_new();
    bool loaded = false;
    std::string loaded_path;

    auto fail = [&](const std::string& message) -> MkvRipConfig* {
        set_error(error, message);
        mkvrip_release_config(cfg);
        g_key_file_unref(key_file);
        return nullptr;
    };

    std::vector<std::string> candidates;
    if (path) {
        candidates.emplace_back(path);
    } else {
        candidates.emplace_back("mkvrip.conf");
        const char* home = std::getenv("HOME");
        if (home) {
            const std::filesystem::path home_path = std::filesystem::path(home) / ".mkvrip.conf";
            candidates.emplace_back(home_path.string());
        }
    }

    for (const auto& candidate : candidates) {
        GError* gerr = nullptr;
        if (g_key_file_load_from_file(key_file, candidate.c_str(), G_KEY_FILE_NONE, &gerr)) {
            loaded = true;
            loaded_path = candidate;
            break;
        }
        if (gerr) {
            if (path) {
                const std::string message = gerr->message ? gerr->message : "Failed to load config";
                g_error_free(gerr);
                return fail(message);
            }
            g_error_free(gerr);
        }
    }

    if (!loaded) {
        g_key_file_unref(key_file);
        return cfg;
    }

    std::string err;
    if (!read_path_key(key_file, "makemkvcon", cfg->makemkvcon, err) ||
        !read_int_key(key_file, "max_concurrent_info", 0, cfg->max_concurrent_info, err) ||
        !read_int_key(key_file, "info_wait_time", 0, cfg->info_wait_time, err) ||
        !read_int_key(key_file, "poll_interval", 1, cfg->poll_interval, err) ||
        !read_int_key(key_file, "info_cache", 1, cfg->info_cache, err) ||
        !read_path_key(key_file, "mkv_args", cfg->mkv_args, err) ||
        !read_int_key(key_file, "min_length", 0, cfg->min_length, err) ||
        !read_int_key(key_file, "max_length", 0, cfg->max_length, err) ||
        !read_path_key(key_file, "progress_log", cfg->progress_log, err)) {
        return fail(err);
    }

    g_key_file_unref(key_file);
    cfg->config_path = make_cstr_copy(loaded_path);
    g_debug("Loaded config from %s", loaded_path.c_str());
    return cfg;
}

void mkvrip_release_config(
    MkvRipConfig* cfg) {

    if (!cfg) return;
    release_cstr(cfg->makemkvcon);
    release_cstr(cfg->mkv_args);
    release_cstr(cfg->progress_log);
    release_cstr(cfg->config_path);
    delete cfg;
}

};
