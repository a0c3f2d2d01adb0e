// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <glib.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include "internal.h"
#include "process.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static void sleep_seconds(int seconds) {
    std::this_thread::sleep_for(std::chrono::seconds(seconds));
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

int count_processes(const std::string& name) {
    GError* gerr = nullptr;
    GDir* dir = g_dir_open("/proc", 0, &gerr);
    if (!dir) {
        g_warning("Cannot list processes: %s", gerr ? gerr->message : "unknown error");
        if (gerr) g_error_free(gerr);
        return 0;
    }

    int count = 0;
    while (const gchar* entry = g_dir_read_name(dir)) {
        if (!g_ascii_isdigit(entry[0])) continue;
        gchar* path = g_build_filename("/proc", entry, "comm", nullptr);
        gchar* contents = nullptr;
        // Processes may exit while we look; unreadable entries are skipped.
        if (g_file_get_contents(path, &contents, nullptr, nullptr)) {
            if (trim(contents) == name) ++count;
            g_free(contents);
        }
        g_free(path);
    }
    g_dir_close(dir);
    return count;
}

InfoThrottle::InfoThrottle(
    ThrottlePolicy policy,
    ProcessCounter counter,
    Sleeper sleeper)
    : policy_(std::move(policy)),
      counter_(counter ? std::move(counter) : ProcessCounter{count_processes}),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper{sleep_seconds}) {}

void InfoThrottle::acquire() {
    if (policy_.max_processes <= 0) return;
    wait_until_below(policy_.poll_interval_sec);
}

void InfoThrottle::release() {
    if (policy_.max_processes <= 0) return;
    // Give other jobs a chance before the next rip starts.
    g_info("Penalty %ds", policy_.cooldown_sec);
    sleeper_(std::max(0, policy_.cooldown_sec));
    wait_until_below(policy_.cooldown_sec);
}

void InfoThrottle::wait_until_below(int interval_sec) {
    const int interval = std::max(1, interval_sec);
    for (;;) {
        const int running = counter_(policy_.process_name);
        if (running <= policy_.max_processes) return;
        g_info("%d %s processes running (limit %d), waiting %ds",
            running,
            policy_.process_name.c_str(),
            policy_.max_processes,
            interval);
        sleeper_(interval);
    }
}

}  // namespace mkvrip::detail
