// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <glib.h>

#include <string>
#include <vector>

#include "internal.h"
#include "process.h"

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

std::vector<std::string> build_info_arguments(
    int disc_index,
    int cache_mb,
    const std::vector<std::string>& options) {

    std::vector<std::string> args;
    args.emplace_back("info");
    args.push_back("--cache=" + std::to_string(cache_mb));
    args.insert(args.end(), options.begin(), options.end());
    args.push_back("disc:" + std::to_string(disc_index));
    return args;
}

bool run_info_query(
    const std::vector<std::string>& arguments,
    OutputMask select,
    const std::string& executable,
    InfoThrottle& throttle,
    const MkvRipCallbacks* callbacks,
    const RecordHandler& on_record,
    std::string& err) {

    notify_state(callbacks, MKVRIP_JOB_STATE_VIDEO_WAITING);
    throttle.acquire();
    notify_state(callbacks, MKVRIP_JOB_STATE_VIDEO_INFO);

    const bool ok = run_robot(arguments, select, executable, on_record, err);

    g_info("MakeMKV info exits.");
    notify_state(callbacks, MKVRIP_JOB_STATE_VIDEO_WAITING);
    throttle.release();
    notify_state(callbacks, MKVRIP_JOB_STATE_VIDEO_RIPPING);
    return ok;
}

ThrottlePolicy throttle_policy_from_config(const MkvRipConfig* cfg) {
    ThrottlePolicy policy;
    if (!cfg) return policy;
    policy.max_processes = cfg->max_concurrent_info;
    policy.poll_interval_sec = cfg->poll_interval;
    policy.cooldown_sec = cfg->info_wait_time;
    return policy;
}

bool split_mkv_args(
    const std::string& args,
    std::vector<std::string>& out,
    std::string& err) {

    out.clear();
    if (trim(args).empty()) return true;

    gint argc = 0;
    gchar** argv = nullptr;
    GError* gerr = nullptr;
    if (!g_shell_parse_argv(args.c_str(), &argc, &argv, &gerr)) {
        err = "Invalid mkv_args '" + args + "': " +
            ((gerr && gerr->message) ? gerr->message : "parse error");
        if (gerr) g_error_free(gerr);
        return false;
    }
    for (gint i = 0; i < argc; ++i) out.emplace_back(argv[i]);
    g_strfreev(argv);
    return true;
}

}  // namespace mkvrip::detail
