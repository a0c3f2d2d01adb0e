#pragma once

// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <functional>
#include <string>
#include <vector>

#include <gio/gio.h>

#include "mkvrip/mkvrip.h"
#include "robot.h"

namespace mkvrip::detail {

/* ------------------------------------------------------------------- */
/* Stream runner */

constexpr const char* kMakemkvconName = "makemkvcon";
constexpr const char* kMakemkvconFallbackPath = "/usr/local/bin/makemkvcon";

// Configured path if non-empty, then PATH lookup, then the fixed install location.
std::string resolve_makemkvcon(const std::string& configured);

// One makemkvcon robot mode invocation. Records are pulled one at a time;
// the sequence cannot be restarted.
class RobotRun {
public:
    RobotRun(
        std::vector<std::string> arguments,
        OutputMask select,
        std::string executable = {});
    ~RobotRun();

    RobotRun(const RobotRun&) = delete;
    RobotRun& operator=(const RobotRun&) = delete;

    bool start(std::string& err);
    // Blocks until the next selected record; false once the output is exhausted.
    bool next(Record& out);
    // Waits for the child and judges the whole run.
    bool finish(std::string& err);

    const std::vector<std::string>& command() const { return command_; }
    const std::vector<std::string>& unparsed() const { return unparsed_; }

private:
    void close_streams();

    std::vector<std::string> command_;
    OutputMask select_;
    GSubprocess* process_{nullptr};
    GDataInputStream* stdout_{nullptr};
    std::vector<std::string> unparsed_;
    std::string read_error_;
    bool exhausted_{false};
    bool finished_{false};
};

using RecordHandler = std::function<void(const Record&)>;

// Runs makemkvcon to completion, handing every selected record to on_record.
bool run_robot(
    const std::vector<std::string>& arguments,
    OutputMask select,
    const std::string& executable,
    const RecordHandler& on_record,
    std::string& err);

/* ------------------------------------------------------------------- */
/* Concurrency throttle */

using ProcessCounter = std::function<int(const std::string& name)>;
using Sleeper = std::function<void(int seconds)>;

// Number of running processes whose command name matches.
int count_processes(const std::string& name);

struct ThrottlePolicy {
    std::string process_name = kMakemkvconName;
    // 0 disables throttling.
    int max_processes = 1;
    int poll_interval_sec = 10;
    int cooldown_sec = 60;
};

// makemkvcon info queries corrupt sibling invocations, so they wait until
// few enough instances run. The count is external; this only polls it.
class InfoThrottle {
public:
    InfoThrottle(
        ThrottlePolicy policy,
        ProcessCounter counter = count_processes,
        Sleeper sleeper = {});

    void acquire();
    void release();

private:
    void wait_until_below(int interval_sec);

    ThrottlePolicy policy_;
    ProcessCounter counter_;
    Sleeper sleeper_;
};

/* ------------------------------------------------------------------- */
/* Info queries */

// info --cache=N <options...> disc:N
std::vector<std::string> build_info_arguments(
    int disc_index,
    int cache_mb,
    const std::vector<std::string>& options);

// Throttled info query. Job state goes WAITING, INFO, WAITING, RIPPING;
// the throttle is released even when the run fails.
bool run_info_query(
    const std::vector<std::string>& arguments,
    OutputMask select,
    const std::string& executable,
    InfoThrottle& throttle,
    const MkvRipCallbacks* callbacks,
    const RecordHandler& on_record,
    std::string& err);

ThrottlePolicy throttle_policy_from_config(const MkvRipConfig* cfg);

// Shell-style split of the configured extra makemkvcon arguments.
bool split_mkv_args(
    const std::string& args,
    std::vector<std::string>& out,
    std::string& err);

}  // namespace mkvrip::detail
