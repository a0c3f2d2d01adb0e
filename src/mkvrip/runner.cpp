// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <gio/gio.h>
#include <glib.h>

#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "process.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static std::string take_gerror(GError* gerr, const char* fallback) {
    std::string message = (gerr && gerr->message) ? gerr->message : fallback;
    if (gerr) g_error_free(gerr);
    return message;
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

std::string resolve_makemkvcon(const std::string& configured) {
    if (!configured.empty()) return configured;
    gchar* found = g_find_program_in_path(kMakemkvconName);
    if (found) {
        std::string path = found;
        g_free(found);
        return path;
    }
    // Container images install here without putting it on PATH.
    return kMakemkvconFallbackPath;
}

RobotRun::RobotRun(
    std::vector<std::string> arguments,
    OutputMask select,
    std::string executable)
    : select_(select) {

    command_.reserve(arguments.size() + 3);
    command_.push_back(resolve_makemkvcon(executable));
    command_.emplace_back("--robot");
    command_.emplace_back("--messages=-stdout");
    for (auto& arg : arguments) command_.push_back(std::move(arg));
}

RobotRun::~RobotRun() {
    if (process_ && !finished_) {
        // Abandoned mid-stream: do not leave makemkvcon running.
        g_subprocess_force_exit(process_);
        close_streams();
        g_subprocess_wait(process_, nullptr, nullptr);
    }
    close_streams();
    if (process_) {
        g_object_unref(process_);
        process_ = nullptr;
    }
}

void RobotRun::close_streams() {
    if (stdout_) {
        g_input_stream_close(G_INPUT_STREAM(stdout_), nullptr, nullptr);
        g_object_unref(stdout_);
        stdout_ = nullptr;
    }
}

bool RobotRun::start(std::string& err) {
    if (process_) {
        err = "makemkvcon is already running";
        return false;
    }

    std::vector<const gchar*> argv;
    argv.reserve(command_.size() + 1);
    for (const auto& arg : command_) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    const std::string command_line = join_args(command_);
    g_debug("command: '%s'", command_line.c_str());

    GError* gerr = nullptr;
    process_ = g_subprocess_newv(argv.data(), G_SUBPROCESS_FLAGS_STDOUT_PIPE, &gerr);
    if (!process_) {
        err = "Failed to start " + command_.front() + ": " +
            take_gerror(gerr, "unknown error");
        return false;
    }
    g_debug("PID %s: command: '%s'",
        g_subprocess_get_identifier(process_),
        command_line.c_str());

    stdout_ = g_data_input_stream_new(g_subprocess_get_stdout_pipe(process_));
    g_data_input_stream_set_newline_type(stdout_, G_DATA_STREAM_NEWLINE_TYPE_ANY);
    return true;
}

bool RobotRun::next(Record& out) {
    if (!stdout_ || exhausted_) return false;

    for (;;) {
        gsize length = 0;
        GError* gerr = nullptr;
        char* raw = g_data_input_stream_read_line(stdout_, &length, nullptr, &gerr);
        if (!raw) {
            if (gerr) read_error_ = take_gerror(gerr, "read failed");
            exhausted_ = true;
            return false;
        }
        std::string line(raw, length);
        g_free(raw);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        g_debug("%s", line.c_str());

        Record record;
        std::string decode_err;
        if (!decode_line(line, record, decode_err)) {
            g_warning("%s", decode_err.c_str());
            unparsed_.push_back(std::move(line));
            continue;
        }
        if (mask_contains(select_, record_type(record))) {
            out = std::move(record);
            return true;
        }
    }
}

bool RobotRun::finish(std::string& err) {
    if (!process_) {
        err = "makemkvcon was not started";
        return false;
    }
    if (finished_) {
        err = "makemkvcon run already finished";
        return false;
    }

    // Unread lines still belong to this run and must be judged.
    Record ignored;
    while (next(ignored)) {
    }

    GError* gerr = nullptr;
    const bool waited = g_subprocess_wait(process_, nullptr, &gerr);
    close_streams();
    finished_ = true;
    if (!waited) {
        err = "Failed to wait for makemkvcon: " + take_gerror(gerr, "unknown error");
        return false;
    }

    int status = 0;
    if (g_subprocess_get_if_exited(process_)) {
        status = g_subprocess_get_exit_status(process_);
    } else if (g_subprocess_get_if_signaled(process_)) {
        status = -g_subprocess_get_term_sig(process_);
    }

    const std::string output = join_lines(unparsed_);
    if (status != 0) {
        g_debug("MakeMKV command: '%s'", join_args(command_).c_str());
        if (!output.empty()) g_debug("MakeMKV output: %s", output.c_str());
        err = "Call to MakeMKV failed with code: " + std::to_string(status);
        g_critical("%s", err.c_str());
        if (!output.empty()) err += "\n" + output;
        return false;
    }
    if (!read_error_.empty()) {
        err = "Failed to read MakeMKV output: " + read_error_;
        g_critical("%s", err.c_str());
        return false;
    }
    if (!unparsed_.empty()) {
        g_warning("Cannot parse %zu lines: %s", unparsed_.size(), output.c_str());
        err = "Call to MakeMKV failed with code: 0 (" +
            std::to_string(unparsed_.size()) + " unparsed lines)\n" + output;
        g_critical("Call to MakeMKV failed with code: 0");
        return false;
    }
    g_info("MakeMKV exits gracefully.");
    return true;
}

bool run_robot(
    const std::vector<std::string>& arguments,
    OutputMask select,
    const std::string& executable,
    const RecordHandler& on_record,
    std::string& err) {

    RobotRun run(arguments, select, executable);
    if (!run.start(err)) return false;
    Record record;
    while (run.next(record)) {
        if (on_record) on_record(record);
    }
    return run.finish(err);
}

}  // namespace mkvrip::detail
