// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <glib.h>

#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "process.h"
#include "rip.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static void forward_message(
    const MkvRipCallbacks* callbacks,
    const Message& message,
    const std::string* error_text) {

    if (!callbacks || !callbacks->on_message) return;
    std::vector<const char*> params;
    params.reserve(message.params.size());
    for (const auto& p : message.params) params.push_back(p.c_str());

    MkvRipMessage m{};
    m.code = message.code;
    m.flags = message.flags;
    m.count = message.count;
    m.text = message.text.c_str();
    m.format = message.format.c_str();
    m.is_error = error_text != nullptr;
    m.error_text = error_text ? error_text->c_str() : nullptr;
    m.params = params.empty() ? nullptr : params.data();
    m.params_count = params.size();
    callbacks->on_message(&m, callbacks->user_data);
}

static void forward_progress(
    const MkvRipCallbacks* callbacks,
    const Record& record) {

    if (!callbacks || !callbacks->on_progress) return;
    MkvRipProgress p{};
    if (const auto* values = std::get_if<ProgressValues>(&record)) {
        p.kind = MKVRIP_PROGRESS_VALUES;
        p.current = values->current;
        p.total = values->total;
        p.maximum = values->maximum;
        p.name = "";
    } else if (const auto* current = std::get_if<ProgressCurrent>(&record)) {
        p.kind = MKVRIP_PROGRESS_CURRENT_TITLE;
        p.code = current->code;
        p.op_id = current->op_id;
        p.name = current->name.c_str();
    } else if (const auto* total = std::get_if<ProgressTotal>(&record)) {
        p.kind = MKVRIP_PROGRESS_TOTAL_TITLE;
        p.code = total->code;
        p.op_id = total->op_id;
        p.name = total->name.c_str();
    } else {
        return;
    }
    callbacks->on_progress(&p, callbacks->user_data);
}

static void handle_rip_record(
    const MkvRipCallbacks* callbacks,
    const Record& record) {

    if (const auto* error = std::get_if<ErrorMessage>(&record)) {
        forward_message(callbacks, *error, &error->error);
    } else if (const auto* message = std::get_if<Message>(&record)) {
        forward_message(callbacks, *message, nullptr);
    } else {
        forward_progress(callbacks, record);
    }
}

static bool prepare_rip(
    const MkvRipConfig* cfg,
    const MkvRipRequest* request,
    const MkvRipCallbacks* callbacks,
    RipArguments& rip,
    OutputMask& select,
    std::string& err) {

    if (!cfg || !request) {
        err = "Configuration and request are required";
        return false;
    }
    if (!request->destination || !*request->destination) {
        err = "Destination directory is required";
        return false;
    }
    if (!split_mkv_args(to_string_or_empty(cfg->mkv_args), rip.extra, err)) {
        return false;
    }

    select = static_cast<OutputMask>(OutputType::kMessage);
    const bool wants_progress = callbacks && callbacks->on_progress;
    if (cfg->progress_log && *cfg->progress_log) {
        rip.progress = cfg->progress_log;
        g_debug("logging progress to '%s'", cfg->progress_log);
    } else if (wants_progress) {
        // Progress lines interleave with the robot output on stdout.
        rip.progress = "-same";
    }
    if (wants_progress) {
        select = select | OutputType::kProgressValues |
            OutputType::kProgressCurrent | OutputType::kProgressTotal;
    }

    rip.device = to_string_or_empty(request->device);
    rip.disc_index = request->disc_index;
    rip.title_id = request->title_id;
    rip.destination = request->destination;
    rip.min_length = cfg->min_length;
    return true;
}

static int finish_rip(
    bool ok,
    const std::string& err,
    const MkvRipCallbacks* callbacks,
    const char** error) {

    if (ok) return 1;
    if (callbacks && callbacks->on_notify) {
        callbacks->on_notify(kRipFailedTitle, kRipFailedBody, callbacks->user_data);
    }
    set_error(error, err);
    return 0;
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

std::vector<std::string> build_mkv_arguments(const RipArguments& rip) {
    std::vector<std::string> args;
    args.emplace_back("mkv");
    args.insert(args.end(), rip.extra.begin(), rip.extra.end());
    if (!rip.progress.empty()) args.push_back("--progress=" + rip.progress);
    args.push_back("dev:" + rip.device);
    if (rip.title_id < 0) {
        args.emplace_back("all");
        args.push_back(rip.destination);
        args.push_back("--minlength=" + std::to_string(rip.min_length));
    } else {
        args.push_back(std::to_string(rip.title_id));
        args.push_back(rip.destination);
    }
    return args;
}

std::vector<std::string> build_backup_arguments(const RipArguments& rip) {
    std::vector<std::string> args;
    args.emplace_back("backup");
    args.emplace_back("--decrypt");
    args.insert(args.end(), rip.extra.begin(), rip.extra.end());
    args.push_back("--minlength=" + std::to_string(rip.min_length));
    if (!rip.progress.empty()) args.push_back("--progress=" + rip.progress);
    args.push_back("disc:" + std::to_string(rip.disc_index));
    args.push_back(rip.destination);
    return args;
}

}  // namespace mkvrip::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int mkvrip_rip_titles(
    const MkvRipConfig* cfg,
    const MkvRipRequest* request,
    const MkvRipCallbacks* callbacks,
    const char** error) {

    clear_error(error);
    RipArguments rip;
    OutputMask select = 0;
    std::string err;
    if (!prepare_rip(cfg, request, callbacks, rip, select, err)) {
        set_error(error, err);
        return 0;
    }
    if (rip.device.empty()) {
        set_error(error, "Device path is required");
        return 0;
    }

    if (rip.title_id < 0) {
        g_info("Process all tracks from disc.");
    } else {
        g_info("Ripping title %d to %s", rip.title_id, rip.destination.c_str());
    }
    const bool ok = run_robot(
        build_mkv_arguments(rip),
        select,
        to_string_or_empty(cfg->makemkvcon),
        [callbacks](const Record& record) { handle_rip_record(callbacks, record); },
        err);
    return finish_rip(ok, err, callbacks, error);
}

int mkvrip_backup_disc(
    const MkvRipConfig* cfg,
    const MkvRipRequest* request,
    const MkvRipCallbacks* callbacks,
    const char** error) {

    clear_error(error);
    RipArguments rip;
    OutputMask select = 0;
    std::string err;
    if (!prepare_rip(cfg, request, callbacks, rip, select, err)) {
        set_error(error, err);
        return 0;
    }
    if (rip.disc_index < 0) {
        set_error(error, "Disc index is required for backup");
        return 0;
    }

    g_info("Backing up disc");
    const bool ok = run_robot(
        build_backup_arguments(rip),
        select,
        to_string_or_empty(cfg->makemkvcon),
        [callbacks](const Record& record) { handle_rip_record(callbacks, record); },
        err);
    return finish_rip(ok, err, callbacks, error);
}

};
