// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <glib.h>

#include <string>
#include <utility>

#include "robot.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

enum class Severity {
    kDebug,
    kInfo,
    kWarning,
    kCritical,
};

static void log_at(Severity severity, const std::string& text) {
    switch (severity) {
        case Severity::kDebug:
            g_debug("%s", text.c_str());
            break;
        case Severity::kInfo:
            g_info("%s", text.c_str());
            break;
        case Severity::kWarning:
            g_warning("%s", text.c_str());
            break;
        case Severity::kCritical:
            g_critical("%s", text.c_str());
            break;
    }
}

struct ReadErrorEntry {
    const char* error;
    Severity severity;
    const char* note;
};

static constexpr ReadErrorEntry kReadErrors[] = {
    {"Internal error - Operation result is incorrect (132)",
     Severity::kCritical, "error possibly fatal, creating zombie processes"},
    {"Scsi error - NOT READY:MEDIUM NOT PRESENT - TRAY OPEN",
     Severity::kInfo, "error mostly non fatal"},
    {"Scsi error - MEDIUM ERROR:L-EC UNCORRECTABLE ERROR",
     Severity::kCritical, "error possibly fatal, medium removed during mkv backup"},
    {"Scsi error - HARDWARE ERROR:441E",
     Severity::kCritical, "error possibly fatal, medium removed during mkv backup"},
};

static constexpr const char* kWriteErrorMissingPath =
    "Posix error - No such file or directory";

struct LogOnlyEntry {
    int code;
    Severity severity;
};

static constexpr LogOnlyEntry kLogOnlyCodes[] = {
    {kRipDiscOpenError, Severity::kInfo},
    {kRipTitleError, Severity::kWarning},
    {kRipCompleted, Severity::kInfo},
    {kLibmkvTrace, Severity::kWarning},
    {kRipBackupFailedPre, Severity::kWarning},
    {kEvaluationPeriodExpiredInfo, Severity::kWarning},
};

static constexpr int kPromotedCodes[] = {
    kEvaluationPeriodExpiredShareware,
    kRipBackupFailed,
};

static const ReadErrorEntry* find_read_error(const std::string& error) {
    for (const auto& entry : kReadErrors) {
        if (error == entry.error) return &entry;
    }
    return nullptr;
}

static const LogOnlyEntry* find_log_only(int code) {
    for (const auto& entry : kLogOnlyCodes) {
        if (entry.code == code) return &entry;
    }
    return nullptr;
}

static bool is_promoted(int code) {
    for (int c : kPromotedCodes) {
        if (c == code) return true;
    }
    return false;
}

static bool promote(
    const Message& message,
    Record& out,
    std::string& err) {

    ErrorMessage error;
    if (!make_error_message(message, error, err)) return false;
    out = std::move(error);
    return true;
}

static bool classify_read_error(
    const Message& message,
    Record& out,
    std::string& err) {

    ErrorMessage error;
    if (!make_error_message(message, error, err)) return false;

    const ReadErrorEntry* entry = find_read_error(error.error);
    if (entry) {
        log_at(Severity::kDebug, entry->note);
        log_at(entry->severity, message.text);
    } else {
        log_at(Severity::kWarning, error.error);
    }
    out = std::move(error);
    return true;
}

static bool classify_write_error(
    const Message& message,
    Record& out,
    std::string& err) {

    ErrorMessage error;
    if (!make_error_message(message, error, err)) return false;

    if (error.error == kWriteErrorMissingPath) {
        log_at(Severity::kCritical, message.text);
    } else {
        log_at(Severity::kWarning, error.error);
    }
    out = std::move(error);
    return true;
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

bool make_error_message(
    const Message& message,
    ErrorMessage& out,
    std::string& err) {

    if (message.params.size() < 2) {
        err = "Malformed error message " + std::to_string(message.code) +
            ": expected at least 2 parameters, got " +
            std::to_string(message.params.size());
        return false;
    }
    out = ErrorMessage{};
    out.code = message.code;
    out.flags = message.flags;
    out.count = message.count;
    out.text = message.text;
    out.format = message.format;
    out.error = message.params.front();
    out.params.assign(message.params.begin() + 1, message.params.end());
    return true;
}

bool classify_message(
    const Message& message,
    Record& out,
    std::string& err) {

    if (message.code == kReadError) {
        return classify_read_error(message, out, err);
    }
    if (message.code == kWriteError) {
        return classify_write_error(message, out, err);
    }
    if (is_promoted(message.code)) {
        return promote(message, out, err);
    }
    if (const LogOnlyEntry* entry = find_log_only(message.code)) {
        log_at(entry->severity, message.text);
    }
    out = message;
    return true;
}

}  // namespace mkvrip::detail
