#pragma once

// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <stdint.h>

#include <string>
#include <variant>
#include <vector>

namespace mkvrip::detail {

/* ------------------------------------------------------------------- */
/* makemkvcon robot mode records */

// The tag before the first colon of every robot mode line.
enum class OutputType : uint32_t {
    kDrive = 1u << 0,            // DRV
    kMessage = 1u << 1,          // MSG
    kDiscInfo = 1u << 2,         // CINFO
    kStreamInfo = 1u << 3,       // SINFO
    kTitleCount = 1u << 4,       // TCOUNT
    kTitleInfo = 1u << 5,        // TINFO
    kProgressValues = 1u << 6,   // PRGV
    kProgressCurrent = 1u << 7,  // PRGC
    kProgressTotal = 1u << 8,    // PRGT
};

using OutputMask = uint32_t;

constexpr OutputMask operator|(OutputType a, OutputType b) {
    return static_cast<OutputMask>(a) | static_cast<OutputMask>(b);
}

constexpr OutputMask operator|(OutputMask a, OutputType b) {
    return a | static_cast<OutputMask>(b);
}

constexpr bool mask_contains(OutputMask mask, OutputType type) {
    return (mask & static_cast<OutputMask>(type)) != 0;
}

constexpr OutputMask kAllOutputTypes = 0x1ffu;

// Known message codes.
enum MessageId : int {
    kLibmkvTrace = 1002,
    kVersionInfo = 1005,
    kGenericInfo = 1011,
    kReadError = 2003,
    kWriteError = 2019,
    kComplexMultiplex = 3024,
    kTitleSkipped = 3025,
    kTitleAdded = 3028,
    kSubtitleSkippedIdentical = 3030,
    kAudioSkippedEmpty = 3034,
    kFileAdded = 3307,
    kRipTitleError = 5003,
    kRipCompleted = 5004,
    kRipDiscOpenError = 5010,
    kRipSummaryBefore = 5014,
    kRipSummaryAfter = 5037,
    kEvaluationPeriodExpiredInfo = 5052,
    kEvaluationPeriodExpiredShareware = 5055,
    kRipBackupFailed = 5080,
    kRipBackupFailedPre = 5096,
};

// Attribute ids of SINFO lines.
enum StreamAttribute : int {
    kStreamUnknown = 0,
    kStreamType = 1,
    kStreamAspect = 20,
    kStreamFps = 21,
};

// Attribute ids of TINFO lines.
enum TitleAttribute : int {
    kTitleDuration = 9,
    kTitleFilename = 27,
};

constexpr int kStreamTypeVideo = 6201;
constexpr int kUnknownDriveEnabled = 999;
constexpr int kAllDiscsIndex = 9999;

enum class DriveVisibility : int {
    kEmpty = 0,
    kOpen = 1,
    kLoaded = 2,
    kLoading = 3,
    kNotAttached = 256,
};

enum class MediaKind {
    kUnknown,
    kCD,
    kDVD,
    kBluRay,
};

struct Drive {
    std::string mount;
    std::string disc_label;
    std::string firmware_name;
    int media_flags{0};
    bool enabled{false};
    int visibility_code{0};
    int index{0};
    // Derived from visibility_code and media_flags.
    bool loaded{false};
    bool tray_open{false};
    bool attached{true};
    MediaKind media_kind{MediaKind::kUnknown};
};

struct Message {
    int code{0};
    int flags{0};
    int count{0};
    std::string text;
    std::string format;
    std::vector<std::string> params;
};

// Message promoted by the classifier; error holds the first parameter,
// params holds the rest.
struct ErrorMessage : Message {
    std::string error;
};

struct TitleCount {
    int count{0};
};

struct DiscInfo {
    int id{0};
    int code{0};
    std::string value;
};

struct TitleInfo : DiscInfo {
    int title_id{0};
};

struct StreamInfo : TitleInfo {
    int stream_id{0};
};

struct ProgressValues {
    int current{0};
    int total{0};
    int maximum{0};
};

struct ProgressTitle {
    int code{0};
    int op_id{0};
    std::string name;
};

struct ProgressCurrent : ProgressTitle {};
struct ProgressTotal : ProgressTitle {};

using Record = std::variant<
    Drive,
    Message,
    ErrorMessage,
    TitleCount,
    DiscInfo,
    TitleInfo,
    StreamInfo,
    ProgressValues,
    ProgressCurrent,
    ProgressTotal>;

OutputType record_type(const Record& record);
const char* output_type_name(OutputType type);
bool parse_output_type(const std::string& tag, OutputType& out);

/* ------------------------------------------------------------------- */
/* Tokenizer */

constexpr int kUnlimitedFields = -1;

// Split fixed_fields times on ',' then split the tail on '","'
// quoted_fields times (kUnlimitedFields for no limit). Quoted fields
// must not contain the literal '","'.
std::vector<std::string> split_fields(
    const std::string& payload,
    int fixed_fields,
    int quoted_fields);

/* ------------------------------------------------------------------- */
/* Decoder */

Drive make_drive(
    std::string mount,
    std::string disc_label,
    std::string firmware_name,
    int media_flags,
    int enabled_raw,
    int visibility_code,
    int index);

bool decode_line(
    const std::string& line,
    Record& out,
    std::string& err);

/* ------------------------------------------------------------------- */
/* Classifier */

bool make_error_message(
    const Message& message,
    ErrorMessage& out,
    std::string& err);

bool classify_message(
    const Message& message,
    Record& out,
    std::string& err);

}  // namespace mkvrip::detail
