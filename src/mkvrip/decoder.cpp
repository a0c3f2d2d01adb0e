// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "robot.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

struct TagEntry {
    const char* tag;
    OutputType type;
};

static constexpr TagEntry kTags[] = {
    {"DRV", OutputType::kDrive},
    {"MSG", OutputType::kMessage},
    {"CINFO", OutputType::kDiscInfo},
    {"SINFO", OutputType::kStreamInfo},
    {"TCOUNT", OutputType::kTitleCount},
    {"TINFO", OutputType::kTitleInfo},
    {"PRGV", OutputType::kProgressValues},
    {"PRGC", OutputType::kProgressCurrent},
    {"PRGT", OutputType::kProgressTotal},
};

static bool expect_count(
    const std::vector<std::string>& tokens,
    size_t expected,
    const std::string& tag,
    std::string& err) {

    if (tokens.size() == expected) return true;
    err = "Unexpected field count for " + tag + ": " +
        std::to_string(tokens.size()) + " (expected " + std::to_string(expected) + ")";
    return false;
}

static bool to_int(
    const std::string& token,
    const char* field,
    int& out,
    std::string& err) {

    if (parse_int_strict(token, out)) return true;
    err = std::string{"Invalid integer for "} + field + ": '" + token + "'";
    return false;
}

static MediaKind media_kind_from_flags(int flags) {
    switch (flags) {
        case 0: return MediaKind::kCD;
        case 1: return MediaKind::kDVD;
        case 12:  // both are Blu-ray discs
        case 28: return MediaKind::kBluRay;
        default: return MediaKind::kUnknown;
    }
}

static bool decode_message(
    const std::string& content,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 3, kUnlimitedFields);
    if (tokens.size() < 5) {
        err = "Unexpected field count for MSG: " + std::to_string(tokens.size());
        return false;
    }
    Message msg;
    if (!to_int(tokens[0], "code", msg.code, err)) return false;
    if (!to_int(tokens[1], "flags", msg.flags, err)) return false;
    if (!to_int(tokens[2], "count", msg.count, err)) return false;
    msg.text = std::move(tokens[3]);
    msg.format = std::move(tokens[4]);
    msg.params.assign(
        std::make_move_iterator(tokens.begin() + 5),
        std::make_move_iterator(tokens.end()));
    return classify_message(msg, out, err);
}

static bool decode_drive(
    const std::string& content,
    Record& out,
    std::string& err) {

    // Wire: index,visible,enabled,flags,name,disc,mount
    auto tokens = split_fields(content, 4, 2);
    if (!expect_count(tokens, 7, "DRV", err)) return false;
    std::vector<std::string> fields(tokens.rbegin(), tokens.rend());

    int flags = 0;
    int enabled = 0;
    int visible = 0;
    int index = 0;
    if (!to_int(fields[3], "flags", flags, err)) return false;
    if (!to_int(fields[4], "enabled", enabled, err)) return false;
    if (!to_int(fields[5], "visible", visible, err)) return false;
    if (!to_int(fields[6], "index", index, err)) return false;
    out = make_drive(
        std::move(fields[0]),
        std::move(fields[1]),
        std::move(fields[2]),
        flags,
        enabled,
        visible,
        index);
    return true;
}

// Shared tail of CINFO/TINFO/SINFO: id,code,value
static bool fill_disc_info(
    std::vector<std::string>& info,
    DiscInfo& out,
    std::string& err) {

    if (!to_int(info[0], "id", out.id, err)) return false;
    if (!to_int(info[1], "code", out.code, err)) return false;
    out.value = std::move(info[2]);
    return true;
}

static bool decode_disc_info(
    const std::string& content,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 2, 0);
    if (!expect_count(tokens, 3, "CINFO", err)) return false;
    DiscInfo info;
    if (!fill_disc_info(tokens, info, err)) return false;
    out = std::move(info);
    return true;
}

static bool decode_title_info(
    const std::string& content,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 3, 0);
    if (!expect_count(tokens, 4, "TINFO", err)) return false;
    // The title id leads on the wire but extends the CINFO shape.
    std::vector<std::string> info(tokens.begin() + 1, tokens.end());
    TitleInfo title;
    if (!fill_disc_info(info, title, err)) return false;
    if (!to_int(tokens[0], "title id", title.title_id, err)) return false;
    out = std::move(title);
    return true;
}

static bool decode_stream_info(
    const std::string& content,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 4, 0);
    if (!expect_count(tokens, 5, "SINFO", err)) return false;
    std::vector<std::string> info(tokens.begin() + 2, tokens.end());
    StreamInfo stream;
    if (!fill_disc_info(info, stream, err)) return false;
    if (!to_int(tokens[0], "title id", stream.title_id, err)) return false;
    if (!to_int(tokens[1], "stream id", stream.stream_id, err)) return false;
    out = std::move(stream);
    return true;
}

static bool decode_title_count(
    const std::string& content,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 0, 0);
    if (!expect_count(tokens, 1, "TCOUNT", err)) return false;
    TitleCount count;
    if (!to_int(tokens[0], "count", count.count, err)) return false;
    out = count;
    return true;
}

static bool decode_progress_values(
    const std::string& content,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 2, 0);
    if (!expect_count(tokens, 3, "PRGV", err)) return false;
    ProgressValues values;
    if (!to_int(tokens[0], "current", values.current, err)) return false;
    if (!to_int(tokens[1], "total", values.total, err)) return false;
    if (!to_int(tokens[2], "maximum", values.maximum, err)) return false;
    out = values;
    return true;
}

template <typename T>
static bool decode_progress_title(
    const std::string& content,
    const std::string& tag,
    Record& out,
    std::string& err) {

    auto tokens = split_fields(content, 2, 0);
    if (!expect_count(tokens, 3, tag, err)) return false;
    T title;
    if (!to_int(tokens[0], "code", title.code, err)) return false;
    if (!to_int(tokens[1], "operation id", title.op_id, err)) return false;
    title.name = std::move(tokens[2]);
    out = std::move(title);
    return true;
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

const char* output_type_name(OutputType type) {
    for (const auto& entry : kTags) {
        if (entry.type == type) return entry.tag;
    }
    return "?";
}

bool parse_output_type(const std::string& tag, OutputType& out) {
    for (const auto& entry : kTags) {
        if (tag == entry.tag) {
            out = entry.type;
            return true;
        }
    }
    return false;
}

OutputType record_type(const Record& record) {
    switch (record.index()) {
        case 0: return OutputType::kDrive;
        case 1:
        case 2: return OutputType::kMessage;
        case 3: return OutputType::kTitleCount;
        case 4: return OutputType::kDiscInfo;
        case 5: return OutputType::kTitleInfo;
        case 6: return OutputType::kStreamInfo;
        case 7: return OutputType::kProgressValues;
        case 8: return OutputType::kProgressCurrent;
        default: return OutputType::kProgressTotal;
    }
}

Drive make_drive(
    std::string mount,
    std::string disc_label,
    std::string firmware_name,
    int media_flags,
    int enabled_raw,
    int visibility_code,
    int index) {

    Drive d;
    d.mount = std::move(mount);
    d.disc_label = std::move(disc_label);
    d.firmware_name = std::move(firmware_name);
    d.media_flags = media_flags;
    d.enabled = enabled_raw == kUnknownDriveEnabled;
    d.visibility_code = visibility_code;
    d.index = index;

    switch (static_cast<DriveVisibility>(visibility_code)) {
        case DriveVisibility::kEmpty:
            break;
        case DriveVisibility::kOpen:
            d.tray_open = true;
            break;
        case DriveVisibility::kLoaded:
        case DriveVisibility::kLoading:
            d.loaded = true;
            break;
        default:
            // Undocumented values count as detached.
            d.attached = false;
            break;
    }
    // Flags describe the medium, so they only mean something with a disc inside.
    d.media_kind = d.loaded ? media_kind_from_flags(media_flags) : MediaKind::kUnknown;
    return d;
}

bool decode_line(
    const std::string& line,
    Record& out,
    std::string& err) {

    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
        err = "No message type detected";
        return false;
    }
    const std::string tag = line.substr(0, colon);
    const std::string content = line.substr(colon + 1);

    OutputType type;
    if (!parse_output_type(tag, type)) {
        err = "Cannot parse '" + tag + "':'" + content + "'";
        return false;
    }

    switch (type) {
        case OutputType::kMessage:
            return decode_message(content, out, err);
        case OutputType::kDrive:
            return decode_drive(content, out, err);
        case OutputType::kDiscInfo:
            return decode_disc_info(content, out, err);
        case OutputType::kTitleInfo:
            return decode_title_info(content, out, err);
        case OutputType::kStreamInfo:
            return decode_stream_info(content, out, err);
        case OutputType::kTitleCount:
            return decode_title_count(content, out, err);
        case OutputType::kProgressValues:
            return decode_progress_values(content, out, err);
        case OutputType::kProgressCurrent:
            return decode_progress_title<ProgressCurrent>(content, tag, out, err);
        case OutputType::kProgressTotal:
            return decode_progress_title<ProgressTotal>(content, tag, out, err);
    }
    err = "Cannot handle '" + tag + "':'" + content + "'";
    return false;
}

}  // namespace mkvrip::detail
