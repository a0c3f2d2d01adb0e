// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <glib.h>

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "process.h"
#include "track_info.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static constexpr OutputMask kTrackInfoTypes =
    OutputType::kDiscInfo | OutputType::kStreamInfo |
    OutputType::kTitleCount | OutputType::kTitleInfo;

static void handle_stream_info(
    TrackAccumulator& acc,
    const StreamInfo& info) {

    TrackDescriptor& track = acc.current;
    if (info.stream_id != acc.stream_id) {
        acc.stream_id = info.stream_id;
        track.stream_type_code = 0;
    }
    if (info.id == kStreamType) {
        track.stream_type_code = info.code;
        return;
    }
    if (track.stream_type_code != kStreamTypeVideo) return;

    if (info.id == kStreamAspect) {
        track.aspect_ratio = trim(info.value);
    } else if (info.id == kStreamFps) {
        // "23.976 (24000/1001)"
        std::istringstream iss(info.value);
        std::string first;
        iss >> first;
        gchar* end = nullptr;
        const double fps = g_ascii_strtod(first.c_str(), &end);
        if (first.empty() || !end || *end != '\0') {
            g_warning("Invalid frame rate for title %d: '%s'",
                track.title_id, info.value.c_str());
            return;
        }
        track.frames_per_second = fps;
    }
}

static void handle_title_info(
    TrackAccumulator& acc,
    const TitleInfo& info) {

    TrackDescriptor& track = acc.current;
    if (info.id == kTitleFilename) {
        track.filename = extract_quoted_filename(info.value);
    } else if (info.id == kTitleDuration) {
        int seconds = 0;
        if (parse_duration(trim(info.value), seconds)) {
            track.duration_seconds = seconds;
        } else {
            g_warning("Invalid duration for title %d: '%s'",
                track.title_id, info.value.c_str());
        }
    }
}

static void begin_title(
    TrackAccumulator& acc,
    int title_id,
    const TrackSink& sink) {

    if (acc.pending && acc.current.title_id == title_id) return;
    acc = commit_pending_track(std::move(acc), sink);
    acc.pending = true;
    acc.current = TrackDescriptor{};
    acc.current.title_id = title_id;
    acc.stream_id = -1;
}

/* ------------------------------------------------------------------- */

namespace mkvrip::detail {

bool parse_duration(const std::string& hms, int& seconds) {
    if (hms.empty() || hms.back() == ':') return false;
    std::vector<std::string> parts;
    std::istringstream iss(hms);
    std::string part;
    while (std::getline(iss, part, ':')) parts.push_back(part);
    if (parts.size() != 3) return false;

    int h = 0;
    int m = 0;
    int s = 0;
    if (!parse_int_strict(parts[0], h) ||
        !parse_int_strict(parts[1], m) ||
        !parse_int_strict(parts[2], s) ||
        h < 0 || m < 0 || s < 0) {
        return false;
    }
    const long long total = static_cast<long long>(h) * 3600 + static_cast<long long>(m) * 60 + s;
    if (total > std::numeric_limits<int>::max()) return false;
    seconds = static_cast<int>(total);
    return true;
}

std::string extract_quoted_filename(const std::string& value) {
    const size_t open = value.find('"');
    if (open == std::string::npos) return value;
    const size_t close = value.find('"', open + 1);
    if (close == std::string::npos) return value.substr(open + 1);
    return value.substr(open + 1, close - open - 1);
}

std::string format_fps(double fps) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(15) << fps;
    std::string out = oss.str();
    if (std::isfinite(fps) && out.find_first_of(".e") == std::string::npos) {
        out += ".0";
    }
    return out;
}

TrackAccumulator accumulate_track_record(
    TrackAccumulator acc,
    const Record& record,
    const TrackSink& sink) {

    if (const auto* stream = std::get_if<StreamInfo>(&record)) {
        begin_title(acc, stream->title_id, sink);
        handle_stream_info(acc, *stream);
    } else if (const auto* title = std::get_if<TitleInfo>(&record)) {
        begin_title(acc, title->title_id, sink);
        handle_title_info(acc, *title);
    } else if (const auto* count = std::get_if<TitleCount>(&record)) {
        g_info("Found %d titles", count->count);
        if (sink.title_count) sink.title_count(count->count);
    }
    return acc;
}

TrackAccumulator commit_pending_track(
    TrackAccumulator acc,
    const TrackSink& sink) {

    if (!acc.pending) return acc;
    if (sink.commit) sink.commit(acc.current);
    ++acc.committed;
    acc.pending = false;
    acc.current = TrackDescriptor{};
    acc.stream_id = -1;
    return acc;
}

}  // namespace mkvrip::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int mkvrip_fetch_track_info(
    const MkvRipConfig* cfg,
    int disc_index,
    const MkvRipCallbacks* callbacks,
    const char** error) {

    clear_error(error);
    if (!cfg) {
        set_error(error, "Configuration is required");
        return -1;
    }

    std::string err;

    TrackSink sink;
    sink.commit = [callbacks](const TrackDescriptor& track) {
        if (!callbacks || !callbacks->on_track) return;
        const std::string fps = format_fps(track.frames_per_second);
        MkvRipTrack t{};
        t.title_id = track.title_id;
        t.duration_seconds = track.duration_seconds;
        t.aspect_ratio = track.aspect_ratio.c_str();
        t.fps = fps.c_str();
        t.forced = 0;
        t.source = kTrackSource;
        t.filename = track.filename.c_str();
        callbacks->on_track(&t, callbacks->user_data);
    };
    sink.title_count = [callbacks](int count) {
        if (callbacks && callbacks->on_title_count) {
            callbacks->on_title_count(count, callbacks->user_data);
        }
    };

    InfoThrottle throttle(throttle_policy_from_config(cfg));
    TrackAccumulator acc;
    const bool ok = run_info_query(
        build_info_arguments(disc_index, cfg->info_cache, {}),
        kTrackInfoTypes,
        to_string_or_empty(cfg->makemkvcon),
        throttle,
        callbacks,
        [&](const Record& record) {
            acc = accumulate_track_record(std::move(acc), record, sink);
        },
        err);
    if (!ok) {
        set_error(error, err);
        return -1;
    }
    acc = commit_pending_track(std::move(acc), sink);
    return acc.committed;
}

};
