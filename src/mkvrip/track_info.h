#pragma once

// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <functional>
#include <string>

#include "robot.h"

namespace mkvrip::detail {

constexpr const char* kTrackSource = "MakeMKV";

struct TrackDescriptor {
    int title_id{0};
    int duration_seconds{0};
    std::string aspect_ratio;
    double frames_per_second{0.0};
    std::string filename;
    // Type of the stream currently described by SINFO lines; never persisted.
    int stream_type_code{0};
};

struct TrackSink {
    std::function<void(const TrackDescriptor&)> commit;
    std::function<void(int count)> title_count;
};

// Folded over the records of one info query. Relies on all records of a
// title arriving contiguously.
struct TrackAccumulator {
    bool pending{false};
    TrackDescriptor current;
    int stream_id{-1};
    int committed{0};
};

TrackAccumulator accumulate_track_record(
    TrackAccumulator acc,
    const Record& record,
    const TrackSink& sink);

TrackAccumulator commit_pending_track(
    TrackAccumulator acc,
    const TrackSink& sink);

// "H:MM:SS" to seconds.
bool parse_duration(const std::string& hms, int& seconds);

// Text between the first pair of double quotes; the rest after a lone quote;
// otherwise the value itself.
std::string extract_quoted_filename(const std::string& value);

// 23.976 -> "23.976", 25 -> "25.0"
std::string format_fps(double fps);

}  // namespace mkvrip::detail
