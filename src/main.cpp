// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include "mkvrip/mkvrip.h"
#include "version.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <cstdlib>
#include <vector>

#include <glib.h>

namespace {

std::string view_string(const char* s) {
    return s ? std::string{s} : std::string{};
}

const char* media_label(MkvRipMediaKind kind) {
    switch (kind) {
        case MKVRIP_MEDIA_CD: return "CD";
        case MKVRIP_MEDIA_DVD: return "DVD";
        case MKVRIP_MEDIA_BLURAY: return "Blu-ray";
        default: return "-";
    }
}

const char* state_label(MkvRipJobState state) {
    switch (state) {
        case MKVRIP_JOB_STATE_VIDEO_WAITING: return "waiting";
        case MKVRIP_JOB_STATE_VIDEO_INFO: return "info";
        case MKVRIP_JOB_STATE_VIDEO_RIPPING: return "ripping";
    }
    return "?";
}

std::string fmt_duration(int sec) {
    if (sec < 0) sec = 0;
    std::ostringstream os;
    os << sec / 3600 << ":"
       << std::setw(2) << std::setfill('0') << (sec / 60) % 60 << ":"
       << std::setw(2) << std::setfill('0') << sec % 60;
    return os.str();
}

struct TitleEntry {
    int title_id;
    int duration_seconds;
};

// State shared with the C callbacks through user_data.
struct Job {
    std::vector<TitleEntry> titles;
    int title_count{-1};
    bool fatal_message{false};
    std::string current_operation;
};

void on_state(MkvRipJobState state, void*) {
    g_debug("Job state: %s", state_label(state));
}

void on_track(const MkvRipTrack* track, void* user_data) {
    auto* job = static_cast<Job*>(user_data);
    std::cout << "Title " << std::setw(2) << track->title_id
              << " [" << fmt_duration(track->duration_seconds) << "]"
              << " aspect=" << (view_string(track->aspect_ratio).empty() ? "-" : track->aspect_ratio)
              << " fps=" << view_string(track->fps)
              << " file=\"" << view_string(track->filename) << "\"\n";
    job->titles.push_back(TitleEntry{track->title_id, track->duration_seconds});
}

void on_title_count(int count, void* user_data) {
    auto* job = static_cast<Job*>(user_data);
    job->title_count = count;
    std::cout << "Disc reports " << count << " titles\n";
}

void on_notify(const char* title, const char* body, void*) {
    std::cerr << "\n*** " << view_string(title) << " ***\n" << view_string(body) << "\n";
}

void on_message(const MkvRipMessage* message, void* user_data) {
    auto* job = static_cast<Job*>(user_data);
    if (message->is_error) {
        std::cerr << "\nError " << message->code << ": " << view_string(message->error_text) << "\n";
        // Shareware expiry and backup failure end the job.
        if (message->code == 5055 || message->code == 5080) {
            job->fatal_message = true;
        }
        return;
    }
    std::cout << "\n" << view_string(message->text) << "\n";
}

void on_progress(const MkvRipProgress* progress, void* user_data) {
    auto* job = static_cast<Job*>(user_data);
    if (progress->kind == MKVRIP_PROGRESS_CURRENT_TITLE) {
        job->current_operation = view_string(progress->name);
        return;
    }
    if (progress->kind != MKVRIP_PROGRESS_VALUES || progress->maximum <= 0) return;

    const double percent = 100.0 * progress->total / progress->maximum;
    const int bar_width = 20;
    int filled = static_cast<int>(percent / 100.0 * bar_width);
    if (filled > bar_width) filled = bar_width;
    std::string bar(filled, '=');
    if (filled < bar_width) {
        bar.push_back('>');
        bar.append(bar_width - filled - 1, '-');
    }
    std::cout << "\r[" << bar << "] " << std::setw(3) << static_cast<int>(percent) << "% "
              << job->current_operation;
    std::cout.flush();
}

MkvRipCallbacks make_callbacks(Job& job, bool with_progress) {
    MkvRipCallbacks cb{};
    cb.on_state = on_state;
    cb.on_track = on_track;
    cb.on_title_count = on_title_count;
    cb.on_notify = on_notify;
    cb.on_message = on_message;
    cb.on_progress = with_progress ? on_progress : nullptr;
    cb.user_data = &job;
    return cb;
}

bool report_error(const char* err, const char* fallback) {
    std::cerr << (err ? view_string(err) : std::string{fallback}) << "\n";
    mkvrip_release_error(err);
    return false;
}

}  // namespace

struct Options {
    std::string command;
    std::string config_file;
    std::optional<std::string> device;
    std::optional<int> disc_index;
    std::optional<int> title_id;  // unset => automatic selection
    bool all_titles = false;
    std::string output;
    std::string decode_path;
    bool verbose = false;
    bool no_progress = false;
};

void print_usage() {
    std::cout << "Usage: mkvrip [-i config] [-v] <command> [args]\n";
    std::cout << "Commands:\n";
    std::cout << "  drives                                  List attached optical drives\n";
    std::cout << "  info   (-n index | -d device)           List titles of the disc\n";
    std::cout << "  rip    -d device -o dir [-t title|all]  Rip titles to MKV (default: by length limits)\n";
    std::cout << "  backup (-n index | -d device) -o dir    Back up the decrypted disc\n";
    std::cout << "  decode [file]                           Decode robot mode lines (default: stdin)\n";
    std::cout << "Options:\n";
    std::cout << "  -i  / --input: mkvrip config file path (default search: ./mkvrip.conf --> ~/.mkvrip.conf)\n";
    std::cout << "  -d  / --device: Device path (e.g. /dev/sr0)\n";
    std::cout << "  -n  / --index: makemkvcon disc index\n";
    std::cout << "  -t  / --title: Title id or \"all\"\n";
    std::cout << "  -o  / --output: Destination directory\n";
    std::cout << "  -np / --no-progress: Do not show progress\n";
    std::cout << "  -v  / --verbose: Show debug log\n";
    std::cout << "  -V  / --version: Show version\n";
}

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--device") && i + 1 < argc) {
            opts.device = argv[++i];
        } else if ((arg == "-n" || arg == "--index") && i + 1 < argc) {
            try {
                opts.disc_index = std::stoi(argv[++i]);
            } catch (...) {
                std::cerr << "Error: -n/--index requires an integer\n";
                std::exit(1);
            }
        } else if ((arg == "-t" || arg == "--title") && i + 1 < argc) {
            const std::string value = argv[++i];
            if (value == "all") {
                opts.all_titles = true;
            } else {
                try {
                    opts.title_id = std::stoi(value);
                } catch (...) {
                    std::cerr << "Error: -t/--title requires a title id or \"all\"\n";
                    std::exit(1);
                }
            }
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            opts.output = argv[++i];
        } else if (arg == "-np" || arg == "--no-progress") {
            opts.no_progress = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-V" || arg == "--version") {
            std::cout << "mkvrip [" << VERSION << "-" << COMMIT_ID << "]\n";
            std::exit(0);
        } else if (arg == "-?" || arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else if (opts.command.empty() && !arg.empty() && arg[0] != '-') {
            opts.command = arg;
        } else if (opts.command == "decode" && opts.decode_path.empty()) {
            opts.decode_path = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(1);
        }
    }
    return opts;
}

int run_drives(const MkvRipConfig* cfg) {
    Job job;
    const MkvRipCallbacks cb = make_callbacks(job, false);
    const char* err = nullptr;
    MkvRipDriveList* list = mkvrip_detect_drives(cfg, &cb, &err);
    if (!list) {
        report_error(err, "Failed to detect drives");
        return 1;
    }
    if (list->count == 0) {
        std::cout << "No optical drives detected.\n";
    }
    for (size_t i = 0; i < list->count; ++i) {
        const MkvRipDrive& d = list->drives[i];
        std::cout << "[" << d.index << "] " << view_string(d.mount)
                  << "  " << view_string(d.firmware_name)
                  << "  " << (d.tray_open ? "open" : d.loaded ? "loaded" : "empty")
                  << "  " << media_label(d.media_kind);
        if (!view_string(d.disc_label).empty()) {
            std::cout << "  \"" << view_string(d.disc_label) << "\"";
        }
        std::cout << "\n";
    }
    mkvrip_release_drive_list(list);
    return 0;
}

// -n wins; otherwise ask makemkvcon which index the device has.
std::optional<int> resolve_disc_index(
    const MkvRipConfig* cfg,
    const Options& opts) {

    if (opts.disc_index) return opts.disc_index;
    if (!opts.device) {
        std::cerr << "Specify a disc with -n <index> or -d <device>.\n";
        return std::nullopt;
    }
    const char* err = nullptr;
    MkvRipDriveList* list = mkvrip_detect_drives(cfg, nullptr, &err);
    if (!list) {
        report_error(err, "Failed to detect drives");
        return std::nullopt;
    }
    const int index = mkvrip_find_disc_index(list, opts.device->c_str());
    mkvrip_release_drive_list(list);
    if (index < 0) {
        std::cerr << "Device " << *opts.device << " is not detected by makemkvcon.\n";
        return std::nullopt;
    }
    g_info("MakeMKV disc number: %d", index);
    return index;
}

bool fetch_titles(
    const MkvRipConfig* cfg,
    int disc_index,
    Job& job) {

    const MkvRipCallbacks cb = make_callbacks(job, false);
    const char* err = nullptr;
    const int count = mkvrip_fetch_track_info(cfg, disc_index, &cb, &err);
    if (count < 0) {
        return report_error(err, "Failed to read title information");
    }
    mkvrip_release_error(err);
    return true;
}

int run_info(const MkvRipConfig* cfg, const Options& opts) {
    const auto index = resolve_disc_index(cfg, opts);
    if (!index) return 1;
    Job job;
    return fetch_titles(cfg, *index, job) ? 0 : 1;
}

bool rip_one(
    const MkvRipConfig* cfg,
    const Options& opts,
    int title_id,
    Job& job) {

    const MkvRipCallbacks cb = make_callbacks(job, !opts.no_progress);
    MkvRipRequest request{};
    request.device = opts.device->c_str();
    request.disc_index = -1;
    request.title_id = title_id;
    request.destination = opts.output.c_str();

    const char* err = nullptr;
    const int ok = mkvrip_rip_titles(cfg, &request, &cb, &err);
    if (!opts.no_progress) std::cout << "\n";
    if (!ok) return report_error(err, "Rip failed");
    mkvrip_release_error(err);
    return !job.fatal_message;
}

int run_rip(const MkvRipConfig* cfg, const Options& opts) {
    if (!opts.device || opts.output.empty()) {
        std::cerr << "rip requires -d <device> and -o <dir>.\n";
        return 1;
    }
    Job job;
    if (opts.title_id) {
        return rip_one(cfg, opts, *opts.title_id, job) ? 0 : 1;
    }
    // No upper limit: one makemkvcon call handles the whole disc.
    if (opts.all_titles || cfg->max_length > 99998) {
        return rip_one(cfg, opts, -1, job) ? 0 : 1;
    }

    const auto index = resolve_disc_index(cfg, opts);
    if (!index) return 1;
    if (!fetch_titles(cfg, *index, job)) return 1;

    bool success = true;
    const std::vector<TitleEntry> titles = job.titles;
    for (const auto& track : titles) {
        if (track.duration_seconds < cfg->min_length) {
            g_info("Title #%d length (%d) is less than minimum length (%d). Skipping",
                track.title_id, track.duration_seconds, cfg->min_length);
            continue;
        }
        if (track.duration_seconds > cfg->max_length) {
            g_info("Title #%d length (%d) is greater than maximum length (%d). Skipping",
                track.title_id, track.duration_seconds, cfg->max_length);
            continue;
        }
        std::cout << "Ripping title " << track.title_id
                  << " (" << fmt_duration(track.duration_seconds) << ")\n";
        if (!rip_one(cfg, opts, track.title_id, job)) {
            success = false;
            break;
        }
    }
    return success ? 0 : 1;
}

int run_backup(const MkvRipConfig* cfg, const Options& opts) {
    if (opts.output.empty()) {
        std::cerr << "backup requires -o <dir>.\n";
        return 1;
    }
    const auto index = resolve_disc_index(cfg, opts);
    if (!index) return 1;

    Job job;
    const MkvRipCallbacks cb = make_callbacks(job, !opts.no_progress);
    MkvRipRequest request{};
    request.device = opts.device ? opts.device->c_str() : nullptr;
    request.disc_index = *index;
    request.title_id = -1;
    request.destination = opts.output.c_str();

    const char* err = nullptr;
    const int ok = mkvrip_backup_disc(cfg, &request, &cb, &err);
    if (!opts.no_progress) std::cout << "\n";
    if (!ok) {
        report_error(err, "Backup failed");
        return 1;
    }
    mkvrip_release_error(err);
    return job.fatal_message ? 1 : 0;
}

int run_decode(const Options& opts) {
    std::ifstream file;
    if (!opts.decode_path.empty()) {
        file.open(opts.decode_path);
        if (!file) {
            std::cerr << "Cannot open " << opts.decode_path << "\n";
            return 1;
        }
    }
    std::istream& in = opts.decode_path.empty() ? std::cin : file;

    size_t unparsed = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const char* err = nullptr;
        const char* description = mkvrip_describe_line(line.c_str(), &err);
        if (!description) {
            ++unparsed;
            std::cout << "?? " << line << "  (" << view_string(err) << ")\n";
            mkvrip_release_error(err);
            continue;
        }
        std::cout << description << "\n";
        mkvrip_release_description(description);
        mkvrip_release_error(err);
    }
    if (unparsed > 0) {
        std::cerr << "Cannot parse " << unparsed << " lines\n";
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    const Options opts = parse_args(argc, argv);
    if (opts.verbose) {
        g_setenv("G_MESSAGES_DEBUG", "all", TRUE);
    }
    if (opts.command.empty()) {
        print_usage();
        return 1;
    }
    if (opts.command == "decode") {
        return run_decode(opts);
    }

    const char* config_err = nullptr;
    MkvRipConfig* cfg = mkvrip_load_config(
        opts.config_file.empty() ? nullptr : opts.config_file.c_str(),
        &config_err);
    if (!cfg) {
        report_error(config_err, "Failed to load config");
        return 1;
    }
    mkvrip_release_error(config_err);

    int rc = 1;
    if (opts.command == "drives") {
        rc = run_drives(cfg);
    } else if (opts.command == "info") {
        rc = run_info(cfg, opts);
    } else if (opts.command == "rip") {
        rc = run_rip(cfg, opts);
    } else if (opts.command == "backup") {
        rc = run_backup(cfg, opts);
    } else {
        std::cerr << "Unknown command: " << opts.command << "\n";
        print_usage();
    }
    mkvrip_release_config(cfg);
    return rc;
}
