#pragma once

// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#ifndef __MKVRIP_H
#define __MKVRIP_H

#include <stddef.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------- */

/**
 * Release error string allocated by library functions.
 * @param p Pointer returned via error out-parameters (nullable).
 */
void mkvrip_release_error(const char* p);

/* ------------------------------------------------------------------- */

/**
 * Decode one robot mode output line into a single-line description.
 * Message lines are classified (and logged) exactly as during a run.
 * @param line Robot mode line without terminator.
 * @param error Optional error string out-parameter (decode failure reason).
 * @return Newly allocated description; free with mkvrip_release_description; null on failure.
 */
const char* mkvrip_describe_line(
    const char* line,
    const char** error /* nullable */);
/**
 * Release a description returned by mkvrip_describe_line.
 * @param p Pointer to free (nullable).
 */
void mkvrip_release_description(const char* p);

/* ------------------------------------------------------------------- */

/** Global configuration loaded from INI or defaults. */
typedef struct MkvRipConfig {
    /** makemkvcon executable path (nullable => search PATH, then /usr/local/bin). */
    const char* makemkvcon;
    /** Maximum running makemkvcon processes before an info query starts (0 => no limit). */
    int max_concurrent_info;
    /** Cooldown after an info query and post-run poll interval, in seconds. */
    int info_wait_time;
    /** Poll interval while waiting to start an info query, in seconds. */
    int poll_interval;
    /** Cache size in MB passed to info queries. */
    int info_cache;
    /** Extra makemkvcon arguments (shell syntax, nullable). */
    const char* mkv_args;
    /** Minimum title length in seconds. */
    int min_length;
    /** Maximum title length in seconds (> 99998 => rip whole disc). */
    int max_length;
    /** Progress log file for rip/backup runs (nullable). */
    const char* progress_log;
    /** Loaded config file path, or null when defaults. */
    const char* config_path;
} MkvRipConfig;

/**
 * Load configuration from INI file.
 * Search order when path is null: ./mkvrip.conf then ~/.mkvrip.conf.
 * Returns defaults if no file found; returns null on parse/load error.
 * @param path Optional explicit config path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated config, must free with mkvrip_release_config; null on failure.
 */
MkvRipConfig* mkvrip_load_config(
    const char* path /* nullable */,
    const char** error /* nullable */);
/**
 * Release configuration and owned members.
 * @param cfg Config pointer (nullable).
 */
void mkvrip_release_config(
    MkvRipConfig* cfg);

/* ------------------------------------------------------------------- */

/** Job state transitions reported while talking to makemkvcon. */
typedef enum MkvRipJobState {
    /** Waiting for other makemkvcon instances. */
    MKVRIP_JOB_STATE_VIDEO_WAITING = 0,
    /** Info query is running. */
    MKVRIP_JOB_STATE_VIDEO_INFO = 1,
    /** Info query finished, ripping may proceed. */
    MKVRIP_JOB_STATE_VIDEO_RIPPING = 2,
} MkvRipJobState;

/** Track record committed by an info query. */
typedef struct MkvRipTrack {
    /** Title id (0-based, as reported by makemkvcon). */
    int title_id;
    /** Title duration in seconds. */
    int duration_seconds;
    /** Aspect ratio of the video stream (may be empty). */
    const char* aspect_ratio;
    /** Frames per second of the video stream, formatted ("0.0" if unknown). */
    const char* fps;
    /** Non-zero if the track is forced (always zero for MakeMKV). */
    int forced;
    /** Source tag ("MakeMKV"). */
    const char* source;
    /** Output file name makemkvcon will use (may be empty). */
    const char* filename;
} MkvRipTrack;

/** Diagnostic message from makemkvcon. */
typedef struct MkvRipMessage {
    /** Message code. */
    int code;
    /** Message flags. */
    int flags;
    /** Parameter count reported on the wire. */
    int count;
    /** Formatted message text. */
    const char* text;
    /** Unformatted message template. */
    const char* format;
    /** Non-zero if the message was classified as an error. */
    int is_error;
    /** Error string extracted from the message (nullable). */
    const char* error_text;
    /** Remaining message parameters. */
    const char* const* params;
    size_t params_count;
} MkvRipMessage;

/** Progress kinds reported during rip/backup runs. */
typedef enum MkvRipProgressKind {
    /** Progress values (current/total/maximum). */
    MKVRIP_PROGRESS_VALUES = 0,
    /** Title of the current operation. */
    MKVRIP_PROGRESS_CURRENT_TITLE = 1,
    /** Title of the total operation. */
    MKVRIP_PROGRESS_TOTAL_TITLE = 2,
} MkvRipProgressKind;

/** Progress report during rip/backup runs. */
typedef struct MkvRipProgress {
    MkvRipProgressKind kind;
    /** Values for MKVRIP_PROGRESS_VALUES. */
    int current;
    int total;
    int maximum;
    /** Code, operation id and name for the title kinds. */
    int code;
    int op_id;
    const char* name;
} MkvRipProgress;

/**
 * Collaborator callbacks. Every member is nullable.
 * Strings passed to callbacks are only valid during the call.
 */
typedef struct MkvRipCallbacks {
    /** Job state transition. */
    void (*on_state)(MkvRipJobState state, void* user_data);
    /** Persist one track. */
    void (*on_track)(const MkvRipTrack* track, void* user_data);
    /** Expected title count reported by the disc. */
    void (*on_title_count)(int count, void* user_data);
    /** User visible notification. */
    void (*on_notify)(const char* title, const char* body, void* user_data);
    /** Message received during rip/backup. */
    void (*on_message)(const MkvRipMessage* message, void* user_data);
    /** Progress received during rip/backup (enables progress output). */
    void (*on_progress)(const MkvRipProgress* progress, void* user_data);
    /** Opaque pointer passed to every callback (typically the job). */
    void* user_data;
} MkvRipCallbacks;

/* ------------------------------------------------------------------- */

/** Media kind of the disc in a drive. */
typedef enum MkvRipMediaKind {
    MKVRIP_MEDIA_UNKNOWN = 0,
    MKVRIP_MEDIA_CD = 1,
    MKVRIP_MEDIA_DVD = 2,
    MKVRIP_MEDIA_BLURAY = 3,
} MkvRipMediaKind;

/** Optical drive reported by makemkvcon. */
typedef struct MkvRipDrive {
    /** Device path (e.g. /dev/sr0). */
    const char* mount;
    /** Disc label (empty when no disc). */
    const char* disc_label;
    /** Drive name including firmware revision. */
    const char* firmware_name;
    /** Raw media flags. */
    int media_flags;
    /** Non-zero if the drive is enabled. */
    int enabled;
    /** Raw visibility code. */
    int visibility_code;
    /** makemkvcon disc index. */
    int index;
    /** Non-zero if a medium is loaded. */
    int loaded;
    /** Non-zero if the tray is open. */
    int tray_open;
    /** Non-zero if the drive is attached. */
    int attached;
    /** Media kind. */
    MkvRipMediaKind media_kind;
} MkvRipDrive;

/** List of drives. */
typedef struct MkvRipDriveList {
    /** Array of drives. */
    MkvRipDrive* drives;
    /** Number of drives. */
    size_t count;
} MkvRipDriveList;

/**
 * Scan drives with a makemkvcon info query (throttled).
 * Only attached drives are returned.
 * @param cfg Configuration.
 * @param callbacks Collaborator callbacks (nullable).
 * @param error Optional error string out-parameter.
 * @return Newly allocated list; free with mkvrip_release_drive_list; null on failure.
 */
MkvRipDriveList* mkvrip_detect_drives(
    const MkvRipConfig* cfg,
    const MkvRipCallbacks* callbacks /* nullable */,
    const char** error /* nullable */);
/**
 * Find the makemkvcon disc index of a drive by its mount path.
 * @param list Drive list.
 * @param mount Device path.
 * @return Disc index, or -1 when not found.
 */
int mkvrip_find_disc_index(
    const MkvRipDriveList* list,
    const char* mount);
/**
 * Release drive list.
 * @param p List pointer (nullable).
 */
void mkvrip_release_drive_list(
    MkvRipDriveList* p);

/* ------------------------------------------------------------------- */

/**
 * Query title information of a disc (throttled) and commit one track per title.
 * @param cfg Configuration.
 * @param disc_index makemkvcon disc index.
 * @param callbacks Collaborator callbacks (on_track/on_title_count/on_state).
 * @param error Optional error string out-parameter.
 * @return Number of committed tracks, or -1 on failure.
 */
int mkvrip_fetch_track_info(
    const MkvRipConfig* cfg,
    int disc_index,
    const MkvRipCallbacks* callbacks /* nullable */,
    const char** error /* nullable */);

/* ------------------------------------------------------------------- */

/** Rip request. */
typedef struct MkvRipRequest {
    /** Device path for mkv rips (e.g. /dev/sr0). */
    const char* device;
    /** makemkvcon disc index for backups. */
    int disc_index;
    /** Title id to rip, or -1 for all titles. */
    int title_id;
    /** Destination directory. */
    const char* destination;
} MkvRipRequest;

/**
 * Rip titles to MKV files.
 * @param cfg Configuration.
 * @param request Rip request (device, title_id, destination).
 * @param callbacks Collaborator callbacks (nullable).
 * @param error Optional error string out-parameter.
 * @return Non-zero on success, zero on failure.
 */
int mkvrip_rip_titles(
    const MkvRipConfig* cfg,
    const MkvRipRequest* request,
    const MkvRipCallbacks* callbacks /* nullable */,
    const char** error /* nullable */);
/**
 * Back up a decrypted disc structure.
 * @param cfg Configuration.
 * @param request Rip request (disc_index, destination).
 * @param callbacks Collaborator callbacks (nullable).
 * @param error Optional error string out-parameter.
 * @return Non-zero on success, zero on failure.
 */
int mkvrip_backup_disc(
    const MkvRipConfig* cfg,
    const MkvRipRequest* request,
    const MkvRipCallbacks* callbacks /* nullable */,
    const char** error /* nullable */);

#ifdef __cplusplus
}
#endif

#endif
