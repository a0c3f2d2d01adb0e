// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "process.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static MkvRipMediaKind to_media_kind(MediaKind kind) {
    switch (kind) {
        case MediaKind::kCD: return MKVRIP_MEDIA_CD;
        case MediaKind::kDVD: return MKVRIP_MEDIA_DVD;
        case MediaKind::kBluRay: return MKVRIP_MEDIA_BLURAY;
        default: return MKVRIP_MEDIA_UNKNOWN;
    }
}

static MkvRipDrive make_api_drive(const Drive& drive) {
    MkvRipDrive d{};
    d.mount = make_cstr_copy(drive.mount);
    d.disc_label = make_cstr_copy(drive.disc_label);
    d.firmware_name = make_cstr_copy(drive.firmware_name);
    d.media_flags = drive.media_flags;
    d.enabled = drive.enabled;
    d.visibility_code = drive.visibility_code;
    d.index = drive.index;
    d.loaded = drive.loaded;
    d.tray_open = drive.tray_open;
    d.attached = drive.attached;
    d.media_kind = to_media_kind(drive.media_kind);
    return d;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

MkvRipDriveList* mkvrip_detect_drives(
    const MkvRipConfig* cfg,
    const MkvRipCallbacks* callbacks,
    const char** error) {

    clear_error(error);
    if (!cfg) {
        set_error(error, "Configuration is required");
        return nullptr;
    }

    std::vector<Drive> drives;
    std::string err;
    InfoThrottle throttle(throttle_policy_from_config(cfg));
    const bool ok = run_info_query(
        build_info_arguments(kAllDiscsIndex, cfg->info_cache, {}),
        static_cast<OutputMask>(OutputType::kDrive),
        to_string_or_empty(cfg->makemkvcon),
        throttle,
        callbacks,
        [&drives](const Record& record) {
            const auto& drive = std::get<Drive>(record);
            if (drive.attached) drives.push_back(drive);
        },
        err);
    if (!ok) {
        set_error(error, err);
        return nullptr;
    }

    auto* list = new MkvRipDriveList{};
    if (!drives.empty()) {
        list->count = drives.size();
        list->drives = new MkvRipDrive[list->count]{};
        for (size_t i = 0; i < list->count; ++i) {
            list->drives[i] = make_api_drive(drives[i]);
        }
    }
    return list;
}

int mkvrip_find_disc_index(
    const MkvRipDriveList* list,
    const char* mount) {

    if (!list || !list->drives || !mount) return -1;
    const std::string target{mount};
    for (size_t i = 0; i < list->count; ++i) {
        if (to_string_or_empty(list->drives[i].mount) == target) {
            return list->drives[i].index;
        }
    }
    return -1;
}

void mkvrip_release_drive_list(
    MkvRipDriveList* p) {

    if (!p) return;
    if (p->drives) {
        for (size_t i = 0; i < p->count; ++i) {
            release_cstr(p->drives[i].mount);
            release_cstr(p->drives[i].disc_label);
            release_cstr(p->drives[i].firmware_name);
        }
        delete[] p->drives;
        p->drives = nullptr;
    }
    p->count = 0;
    delete p;
}

void mkvrip_release_error(const char* p) {
    delete[] p;
}

};
