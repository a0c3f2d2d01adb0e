#pragma once

// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <string>
#include <vector>

namespace mkvrip::detail {

constexpr const char* kRipFailedTitle = "MakeMKV rip failed";
constexpr const char* kRipFailedBody =
    "MakeMKV did not complete successfully. Check the log for details.";

struct RipArguments {
    std::vector<std::string> extra;  // configured mkv_args
    std::string progress;            // --progress= value, empty to omit
    std::string device;
    int disc_index{0};
    int title_id{-1};                // -1 => all
    std::string destination;
    int min_length{0};
};

// mkv <extra> [--progress=P] dev:<device> <title|all> <dest> [--minlength=N]
std::vector<std::string> build_mkv_arguments(const RipArguments& rip);

// backup --decrypt <extra> --minlength=N [--progress=P] disc:<index> <dest>
std::vector<std::string> build_backup_arguments(const RipArguments& rip);

}  // namespace mkvrip::detail
