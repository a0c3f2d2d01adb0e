// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <gtest/gtest.h>

#include <glib.h>
#include <glib/gstdio.h>

#include <string>
#include <variant>
#include <vector>

#include "log_capture.h"
#include "process.h"

using namespace mkvrip::detail;

namespace {

class FakeMakemkvcon : public ::testing::Test {
protected:
    void SetUp() override {
        GError* gerr = nullptr;
        gchar* dir = g_dir_make_tmp("mkvrip-test-XXXXXX", &gerr);
        ASSERT_NE(dir, nullptr) << (gerr ? gerr->message : "");
        dir_ = dir;
        g_free(dir);
        output_path_ = dir_ + "/output.txt";
        args_path_ = dir_ + "/args.txt";
        g_setenv("MKVRIP_FAKE_OUTPUT", output_path_.c_str(), TRUE);
        g_setenv("MKVRIP_FAKE_ARGS", args_path_.c_str(), TRUE);
        g_setenv("MKVRIP_FAKE_EXIT", "0", TRUE);
        write_output("");
    }

    void TearDown() override {
        g_unsetenv("MKVRIP_FAKE_OUTPUT");
        g_unsetenv("MKVRIP_FAKE_ARGS");
        g_unsetenv("MKVRIP_FAKE_EXIT");
        g_remove(output_path_.c_str());
        g_remove(args_path_.c_str());
        g_rmdir(dir_.c_str());
    }

    void write_output(const std::string& contents) {
        ASSERT_TRUE(g_file_set_contents(
            output_path_.c_str(), contents.c_str(), static_cast<gssize>(contents.size()), nullptr));
    }

    std::vector<std::string> recorded_args() const {
        gchar* contents = nullptr;
        if (!g_file_get_contents(args_path_.c_str(), &contents, nullptr, nullptr)) return {};
        std::vector<std::string> args;
        gchar** lines = g_strsplit(contents, "\n", -1);
        for (gchar** p = lines; *p; ++p) {
            if (**p) args.emplace_back(*p);
        }
        g_strfreev(lines);
        g_free(contents);
        return args;
    }

    std::string dir_;
    std::string output_path_;
    std::string args_path_;
};

const char* kDriveScan =
    "MSG:1005,0,1,\"MakeMKV v1.17.8 linux(x64-release) started\",\"%1 started\",\"MakeMKV v1.17.8 linux(x64-release)\"\n"
    "DRV:0,2,999,12,\"BD-RE Drive\",\"MOVIE\",\"/dev/sr0\"\n"
    "DRV:1,256,999,0,\"\",\"\",\"\"\n"
    "TCOUNT:0\n";

}  // namespace

TEST_F(FakeMakemkvcon, CommandLineIsRobotMode) {
    RobotRun run({"info", "disc:9999"}, kAllOutputTypes, MKVRIP_FAKE_MAKEMKVCON);
    EXPECT_EQ(run.command(), (std::vector<std::string>{
        MKVRIP_FAKE_MAKEMKVCON, "--robot", "--messages=-stdout", "info", "disc:9999"}));

    std::string err;
    ASSERT_TRUE(run.start(err)) << err;
    ASSERT_TRUE(run.finish(err)) << err;
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "--robot", "--messages=-stdout", "info", "disc:9999"}));
}

TEST_F(FakeMakemkvcon, SelectedRecordsOnly) {
    write_output(kDriveScan);

    std::vector<Record> records;
    std::string err;
    ASSERT_TRUE(run_robot(
        {"info", "disc:9999"},
        static_cast<OutputMask>(OutputType::kDrive),
        MKVRIP_FAKE_MAKEMKVCON,
        [&records](const Record& r) { records.push_back(r); },
        err)) << err;

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(std::get<Drive>(records[0]).mount, "/dev/sr0");
    EXPECT_FALSE(std::get<Drive>(records[1]).attached);
}

TEST_F(FakeMakemkvcon, PullsRecordsInOrder) {
    write_output(kDriveScan);

    RobotRun run({"info"}, kAllOutputTypes, MKVRIP_FAKE_MAKEMKVCON);
    std::string err;
    ASSERT_TRUE(run.start(err)) << err;

    std::vector<OutputType> types;
    Record record;
    while (run.next(record)) types.push_back(record_type(record));
    ASSERT_TRUE(run.finish(err)) << err;

    EXPECT_EQ(types, (std::vector<OutputType>{
        OutputType::kMessage, OutputType::kDrive, OutputType::kDrive, OutputType::kTitleCount}));
}

TEST_F(FakeMakemkvcon, CarriageReturnsAreStripped) {
    write_output("TCOUNT:3\r\nCINFO:2,0,\"Title\"\r\n");

    std::vector<Record> records;
    std::string err;
    ASSERT_TRUE(run_robot({"info"}, kAllOutputTypes, MKVRIP_FAKE_MAKEMKVCON,
        [&records](const Record& r) { records.push_back(r); }, err)) << err;
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(std::get<DiscInfo>(records[1]).value, "Title");
}

TEST_F(FakeMakemkvcon, UnparsedLineFailsCleanExit) {
    LogCapture logs;
    write_output("TCOUNT:1\nthis is not robot output\n");

    std::vector<Record> records;
    std::string err;
    EXPECT_FALSE(run_robot({"info"}, kAllOutputTypes, MKVRIP_FAKE_MAKEMKVCON,
        [&records](const Record& r) { records.push_back(r); }, err));

    EXPECT_EQ(records.size(), 1u);
    EXPECT_NE(err.find("this is not robot output"), std::string::npos);
    EXPECT_NE(err.find("code: 0"), std::string::npos);
    EXPECT_TRUE(logs.contains(G_LOG_LEVEL_WARNING, "Cannot parse 1 lines"));
}

TEST_F(FakeMakemkvcon, NonZeroExitFails) {
    LogCapture logs;
    write_output("TCOUNT:0\n");
    g_setenv("MKVRIP_FAKE_EXIT", "3", TRUE);

    std::string err;
    EXPECT_FALSE(run_robot({"info"}, kAllOutputTypes, MKVRIP_FAKE_MAKEMKVCON, {}, err));
    EXPECT_NE(err.find("Call to MakeMKV failed with code: 3"), std::string::npos);
    EXPECT_TRUE(logs.contains(G_LOG_LEVEL_CRITICAL, "code: 3"));
}

TEST_F(FakeMakemkvcon, UnreadOutputIsJudgedOnFinish) {
    write_output("TCOUNT:1\nbroken\n");

    RobotRun run({"info"}, kAllOutputTypes, MKVRIP_FAKE_MAKEMKVCON);
    std::string err;
    ASSERT_TRUE(run.start(err)) << err;
    Record record;
    ASSERT_TRUE(run.next(record));
    EXPECT_FALSE(run.finish(err));
    EXPECT_EQ(run.unparsed(), std::vector<std::string>{"broken"});
}

TEST(RobotRun, MissingExecutableFailsToStart) {
    RobotRun run({"info"}, kAllOutputTypes, "/nonexistent/makemkvcon");
    std::string err;
    EXPECT_FALSE(run.start(err));
    EXPECT_FALSE(err.empty());
}

TEST(ResolveMakemkvcon, ConfiguredPathWins) {
    EXPECT_EQ(resolve_makemkvcon("/opt/makemkv/bin/makemkvcon"), "/opt/makemkv/bin/makemkvcon");
}

TEST_F(FakeMakemkvcon, InfoQueryReportsStatesAndReleases) {
    write_output(kDriveScan);

    std::vector<int> states;
    MkvRipCallbacks callbacks{};
    callbacks.on_state = [](MkvRipJobState state, void* user_data) {
        static_cast<std::vector<int>*>(user_data)->push_back(static_cast<int>(state));
    };
    callbacks.user_data = &states;

    ThrottlePolicy policy;
    policy.max_processes = 1;
    int polls = 0;
    std::vector<int> sleeps;
    InfoThrottle throttle(
        policy,
        [&polls](const std::string&) { ++polls; return 0; },
        [&sleeps](int s) { sleeps.push_back(s); });

    std::string err;
    ASSERT_TRUE(run_info_query(
        build_info_arguments(kAllDiscsIndex, 1, {}),
        static_cast<OutputMask>(OutputType::kDrive),
        MKVRIP_FAKE_MAKEMKVCON,
        throttle,
        &callbacks,
        {},
        err)) << err;

    EXPECT_EQ(states, (std::vector<int>{
        MKVRIP_JOB_STATE_VIDEO_WAITING,
        MKVRIP_JOB_STATE_VIDEO_INFO,
        MKVRIP_JOB_STATE_VIDEO_WAITING,
        MKVRIP_JOB_STATE_VIDEO_RIPPING}));
    EXPECT_EQ(polls, 2);
    EXPECT_EQ(sleeps, std::vector<int>{60});
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "--robot", "--messages=-stdout", "info", "--cache=1", "disc:9999"}));
}

TEST_F(FakeMakemkvcon, FetchTrackInfoCommitsTitles) {
    write_output(
        "TCOUNT:2\n"
        "TINFO:0,27,0,\"title_t00.mkv\"\n"
        "TINFO:0,9,0,\"1:30:00\"\n"
        "SINFO:0,0,1,6201,\"Video\"\n"
        "SINFO:0,0,20,0,\"16:9\"\n"
        "TINFO:1,9,0,\"0:01:00\"\n");

    MkvRipConfig cfg{};
    cfg.makemkvcon = MKVRIP_FAKE_MAKEMKVCON;
    cfg.max_concurrent_info = 0;
    cfg.info_cache = 1;

    struct Seen {
        std::vector<int> titles;
        std::vector<std::string> aspects;
        int count{-1};
    } seen;
    MkvRipCallbacks callbacks{};
    callbacks.on_track = [](const MkvRipTrack* t, void* user_data) {
        auto* s = static_cast<Seen*>(user_data);
        s->titles.push_back(t->title_id);
        s->aspects.emplace_back(t->aspect_ratio);
        EXPECT_STREQ(t->source, "MakeMKV");
    };
    callbacks.on_title_count = [](int count, void* user_data) {
        static_cast<Seen*>(user_data)->count = count;
    };
    callbacks.user_data = &seen;

    const char* error = nullptr;
    EXPECT_EQ(mkvrip_fetch_track_info(&cfg, 0, &callbacks, &error), 2);
    EXPECT_EQ(error, nullptr);
    EXPECT_EQ(seen.count, 2);
    EXPECT_EQ(seen.titles, (std::vector<int>{0, 1}));
    EXPECT_EQ(seen.aspects, (std::vector<std::string>{"16:9", ""}));
}

TEST_F(FakeMakemkvcon, DetectDrivesKeepsAttachedOnly) {
    write_output(kDriveScan);

    MkvRipConfig cfg{};
    cfg.makemkvcon = MKVRIP_FAKE_MAKEMKVCON;
    cfg.max_concurrent_info = 0;
    cfg.info_cache = 1;

    const char* error = nullptr;
    MkvRipDriveList* list = mkvrip_detect_drives(&cfg, nullptr, &error);
    ASSERT_NE(list, nullptr) << (error ? error : "");
    ASSERT_EQ(list->count, 1u);
    EXPECT_STREQ(list->drives[0].mount, "/dev/sr0");
    EXPECT_EQ(list->drives[0].media_kind, MKVRIP_MEDIA_BLURAY);
    EXPECT_EQ(mkvrip_find_disc_index(list, "/dev/sr0"), 0);
    EXPECT_EQ(mkvrip_find_disc_index(list, "/dev/sr9"), -1);
    mkvrip_release_drive_list(list);
}

TEST_F(FakeMakemkvcon, FailedRipNotifies) {
    g_setenv("MKVRIP_FAKE_EXIT", "1", TRUE);

    MkvRipConfig cfg{};
    cfg.makemkvcon = MKVRIP_FAKE_MAKEMKVCON;
    cfg.min_length = 600;

    std::vector<std::string> notes;
    MkvRipCallbacks callbacks{};
    callbacks.on_notify = [](const char* title, const char*, void* user_data) {
        static_cast<std::vector<std::string>*>(user_data)->emplace_back(title);
    };
    callbacks.user_data = &notes;

    MkvRipRequest request{};
    request.device = "/dev/sr0";
    request.disc_index = -1;
    request.title_id = 3;
    request.destination = "/tmp/out";

    const char* error = nullptr;
    EXPECT_EQ(mkvrip_rip_titles(&cfg, &request, &callbacks, &error), 0);
    ASSERT_NE(error, nullptr);
    EXPECT_NE(std::string{error}.find("code: 1"), std::string::npos);
    mkvrip_release_error(error);
    EXPECT_EQ(notes, std::vector<std::string>{"MakeMKV rip failed"});
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "--robot", "--messages=-stdout", "mkv", "dev:/dev/sr0", "3", "/tmp/out"}));
}

TEST_F(FakeMakemkvcon, RipForwardsMessageFields) {
    write_output(
        "MSG:5004,0,2,\"3 titles saved\",\"%1 titles saved\",\"3\",\"0\"\n"
        "MSG:2019,0,2,\"Error 'Posix error - No such file or directory' occurred\",\"%1 %2\","
        "\"Posix error - No such file or directory\",\"/out/title_t00.mkv\"\n");

    MkvRipConfig cfg{};
    cfg.makemkvcon = MKVRIP_FAKE_MAKEMKVCON;

    struct Seen {
        int code;
        int count;
        int is_error;
        std::string error_text;
        std::vector<std::string> params;
    };
    std::vector<Seen> seen;
    MkvRipCallbacks callbacks{};
    callbacks.on_message = [](const MkvRipMessage* m, void* user_data) {
        Seen s{m->code, m->count, m->is_error, m->error_text ? m->error_text : "", {}};
        for (size_t i = 0; i < m->params_count; ++i) s.params.emplace_back(m->params[i]);
        static_cast<std::vector<Seen>*>(user_data)->push_back(s);
    };
    callbacks.user_data = &seen;

    MkvRipRequest request{};
    request.device = "/dev/sr0";
    request.disc_index = -1;
    request.title_id = 0;
    request.destination = "/out";

    const char* error = nullptr;
    ASSERT_EQ(mkvrip_rip_titles(&cfg, &request, &callbacks, &error), 1) << (error ? error : "");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].code, 5004);
    EXPECT_EQ(seen[0].count, 2);
    EXPECT_EQ(seen[0].is_error, 0);
    EXPECT_EQ(seen[0].params, (std::vector<std::string>{"3", "0"}));
    EXPECT_EQ(seen[1].code, 2019);
    EXPECT_EQ(seen[1].count, 2);
    EXPECT_NE(seen[1].is_error, 0);
    EXPECT_EQ(seen[1].error_text, "Posix error - No such file or directory");
    EXPECT_EQ(seen[1].params, std::vector<std::string>{"/out/title_t00.mkv"});
}
