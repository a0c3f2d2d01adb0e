// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "mkvrip/mkvrip.h"
#include "robot.h"

using namespace mkvrip::detail;

TEST(DecodeLine, VersionMessage) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line(
        "MSG:1005,0,1,\"MakeMKV v1.17.8 linux(x64-release) started\",\"%1 started\","
        "\"MakeMKV v1.17.8 linux(x64-release)\"",
        record, err)) << err;

    ASSERT_TRUE(std::holds_alternative<Message>(record));
    const auto& msg = std::get<Message>(record);
    EXPECT_EQ(msg.code, 1005);
    EXPECT_EQ(msg.flags, 0);
    EXPECT_EQ(msg.count, 1);
    EXPECT_EQ(msg.text, "MakeMKV v1.17.8 linux(x64-release) started");
    EXPECT_EQ(msg.format, "%1 started");
    EXPECT_EQ(msg.params, std::vector<std::string>{"MakeMKV v1.17.8 linux(x64-release)"});
    EXPECT_EQ(record_type(record), OutputType::kMessage);
}

TEST(DecodeLine, UnusedDriveSlotIsDetached) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line("DRV:6,256,999,0,\"\",\"\",\"\"", record, err)) << err;

    ASSERT_TRUE(std::holds_alternative<Drive>(record));
    const auto& drive = std::get<Drive>(record);
    EXPECT_EQ(drive.index, 6);
    EXPECT_EQ(drive.visibility_code, 256);
    EXPECT_TRUE(drive.enabled);
    EXPECT_FALSE(drive.attached);
    EXPECT_FALSE(drive.loaded);
    EXPECT_FALSE(drive.tray_open);
    EXPECT_EQ(drive.media_kind, MediaKind::kUnknown);
    EXPECT_EQ(drive.mount, "");
}

TEST(DecodeLine, LoadedBluRayDrive) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line(
        "DRV:0,2,999,12,\"BD-RE HL-DT-ST BD-RE  WH16NS40 1.05\",\"MOVIE_DISC\",\"/dev/sr0\"",
        record, err)) << err;

    const auto& drive = std::get<Drive>(record);
    EXPECT_EQ(drive.index, 0);
    EXPECT_EQ(drive.mount, "/dev/sr0");
    EXPECT_EQ(drive.disc_label, "MOVIE_DISC");
    EXPECT_EQ(drive.firmware_name, "BD-RE HL-DT-ST BD-RE  WH16NS40 1.05");
    EXPECT_EQ(drive.media_flags, 12);
    EXPECT_TRUE(drive.attached);
    EXPECT_TRUE(drive.loaded);
    EXPECT_EQ(drive.media_kind, MediaKind::kBluRay);
}

TEST(DecodeLine, OpenTrayHasNoMedium) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line("DRV:1,1,999,1,\"DVD Drive\",\"\",\"/dev/sr1\"", record, err)) << err;

    const auto& drive = std::get<Drive>(record);
    EXPECT_TRUE(drive.attached);
    EXPECT_TRUE(drive.tray_open);
    EXPECT_FALSE(drive.loaded);
    EXPECT_EQ(drive.media_kind, MediaKind::kUnknown);
}

TEST(MakeDrive, DisabledUnlessSentinel) {
    const Drive drive = make_drive("/dev/sr0", "", "", 1, 0, 2, 3);
    EXPECT_FALSE(drive.enabled);
    EXPECT_EQ(drive.media_kind, MediaKind::kDVD);
}

TEST(DecodeLine, TitleInfoFieldOrder) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line("TINFO:1,26,0,\"155,156,157\"", record, err)) << err;

    ASSERT_TRUE(std::holds_alternative<TitleInfo>(record));
    const auto& info = std::get<TitleInfo>(record);
    EXPECT_EQ(info.title_id, 1);
    EXPECT_EQ(info.id, 26);
    EXPECT_EQ(info.code, 0);
    EXPECT_EQ(info.value, "155,156,157");
}

TEST(DecodeLine, StreamInfoFieldOrder) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line("SINFO:0,1,28,0,\"ger\"", record, err)) << err;

    ASSERT_TRUE(std::holds_alternative<StreamInfo>(record));
    const auto& info = std::get<StreamInfo>(record);
    EXPECT_EQ(info.title_id, 0);
    EXPECT_EQ(info.stream_id, 1);
    EXPECT_EQ(info.id, 28);
    EXPECT_EQ(info.code, 0);
    EXPECT_EQ(info.value, "ger");
}

TEST(DecodeLine, DiscInfoAndCount) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line("CINFO:1,6209,\"Blu-ray disc\"", record, err)) << err;
    EXPECT_EQ(record_type(record), OutputType::kDiscInfo);
    EXPECT_EQ(std::get<DiscInfo>(record).value, "Blu-ray disc");

    ASSERT_TRUE(decode_line("TCOUNT:12", record, err)) << err;
    EXPECT_EQ(std::get<TitleCount>(record).count, 12);
}

TEST(DecodeLine, ProgressRecords) {
    Record record;
    std::string err;
    ASSERT_TRUE(decode_line("PRGV:100,200,65536", record, err)) << err;
    const auto& values = std::get<ProgressValues>(record);
    EXPECT_EQ(values.current, 100);
    EXPECT_EQ(values.total, 200);
    EXPECT_EQ(values.maximum, 65536);

    ASSERT_TRUE(decode_line("PRGC:5018,0,\"Scanning CD-ROM devices\"", record, err)) << err;
    ASSERT_TRUE(std::holds_alternative<ProgressCurrent>(record));
    EXPECT_EQ(std::get<ProgressCurrent>(record).name, "Scanning CD-ROM devices");

    ASSERT_TRUE(decode_line("PRGT:5018,0,\"Opening DVD disc\"", record, err)) << err;
    ASSERT_TRUE(std::holds_alternative<ProgressTotal>(record));
    EXPECT_EQ(std::get<ProgressTotal>(record).code, 5018);
}

TEST(DecodeLine, RejectsLineWithoutColon) {
    Record record;
    std::string err;
    EXPECT_FALSE(decode_line("garbage", record, err));
    EXPECT_EQ(err, "No message type detected");
}

TEST(DecodeLine, RejectsUnknownTag) {
    Record record;
    std::string err;
    EXPECT_FALSE(decode_line("FOO:1,2", record, err));
    EXPECT_EQ(err, "Cannot parse 'FOO':'1,2'");
}

TEST(DecodeLine, RejectsWrongFieldCount) {
    Record record;
    std::string err;
    EXPECT_FALSE(decode_line("CINFO:1,\"x\"", record, err));
    EXPECT_FALSE(err.empty());
    err.clear();
    EXPECT_FALSE(decode_line("MSG:1005,0,1,\"only text\"", record, err));
    EXPECT_FALSE(err.empty());
}

TEST(DecodeLine, RejectsNonNumericField) {
    Record record;
    std::string err;
    EXPECT_FALSE(decode_line("TCOUNT:abc", record, err));
    EXPECT_FALSE(err.empty());
}

TEST(OutputTypeNames, RoundTripTags) {
    OutputType type;
    ASSERT_TRUE(parse_output_type("SINFO", type));
    EXPECT_EQ(type, OutputType::kStreamInfo);
    EXPECT_STREQ(output_type_name(OutputType::kProgressTotal), "PRGT");
    EXPECT_FALSE(parse_output_type("sinfo", type));
}

TEST(DescribeLine, RendersTagAndFields) {
    const char* error = nullptr;
    const char* text = mkvrip_describe_line("TINFO:1,9,0,\"1:30:00\"", &error);
    ASSERT_NE(text, nullptr) << (error ? error : "");
    EXPECT_STREQ(text, "TINFO title=1 id=9 code=0 value=\"1:30:00\"");
    mkvrip_release_description(text);
}

TEST(DescribeLine, ReportsDecodeError) {
    const char* error = nullptr;
    EXPECT_EQ(mkvrip_describe_line("nonsense", &error), nullptr);
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error, "No message type detected");
    mkvrip_release_error(error);
}
