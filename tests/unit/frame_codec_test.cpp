/**
 * frame_codec_test.cpp - HID report framing
 *
 * Tests:
 * 1. Byte stuffing of the frame marker and escape byte
 * 2. Command frame layout, length field and checksum
 * 3. Response decoding: padding, markers, length and checksum errors
 * 4. File transfer block headers and limits
 */

#include "protocol/frame_codec.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace lcdlink::protocol;

namespace {

std::vector<uint8_t> as_response(std::vector<uint8_t> frame) {
    frame[0] = kResponseReportId;
    return frame;
}

}  // namespace

TEST(FrameCodecTest, StuffingEscapesMarkerAndEscapeByte) {
    const std::vector<uint8_t> raw = {0x01, 0x5A, 0x02, 0x5B, 0x03};
    const std::vector<uint8_t> expected = {0x01, 0x5B, 0x01, 0x02, 0x5B, 0x02, 0x03};
    EXPECT_EQ(stuff_bytes(raw), expected);

    std::vector<uint8_t> back;
    ASSERT_TRUE(unstuff_bytes(expected.data(), expected.size(), back));
    EXPECT_EQ(back, raw);
}

TEST(FrameCodecTest, UnstuffRejectsDanglingOrUnknownEscape) {
    std::vector<uint8_t> out;
    const std::vector<uint8_t> dangling = {0x10, 0x5B};
    EXPECT_FALSE(unstuff_bytes(dangling.data(), dangling.size(), out));

    const std::vector<uint8_t> unknown = {0x5B, 0x07};
    EXPECT_FALSE(unstuff_bytes(unknown.data(), unknown.size(), out));
}

TEST(FrameCodecTest, CommandFrameLayout) {
    const auto frame = encode_command_frame("AB");

    // [1E][5A][00][07]['A']['B'][cs][5A]
    ASSERT_EQ(frame.size(), 8u);
    EXPECT_EQ(frame[0], kCommandReportId);
    EXPECT_EQ(frame[1], kFrameMarker);
    EXPECT_EQ(frame[2], 0x00);
    EXPECT_EQ(frame[3], 0x07);
    EXPECT_EQ(frame[4], 'A');
    EXPECT_EQ(frame[5], 'B');
    EXPECT_EQ(frame[6], static_cast<uint8_t>(0x00 + 0x07 + 'A' + 'B'));
    EXPECT_EQ(frame[7], kFrameMarker);
}

TEST(FrameCodecTest, PayloadContainingMarkersSurvivesFraming) {
    const std::string payload = std::string("x") + char(0x5A) + "y" + char(0x5B) + "z";
    const auto frame = as_response(encode_command_frame(payload));

    // No unescaped marker inside the frame body
    for (size_t i = 2; i + 1 < frame.size(); ++i) {
        EXPECT_NE(frame[i], kFrameMarker) << "at " << i;
    }

    std::string decoded;
    std::string error;
    ASSERT_TRUE(decode_response_frame(frame.data(), frame.size(), decoded, error)) << error;
    EXPECT_EQ(decoded, payload);
}

TEST(FrameCodecTest, DecodeIgnoresTrailingPadding) {
    auto frame = as_response(encode_command_frame("RES 200"));
    frame.resize(1024, 0x00);

    std::string decoded;
    std::string error;
    ASSERT_TRUE(decode_response_frame(frame.data(), frame.size(), decoded, error)) << error;
    EXPECT_EQ(decoded, "RES 200");
}

TEST(FrameCodecTest, DecodeRejectsWrongReportId) {
    const auto frame = encode_command_frame("RES 200");
    std::string decoded;
    std::string error;
    EXPECT_FALSE(decode_response_frame(frame.data(), frame.size(), decoded, error));
    EXPECT_NE(error.find("report id"), std::string::npos);
}

TEST(FrameCodecTest, DecodeRejectsBadChecksum) {
    auto frame = as_response(encode_command_frame("RES 200"));
    frame[frame.size() - 2] ^= 0x01;

    std::string decoded;
    std::string error;
    EXPECT_FALSE(decode_response_frame(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error, "Checksum mismatch");
}

TEST(FrameCodecTest, DecodeRejectsLengthMismatch) {
    auto frame = as_response(encode_command_frame("RES 200"));
    frame[3] = static_cast<uint8_t>(frame[3] + 1);

    std::string decoded;
    std::string error;
    EXPECT_FALSE(decode_response_frame(frame.data(), frame.size(), decoded, error));
    EXPECT_NE(error.find("Length mismatch"), std::string::npos);
}

TEST(FrameCodecTest, DecodeRejectsMissingMarkers) {
    std::vector<uint8_t> no_start = {kResponseReportId, 0x00, 0x00, 0x05, 0x05, 0x5A};
    std::string decoded;
    std::string error;
    EXPECT_FALSE(decode_response_frame(no_start.data(), no_start.size(), decoded, error));

    std::vector<uint8_t> no_end = {kResponseReportId, 0x5A, 0x00, 0x05, 0x05, 0x00};
    EXPECT_FALSE(decode_response_frame(no_end.data(), no_end.size(), decoded, error));
}

TEST(FrameCodecTest, FileBlocksCarryMetadata) {
    std::vector<uint8_t> data(2500, 0xAB);
    std::vector<std::vector<uint8_t>> reports;
    std::string error;

    ASSERT_TRUE(encode_file_blocks(data.data(), data.size(), FileType::PNG, 7, 1000, reports, error)) << error;
    ASSERT_EQ(reports.size(), 3u);

    for (size_t i = 0; i < reports.size(); ++i) {
        const auto &r = reports[i];
        const size_t chunk = i < 2 ? 1000 : 500;
        ASSERT_EQ(r.size(), 4 + kBlockMetadataSize + chunk);
        EXPECT_EQ(r[0], kFileTransferReportId);
        EXPECT_EQ(r[1], kBlockMarker);
        EXPECT_EQ((r[2] << 8) | r[3], static_cast<int>(kBlockMetadataSize + chunk));
        EXPECT_EQ(r[4], 7);                           // transfer id
        EXPECT_EQ((r[5] << 8) | r[6], 3);             // block count
        EXPECT_EQ((r[7] << 8) | r[8], static_cast<int>(i));  // block index
        EXPECT_EQ(r[9], static_cast<uint8_t>(FileType::PNG));
        for (size_t z = 10; z < 24; ++z) {
            EXPECT_EQ(r[z], 0x00);
        }
        EXPECT_EQ(r[24], 0xAB);
    }
}

TEST(FrameCodecTest, FileBlocksRejectInvalidInput) {
    std::vector<uint8_t> data(10, 1);
    std::vector<std::vector<uint8_t>> reports;
    std::string error;

    EXPECT_FALSE(encode_file_blocks(data.data(), 0, FileType::JPEG, 4, 1000, reports, error));
    EXPECT_FALSE(encode_file_blocks(data.data(), data.size(), FileType::JPEG, 60, 1000, reports, error));
    EXPECT_FALSE(encode_file_blocks(data.data(), data.size(), FileType::JPEG, 4, 0, reports, error));
    EXPECT_FALSE(encode_file_blocks(data.data(), data.size(), FileType::JPEG, 4, 1001, reports, error));

    std::vector<uint8_t> huge(kMaxBlockCount + 1, 0);
    EXPECT_FALSE(encode_file_blocks(huge.data(), huge.size(), FileType::JPEG, 4, 1, reports, error));
    EXPECT_NE(error.find("too large"), std::string::npos);
}

TEST(FrameCodecTest, FileTypeFromExtension) {
    EXPECT_EQ(file_type_from_path("a/b/frame.JPG"), FileType::JPEG);
    EXPECT_EQ(file_type_from_path("frame.jpeg"), FileType::JPEG);
    EXPECT_EQ(file_type_from_path("frame.png"), FileType::PNG);
    EXPECT_EQ(file_type_from_path("clip.mp4"), FileType::UNSPECIFIED);
    EXPECT_EQ(file_type_from_path("dir.png/noext"), FileType::UNSPECIFIED);
}

TEST(FrameCodecTest, Subcommands) {
    EXPECT_EQ(encode_subcommand(kSubcommandReboot), (std::vector<uint8_t>{0x02, 0x02, 0x00}));
    EXPECT_EQ(encode_subcommand(kSubcommandFactoryReset), (std::vector<uint8_t>{0x02, 0x01, 0x00}));
}
