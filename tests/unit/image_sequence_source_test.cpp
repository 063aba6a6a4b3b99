#include "streaming/image_sequence_source.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace lcdlink::streaming;

namespace {

// Minimal JPEG: SOI, APP0 stub, SOF0 with the given size, EOI
std::vector<uint8_t> tiny_jpeg(uint16_t width, uint16_t height) {
    return {0xFF, 0xD8,                                     // SOI
            0xFF, 0xE0, 0x00, 0x04, 0x00, 0x00,             // APP0, length 4
            0xFF, 0xC0, 0x00, 0x0B, 0x08,                   // SOF0, length 11, precision
            static_cast<uint8_t>(height >> 8), static_cast<uint8_t>(height & 0xFF),
            static_cast<uint8_t>(width >> 8), static_cast<uint8_t>(width & 0xFF),
            0x01, 0x01, 0x11, 0x00,                         // one component
            0xFF, 0xD9};                                    // EOI
}

std::vector<uint8_t> tiny_png(uint32_t width, uint32_t height) {
    std::vector<uint8_t> data = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A,  // signature
                                 0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'};
    for (uint32_t v : {width, height}) {
        data.push_back(static_cast<uint8_t>(v >> 24));
        data.push_back(static_cast<uint8_t>(v >> 16));
        data.push_back(static_cast<uint8_t>(v >> 8));
        data.push_back(static_cast<uint8_t>(v));
    }
    data.insert(data.end(), {0x08, 0x02, 0x00, 0x00, 0x00});
    return data;
}

}  // namespace

class ImageSequenceSourceTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "lcdlink_image_source_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override { fs::remove_all(temp_dir); }

    void write_file(const std::string &name, const std::vector<uint8_t> &data) {
        std::ofstream out(temp_dir / name, std::ios::binary);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }
};

TEST(ProbeImageSizeTest, ReadsJpegStartOfFrame) {
    int width = 0;
    int height = 0;
    ASSERT_TRUE(probe_image_size(tiny_jpeg(480, 320), width, height));
    EXPECT_EQ(width, 480);
    EXPECT_EQ(height, 320);
}

TEST(ProbeImageSizeTest, ReadsPngHeader) {
    int width = 0;
    int height = 0;
    ASSERT_TRUE(probe_image_size(tiny_png(640, 480), width, height));
    EXPECT_EQ(width, 640);
    EXPECT_EQ(height, 480);
}

TEST(ProbeImageSizeTest, RejectsUnknownData) {
    int width = 0;
    int height = 0;
    EXPECT_FALSE(probe_image_size({}, width, height));
    EXPECT_FALSE(probe_image_size({'G', 'I', 'F', '8', '9', 'a'}, width, height));
    EXPECT_FALSE(probe_image_size({0xFF, 0xD8, 0x00, 0x00}, width, height));
}

TEST_F(ImageSequenceSourceTest, YieldsImagesInNameOrder) {
    write_file("002.png", tiny_png(480, 480));
    write_file("001.jpg", tiny_jpeg(480, 480));
    write_file("003.JPEG", tiny_jpeg(240, 240));
    write_file("notes.txt", {'x'});

    ImageSequenceSource source(temp_dir);
    auto sequence = source.open();
    ASSERT_NE(sequence, nullptr);

    auto first = sequence->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->index, 0u);
    EXPECT_EQ(first->type, lcdlink::protocol::FileType::JPEG);
    EXPECT_EQ(first->width, 480);

    auto second = sequence->next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->type, lcdlink::protocol::FileType::PNG);

    auto third = sequence->next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->index, 2u);
    EXPECT_EQ(third->width, 240);
    EXPECT_GT(third->timestamp_ms, 0);

    EXPECT_FALSE(sequence->next().has_value());
    EXPECT_TRUE(sequence->last_error().empty());
}

TEST_F(ImageSequenceSourceTest, LoopRestartsWithIncreasingIndex) {
    write_file("a.jpg", tiny_jpeg(480, 480));
    write_file("b.jpg", tiny_jpeg(480, 480));

    ImageSequenceSource source(temp_dir, true);
    auto sequence = source.open();
    ASSERT_NE(sequence, nullptr);

    for (uint64_t i = 0; i < 5; ++i) {
        auto frame = sequence->next();
        ASSERT_TRUE(frame.has_value());
        EXPECT_EQ(frame->index, i);
    }
    EXPECT_NE(source.describe().find("looping"), std::string::npos);
}

TEST_F(ImageSequenceSourceTest, EmptyDirectoryIsEmptySequence) {
    ImageSequenceSource source(temp_dir, true);
    auto sequence = source.open();
    ASSERT_NE(sequence, nullptr);
    EXPECT_FALSE(sequence->next().has_value());
    EXPECT_TRUE(sequence->last_error().empty());
}

TEST_F(ImageSequenceSourceTest, MissingDirectoryFailsToOpen) {
    ImageSequenceSource source(temp_dir / "missing");
    std::string error;
    EXPECT_TRUE(source.list_images(error).empty());
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(source.open(), nullptr);
}

TEST_F(ImageSequenceSourceTest, FileRemovedAfterOpenIsReadError) {
    write_file("a.jpg", tiny_jpeg(480, 480));
    ImageSequenceSource source(temp_dir);
    auto sequence = source.open();
    ASSERT_NE(sequence, nullptr);

    fs::remove(temp_dir / "a.jpg");

    EXPECT_FALSE(sequence->next().has_value());
    EXPECT_NE(sequence->last_error().find("a.jpg"), std::string::npos);
}
