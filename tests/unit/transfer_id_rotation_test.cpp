#include "streaming/transfer_id_rotation.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace lcdlink::streaming;

TEST(TransferIdRotationTest, StartsAtFirstRotatingId) {
    TransferIdRotation rotation;
    EXPECT_EQ(rotation.current(), 4);
}

TEST(TransferIdRotationTest, WrapsWithinWindowAndSkipsReserved) {
    TransferIdRotation rotation;
    TransferIdWindow window;
    std::set<uint8_t> seen{rotation.current()};

    for (int i = 0; i < 200; ++i) {
        const uint8_t id = rotation.advance();
        EXPECT_TRUE(window.contains(id)) << "id " << static_cast<int>(id);
        EXPECT_FALSE(window.is_reserved(id));
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), window.size());
}

TEST(TransferIdRotationTest, WrapsFromLastToFirst) {
    TransferIdRotation rotation(TransferIdWindow{10, 12});
    EXPECT_EQ(rotation.advance(), 11);
    EXPECT_EQ(rotation.advance(), 12);
    EXPECT_EQ(rotation.advance(), 10);
}

TEST(TransferIdWindowTest, DefaultWindow) {
    TransferIdWindow window;
    EXPECT_EQ(window.size(), 56u);
    EXPECT_TRUE(window.is_reserved(0));
    EXPECT_TRUE(window.is_reserved(3));
    EXPECT_FALSE(window.is_reserved(4));
    EXPECT_TRUE(window.contains(59));
    EXPECT_FALSE(window.contains(60));
}

TEST(TransferIdWindowTest, ValidateAcceptsDefaults) {
    std::string error;
    EXPECT_TRUE(validate_window(TransferIdWindow{}, 2, error)) << error;
}

TEST(TransferIdWindowTest, ValidateRejectsBadWindows) {
    std::string error;
    EXPECT_FALSE(validate_window(TransferIdWindow{0, 59}, 2, error));
    EXPECT_NE(error.find("reserved"), std::string::npos);

    EXPECT_FALSE(validate_window(TransferIdWindow{4, 60}, 2, error));
    EXPECT_FALSE(validate_window(TransferIdWindow{10, 9}, 2, error));
    EXPECT_FALSE(validate_window(TransferIdWindow{4, 59}, 0, error));

    // Window must exceed the number of frames in flight
    EXPECT_FALSE(validate_window(TransferIdWindow{4, 6}, 3, error));
    EXPECT_NE(error.find("buffer depth"), std::string::npos);
    EXPECT_TRUE(validate_window(TransferIdWindow{4, 7}, 3, error));
}
