#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "streaming/frame_source.hpp"

namespace lcdlink {
namespace streaming {

// Reads width/height from a PNG IHDR chunk or a JPEG SOF marker. Returns false if neither is found.
bool probe_image_size(const std::vector<uint8_t> &data, int &width, int &height);

// Frame source over the JPEG/PNG files of a directory, in file name order.
// Files are read lazily, one per frame. With loop enabled the sequence never ends.
class ImageSequenceSource : public IFrameSource {
public:
    explicit ImageSequenceSource(std::filesystem::path directory, bool loop = false);

    std::unique_ptr<IFrameSequence> open() override;
    std::string describe() const override;

    // Image files currently in the directory, sorted
    std::vector<std::filesystem::path> list_images(std::string &error) const;

private:
    std::filesystem::path directory_;
    bool loop_;
};

}  // namespace streaming
}  // namespace lcdlink
