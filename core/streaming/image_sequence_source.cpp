#include "image_sequence_source.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include "events/event_types.hpp"
#include "logging/logger.hpp"

namespace lcdlink {
namespace streaming {

namespace fs = std::filesystem;

namespace {

uint32_t read_be32(const std::vector<uint8_t> &d, size_t at) {
    return (static_cast<uint32_t>(d[at]) << 24) | (static_cast<uint32_t>(d[at + 1]) << 16) |
           (static_cast<uint32_t>(d[at + 2]) << 8) | static_cast<uint32_t>(d[at + 3]);
}

uint16_t read_be16(const std::vector<uint8_t> &d, size_t at) {
    return static_cast<uint16_t>((d[at] << 8) | d[at + 1]);
}

bool read_file(const fs::path &path, std::vector<uint8_t> &out, std::string &error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot open " + path.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (out.empty()) {
        error = "Empty image file " + path.string();
        return false;
    }
    return true;
}

class ImageSequence : public IFrameSequence {
public:
    ImageSequence(std::vector<fs::path> files, bool loop) : files_(std::move(files)), loop_(loop) {}

    std::optional<Frame> next() override {
        if (files_.empty()) {
            return std::nullopt;
        }
        if (position_ >= files_.size()) {
            if (!loop_) {
                return std::nullopt;
            }
            position_ = 0;
        }

        const fs::path &path = files_[position_++];
        Frame frame;
        if (!read_file(path, frame.data, error_)) {
            return std::nullopt;
        }
        frame.index = next_index_++;
        frame.type = protocol::file_type_from_path(path.string());
        frame.timestamp_ms = events::now_epoch_ms();
        probe_image_size(frame.data, frame.width, frame.height);
        return frame;
    }

    const std::string &last_error() const override { return error_; }

private:
    std::vector<fs::path> files_;
    bool loop_;
    size_t position_ = 0;
    uint64_t next_index_ = 0;
    std::string error_;
};

}  // namespace

bool probe_image_size(const std::vector<uint8_t> &data, int &width, int &height) {
    static const uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    if (data.size() >= 24 && std::equal(kPngSignature, kPngSignature + 8, data.begin())) {
        width = static_cast<int>(read_be32(data, 16));
        height = static_cast<int>(read_be32(data, 20));
        return true;
    }

    if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8) {
        return false;
    }

    // Walk JPEG segments until a start-of-frame marker
    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if (data[pos] != 0xFF) {
            return false;
        }
        const uint8_t marker = data[pos + 1];
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        const uint16_t length = read_be16(data, pos + 2);
        const bool is_sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (is_sof) {
            if (pos + 9 > data.size()) {
                return false;
            }
            height = read_be16(data, pos + 5);
            width = read_be16(data, pos + 7);
            return true;
        }
        pos += 2 + length;
    }
    return false;
}

ImageSequenceSource::ImageSequenceSource(fs::path directory, bool loop) : directory_(std::move(directory)), loop_(loop) {}

std::vector<fs::path> ImageSequenceSource::list_images(std::string &error) const {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (protocol::file_type_from_path(it->path().string()) != protocol::FileType::UNSPECIFIED) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        error = "Cannot list " + directory_.string() + ": " + ec.message();
        return {};
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::unique_ptr<IFrameSequence> ImageSequenceSource::open() {
    std::string error;
    auto files = list_images(error);
    if (!error.empty()) {
        LOG_ERROR("[Streaming] " << error);
        return nullptr;
    }
    if (files.empty()) {
        LOG_WARN("[Streaming] No JPEG/PNG files in " << directory_.string());
    }
    return std::make_unique<ImageSequence>(std::move(files), loop_);
}

std::string ImageSequenceSource::describe() const {
    return directory_.string() + (loop_ ? " (looping)" : "");
}

}  // namespace streaming
}  // namespace lcdlink
