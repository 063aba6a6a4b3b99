#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "protocol/frame_codec.hpp"

namespace lcdlink {
namespace streaming {

// One encoded image ready to send
struct Frame {
    uint64_t index = 0;
    std::vector<uint8_t> data;
    int width = 0;  // 0 when unknown
    int height = 0;
    int64_t timestamp_ms = 0;
    protocol::FileType type = protocol::FileType::JPEG;
};

// Lazy, ordered, finite-or-infinite frame sequence. Not rewindable.
class IFrameSequence {
public:
    virtual ~IFrameSequence() = default;

    // std::nullopt when exhausted or on error (last_error() non-empty)
    virtual std::optional<Frame> next() = 0;

    virtual const std::string &last_error() const = 0;
};

// Restart by opening a new sequence
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    // nullptr if the source cannot be opened
    virtual std::unique_ptr<IFrameSequence> open() = 0;

    virtual std::string describe() const = 0;
};

}  // namespace streaming
}  // namespace lcdlink
