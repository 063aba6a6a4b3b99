#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lcdlink {
namespace streaming {

// Transfer ids below first_rotating are reserved for other transfers (static
// images, suspend media). Streaming rotates through [first_rotating, last_rotating].
struct TransferIdWindow {
    uint8_t first_rotating = 4;
    uint8_t last_rotating = 59;

    size_t size() const { return static_cast<size_t>(last_rotating) - first_rotating + 1; }
    bool is_reserved(uint8_t id) const { return id < first_rotating; }
    bool contains(uint8_t id) const { return id >= first_rotating && id <= last_rotating; }
};

// The window must leave at least one reserved id, fit the protocol's 0..59 range and
// hold more ids than can be in flight at once (buffer_depth + the frame being sent).
bool validate_window(const TransferIdWindow &window, size_t buffer_depth, std::string &error);

class TransferIdRotation {
public:
    explicit TransferIdRotation(TransferIdWindow window = TransferIdWindow{});

    uint8_t current() const { return current_; }

    // Moves to the next id, wrapping from last_rotating to first_rotating
    uint8_t advance();

private:
    TransferIdWindow window_;
    uint8_t current_;
};

}  // namespace streaming
}  // namespace lcdlink
