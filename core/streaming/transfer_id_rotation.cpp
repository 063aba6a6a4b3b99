#include "transfer_id_rotation.hpp"

#include "protocol/frame_codec.hpp"

namespace lcdlink {
namespace streaming {

bool validate_window(const TransferIdWindow &window, size_t buffer_depth, std::string &error) {
    if (window.first_rotating < 1) {
        error = "At least one transfer id must stay reserved";
        return false;
    }
    if (window.last_rotating > protocol::kMaxTransferId) {
        error = "Transfer ids must not exceed " + std::to_string(protocol::kMaxTransferId);
        return false;
    }
    if (window.last_rotating < window.first_rotating) {
        error = "Empty transfer id window";
        return false;
    }
    if (buffer_depth < 1) {
        error = "Buffer depth must be at least 1";
        return false;
    }
    if (window.size() <= buffer_depth) {
        error = "Transfer id window (" + std::to_string(window.size()) + ") must exceed buffer depth (" +
                std::to_string(buffer_depth) + ")";
        return false;
    }
    return true;
}

TransferIdRotation::TransferIdRotation(TransferIdWindow window) : window_(window), current_(window.first_rotating) {}

uint8_t TransferIdRotation::advance() {
    if (current_ >= window_.last_rotating) {
        current_ = window_.first_rotating;
    } else {
        ++current_;
    }
    return current_;
}

}  // namespace streaming
}  // namespace lcdlink
