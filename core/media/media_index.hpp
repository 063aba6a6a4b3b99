#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lcdlink {
namespace media {

// Host-side record of one suspend media slot
struct MediaSlotEntry {
    int slot = 0;
    std::string file_name;   // Name on the device
    std::string local_path;  // Cached copy, empty if unknown
    uint8_t transfer_id = 0;
    int64_t updated_ms = 0;
};

// Local media index keyed by device storage key and slot.
// Implementations guard their own state; all methods may be called concurrently.
class IMediaIndex {
public:
    virtual ~IMediaIndex() = default;

    virtual std::optional<MediaSlotEntry> get(const std::string &device_key, int slot) const = 0;

    // Inserts or replaces. Returns false if the change could not be persisted.
    virtual bool put(const std::string &device_key, const MediaSlotEntry &entry) = 0;
    virtual bool remove(const std::string &device_key, int slot) = 0;
    virtual bool clear(const std::string &device_key) = 0;

    // Sorted by slot
    virtual std::vector<MediaSlotEntry> entries(const std::string &device_key) const = 0;

    virtual std::string last_error() const = 0;
};

}  // namespace media
}  // namespace lcdlink
