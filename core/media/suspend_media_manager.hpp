#pragma once

/**
 * @file suspend_media_manager.hpp
 * @brief Persistent media slots the device plays on its own in suspend mode
 *
 * Slots are fixed hardware positions [0, max_suspend_media_count) reported by
 * the device. The caller picks the slot; writing an occupied slot replaces it.
 *
 * The local index is only updated after the device confirmed a change, and the
 * device's occupancy bitmap wins whenever the two disagree (see reconcile()).
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "control/device_controller.hpp"
#include "events/event_emitter.hpp"
#include "media/media_index.hpp"
#include "media/media_transcoder.hpp"

namespace lcdlink {
namespace media {

enum class MediaError {
    NONE,
    INVALID_SLOT,      // Outside the device-reported range
    FILE_ERROR,        // Source unreadable or cache not writable
    TRANSCODE_FAILED,
    DEVICE_ERROR,      // See transport_error
    INDEX_ERROR,       // Device updated, local index not persisted
};

const char *media_error_to_string(MediaError error);

struct MediaResult {
    MediaError error = MediaError::NONE;
    control::TransportError transport_error = control::TransportError::NONE;
    std::string error_message;

    bool ok() const { return error == MediaError::NONE; }

    static MediaResult failure(MediaError error, std::string message) {
        MediaResult result;
        result.error = error;
        result.error_message = std::move(message);
        return result;
    }
    static MediaResult device_failure(const control::CommandResult &command) {
        MediaResult result = failure(MediaError::DEVICE_ERROR, command.error_message);
        result.transport_error = command.error;
        return result;
    }
};

// Reconciled view of one slot
struct SlotView {
    int slot = 0;
    bool occupied = false;
    std::string file_name;
    std::string local_path;
    bool placeholder = false;  // Occupied on the device but unknown locally
};

struct MediaConfig {
    std::string cache_dir = "media_cache";
    uint8_t reserved_transfer_ids = 4;  // Suspend writes use ids below this
    ReencodePolicy policy;
};

// "suspend_<slot><ext>"
std::string suspend_file_name(int slot, const std::string &extension);

/**
 * @brief Candidate device names for a slot the local index knows nothing about
 *
 * The device reports occupancy per slot but not the file name, so an unknown
 * slot can only be addressed by guessing the extension: ".jpg", ".png", then
 * ".mp4". The first candidate doubles as the placeholder name shown by
 * reconcile(), which is also the first name remove_media() tries.
 */
std::vector<std::string> unknown_slot_file_names(int slot);

class SuspendMediaManager {
public:
    SuspendMediaManager(control::DeviceController &controller, IMediaIndex &index, MediaConfig config,
                        IMediaTranscoder *transcoder = nullptr,
                        std::shared_ptr<events::EventEmitter> emitter = nullptr);

    // Disables real-time display so the device plays its slots. Refused while streaming.
    control::CommandResult enter_suspend_mode(device::DeviceHandle &handle);
    control::CommandResult exit_suspend_mode(device::DeviceHandle &handle);

    /**
     * @brief Write local_file into slot
     *
     * Announce, transfer (transfer id derived from the slot), then confirm with
     * the file's MD5. The index and cache are only changed once all three succeed.
     */
    MediaResult add_media(device::DeviceHandle &handle, int slot, const std::string &local_file);

    // Deletes by the indexed name. Unknown slots try each unknown_slot_file_names()
    // candidate until the device accepts one.
    MediaResult remove_media(device::DeviceHandle &handle, int slot);

    MediaResult clear_all(device::DeviceHandle &handle);

    control::CommandResult read_status(device::DeviceHandle &handle, protocol::DeviceStatus &status);

    /**
     * @brief Align the local index with the device occupancy bitmap
     *
     * Index entries for slots the device reports empty (or no longer has) are
     * dropped along with their cached files.
     */
    control::CommandResult reconcile(device::DeviceHandle &handle, std::vector<SlotView> &views);

    std::string device_cache_dir(const device::DeviceHandle &handle) const;

private:
    MediaResult check_slot(device::DeviceHandle &handle, int slot);
    void drop_entry(const std::string &key, const MediaSlotEntry &entry);
    void emit_slot_changed(const device::DeviceHandle &handle, int slot, bool occupied, const std::string &file_name);

    control::DeviceController &controller_;
    IMediaIndex &index_;
    MediaConfig config_;
    IMediaTranscoder *transcoder_;
    std::shared_ptr<events::EventEmitter> emitter_;
};

}  // namespace media
}  // namespace lcdlink
