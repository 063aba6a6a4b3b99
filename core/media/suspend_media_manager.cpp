#include "suspend_media_manager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "logging/logger.hpp"
#include "media/md5.hpp"

namespace lcdlink {
namespace media {

namespace fs = std::filesystem;
using control::CommandResult;
using control::TransportError;

const char *media_error_to_string(MediaError error) {
    switch (error) {
        case MediaError::NONE:
            return "NONE";
        case MediaError::INVALID_SLOT:
            return "INVALID_SLOT";
        case MediaError::FILE_ERROR:
            return "FILE_ERROR";
        case MediaError::TRANSCODE_FAILED:
            return "TRANSCODE_FAILED";
        case MediaError::DEVICE_ERROR:
            return "DEVICE_ERROR";
        case MediaError::INDEX_ERROR:
            return "INDEX_ERROR";
    }
    return "UNKNOWN";
}

std::string suspend_file_name(int slot, const std::string &extension) {
    return "suspend_" + std::to_string(slot) + extension;
}

std::vector<std::string> unknown_slot_file_names(int slot) {
    return {suspend_file_name(slot, ".jpg"), suspend_file_name(slot, ".png"), suspend_file_name(slot, ".mp4")};
}

namespace {

std::string lower_extension(const fs::path &path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool read_bytes(const fs::path &path, std::vector<uint8_t> &out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

// Removes a staged copy unless it was committed
class StagedFile {
public:
    explicit StagedFile(fs::path path) : path_(std::move(path)) {}
    ~StagedFile() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    const fs::path &path() const { return path_; }

    bool commit(const fs::path &target, std::string &error) {
        std::error_code ec;
        fs::rename(path_, target, ec);
        if (ec) {
            error = "Cannot move " + path_.string() + " to " + target.string() + ": " + ec.message();
            return false;
        }
        committed_ = true;
        return true;
    }

private:
    fs::path path_;
    bool committed_ = false;
};

std::string sanitize_key(const std::string &key) {
    std::string out = key;
    for (auto &c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            c = '_';
        }
    }
    return out.empty() ? "unknown" : out;
}

}  // namespace

SuspendMediaManager::SuspendMediaManager(control::DeviceController &controller, IMediaIndex &index,
                                         MediaConfig config, IMediaTranscoder *transcoder,
                                         std::shared_ptr<events::EventEmitter> emitter)
    : controller_(controller),
      index_(index),
      config_(std::move(config)),
      transcoder_(transcoder),
      emitter_(std::move(emitter)) {
    if (config_.reserved_transfer_ids == 0) {
        config_.reserved_transfer_ids = 1;
    }
}

std::string SuspendMediaManager::device_cache_dir(const device::DeviceHandle &handle) const {
    return (fs::path(config_.cache_dir) / sanitize_key(handle.identity().storage_key())).string();
}

CommandResult SuspendMediaManager::enter_suspend_mode(device::DeviceHandle &handle) {
    if (handle.session().streaming_active) {
        return CommandResult::failure(TransportError::INVALID_ARGUMENT,
                                      "Stop streaming on " + handle.path() + " before entering suspend mode");
    }

    auto result = controller_.set_realtime_display(handle, false);
    if (!result.ok()) {
        LOG_ERROR("[Media] Enter suspend mode on " << handle.path() << " failed: " << result.error_message);
        return result;
    }
    handle.set_suspend_mode(true);
    LOG_INFO("[Media] " << handle.path() << " in suspend mode");
    return result;
}

CommandResult SuspendMediaManager::exit_suspend_mode(device::DeviceHandle &handle) {
    auto result = controller_.set_realtime_display(handle, true);
    if (!result.ok()) {
        LOG_ERROR("[Media] Exit suspend mode on " << handle.path() << " failed: " << result.error_message);
        return result;
    }
    handle.set_suspend_mode(false);
    LOG_INFO("[Media] " << handle.path() << " left suspend mode");
    return result;
}

CommandResult SuspendMediaManager::read_status(device::DeviceHandle &handle, protocol::DeviceStatus &status) {
    return controller_.read_status(handle, status);
}

MediaResult SuspendMediaManager::check_slot(device::DeviceHandle &handle, int slot) {
    protocol::DeviceStatus status;
    auto result = controller_.read_status(handle, status);
    if (!result.ok()) {
        return MediaResult::device_failure(result);
    }
    if (slot < 0 || slot >= status.max_suspend_media_count) {
        return MediaResult::failure(MediaError::INVALID_SLOT,
                                    "Slot " + std::to_string(slot) + " outside [0, " +
                                        std::to_string(status.max_suspend_media_count) + ")");
    }
    return MediaResult{};
}

MediaResult SuspendMediaManager::add_media(device::DeviceHandle &handle, int slot, const std::string &local_file) {
    auto checked = check_slot(handle, slot);
    if (!checked.ok()) {
        LOG_ERROR("[Media] Add to slot " << slot << " on " << handle.path() << ": " << checked.error_message);
        return checked;
    }

    std::error_code ec;
    const fs::path source(local_file);
    if (!fs::is_regular_file(source, ec)) {
        return MediaResult::failure(MediaError::FILE_ERROR, "Not a file: " + local_file);
    }

    const fs::path cache_dir = device_cache_dir(handle);
    fs::create_directories(cache_dir, ec);
    if (ec) {
        return MediaResult::failure(MediaError::FILE_ERROR,
                                    "Cannot create " + cache_dir.string() + ": " + ec.message());
    }

    const std::string file_name = suspend_file_name(slot, lower_extension(source));
    const fs::path target = cache_dir / file_name;
    StagedFile staged(cache_dir / (file_name + ".partial"));

    // Re-encode oversized video into the staging file, otherwise copy as-is
    bool transcoded = false;
    if (transcoder_) {
        MediaInfo info;
        std::string error;
        if (!transcoder_->probe(source.string(), info, error)) {
            LOG_WARN("[Media] Cannot probe " << local_file << ": " << error << "; sending unmodified");
        } else if (needs_reencode(info, config_.policy)) {
            LOG_INFO("[Media] Re-encoding " << local_file << " (" << info.width << "x" << info.height << ", "
                                            << info.bitrate_kbps << "kbps)");
            if (!transcoder_->transcode(source.string(), staged.path().string(), config_.policy, error)) {
                return MediaResult::failure(MediaError::TRANSCODE_FAILED, error);
            }
            transcoded = true;
        }
    }
    if (!transcoded) {
        fs::copy_file(source, staged.path(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return MediaResult::failure(MediaError::FILE_ERROR, "Cannot copy " + local_file + ": " + ec.message());
        }
    }

    std::vector<uint8_t> data;
    if (!read_bytes(staged.path(), data) || data.empty()) {
        return MediaResult::failure(MediaError::FILE_ERROR, "Cannot read " + staged.path().string());
    }

    std::string digest;
    std::string error;
    if (!md5_hex(data, digest, error)) {
        return MediaResult::failure(MediaError::FILE_ERROR, error);
    }

    const auto transfer_id = static_cast<uint8_t>(slot % config_.reserved_transfer_ids);

    auto result = controller_.begin_suspend_transfer(handle, file_name, data.size());
    if (result.ok()) {
        result = controller_.send_file(handle, data, protocol::file_type_from_path(file_name), transfer_id);
    }
    if (result.ok()) {
        result = controller_.complete_suspend_transfer(handle, file_name, digest);
    }
    if (!result.ok()) {
        LOG_ERROR("[Media] Transfer of " << file_name << " to " << handle.path() << " failed: "
                                         << result.error_message);
        return MediaResult::device_failure(result);
    }

    if (!staged.commit(target, error)) {
        return MediaResult::failure(MediaError::FILE_ERROR, error);
    }

    const std::string key = handle.identity().storage_key();
    auto previous = index_.get(key, slot);
    if (previous && previous->file_name != file_name) {
        // Same slot, different extension: the old file would otherwise stay in device flash
        auto removed = controller_.delete_suspend_media(handle, previous->file_name);
        if (!removed.ok()) {
            LOG_WARN("[Media] Cannot delete replaced " << previous->file_name << " on " << handle.path() << ": "
                                                       << removed.error_message);
        }
    }
    if (previous && !previous->local_path.empty() && fs::path(previous->local_path) != target) {
        fs::remove(previous->local_path, ec);
    }

    MediaSlotEntry entry;
    entry.slot = slot;
    entry.file_name = file_name;
    entry.local_path = target.string();
    entry.transfer_id = transfer_id;
    entry.updated_ms = events::now_epoch_ms();

    MediaResult outcome;
    if (!index_.put(key, entry)) {
        outcome = MediaResult::failure(MediaError::INDEX_ERROR, index_.last_error());
        LOG_WARN("[Media] Slot " << slot << " written but index not saved: " << outcome.error_message);
    }

    LOG_INFO("[Media] Slot " << slot << " on " << handle.path() << " <- " << file_name << " (" << data.size()
                             << " bytes, md5 " << digest << ")");
    emit_slot_changed(handle, slot, true, file_name);
    return outcome;
}

MediaResult SuspendMediaManager::remove_media(device::DeviceHandle &handle, int slot) {
    auto checked = check_slot(handle, slot);
    if (!checked.ok()) {
        return checked;
    }

    const std::string key = handle.identity().storage_key();
    auto entry = index_.get(key, slot);
    const std::vector<std::string> candidates =
        entry ? std::vector<std::string>{entry->file_name} : unknown_slot_file_names(slot);

    std::string file_name;
    CommandResult result;
    for (const auto &candidate : candidates) {
        file_name = candidate;
        result = controller_.delete_suspend_media(handle, file_name);
        // Only "no such file" is worth another guess
        if (result.ok() || result.error != TransportError::COMMAND_REJECTED) {
            break;
        }
        LOG_DEBUG("[Media] Slot " << slot << " on " << handle.path() << " has no " << file_name);
    }
    if (!result.ok()) {
        LOG_ERROR("[Media] Delete of " << file_name << " on " << handle.path() << " failed: "
                                       << result.error_message);
        return MediaResult::device_failure(result);
    }

    MediaResult outcome;
    if (entry) {
        std::error_code ec;
        if (!entry->local_path.empty()) {
            fs::remove(entry->local_path, ec);
        }
        if (!index_.remove(key, slot)) {
            outcome = MediaResult::failure(MediaError::INDEX_ERROR, index_.last_error());
        }
    }

    LOG_INFO("[Media] Slot " << slot << " on " << handle.path() << " cleared (" << file_name << ")");
    emit_slot_changed(handle, slot, false, file_name);
    return outcome;
}

MediaResult SuspendMediaManager::clear_all(device::DeviceHandle &handle) {
    auto result = controller_.delete_suspend_media(handle, control::kDeleteAllMedia);
    if (!result.ok()) {
        LOG_ERROR("[Media] Delete all on " << handle.path() << " failed: " << result.error_message);
        return MediaResult::device_failure(result);
    }

    const std::string key = handle.identity().storage_key();
    for (const auto &entry : index_.entries(key)) {
        std::error_code ec;
        if (!entry.local_path.empty()) {
            fs::remove(entry.local_path, ec);
        }
    }

    MediaResult outcome;
    if (!index_.clear(key)) {
        outcome = MediaResult::failure(MediaError::INDEX_ERROR, index_.last_error());
    }

    LOG_INFO("[Media] All slots cleared on " << handle.path());
    emit_slot_changed(handle, -1, false, "");
    return outcome;
}

CommandResult SuspendMediaManager::reconcile(device::DeviceHandle &handle, std::vector<SlotView> &views) {
    views.clear();

    protocol::DeviceStatus status;
    auto result = controller_.read_status(handle, status);
    if (!result.ok()) {
        LOG_WARN("[Media] Cannot reconcile " << handle.path() << ": " << result.error_message);
        return result;
    }

    const std::string key = handle.identity().storage_key();
    for (int slot = 0; slot < status.max_suspend_media_count; ++slot) {
        SlotView view;
        view.slot = slot;
        view.occupied = status.slot_occupied(slot);

        auto entry = index_.get(key, slot);
        if (view.occupied) {
            if (entry) {
                view.file_name = entry->file_name;
                view.local_path = entry->local_path;
            } else {
                view.file_name = unknown_slot_file_names(slot).front();
                view.placeholder = true;
            }
        } else if (entry) {
            LOG_INFO("[Media] Slot " << slot << " on " << handle.path() << " empty on device, dropping "
                                     << entry->file_name);
            drop_entry(key, *entry);
            emit_slot_changed(handle, slot, false, entry->file_name);
        }
        views.push_back(std::move(view));
    }

    // Entries beyond what this device supports
    for (const auto &entry : index_.entries(key)) {
        if (entry.slot >= status.max_suspend_media_count) {
            drop_entry(key, entry);
        }
    }

    return result;
}

void SuspendMediaManager::drop_entry(const std::string &key, const MediaSlotEntry &entry) {
    std::error_code ec;
    if (!entry.local_path.empty()) {
        fs::remove(entry.local_path, ec);
    }
    if (!index_.remove(key, entry.slot)) {
        LOG_WARN("[Media] Cannot drop slot " << entry.slot << " from index: " << index_.last_error());
    }
}

void SuspendMediaManager::emit_slot_changed(const device::DeviceHandle &handle, int slot, bool occupied,
                                            const std::string &file_name) {
    if (!emitter_) {
        return;
    }
    events::MediaSlotChangedEvent event;
    event.path = handle.path();
    event.slot = slot;
    event.occupied = occupied;
    event.file_name = file_name;
    event.timestamp_ms = events::now_epoch_ms();
    emitter_->emit(event);
}

}  // namespace media
}  // namespace lcdlink
