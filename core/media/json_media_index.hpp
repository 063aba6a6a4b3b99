#pragma once

#include <map>
#include <mutex>
#include <string>

#include "media/media_index.hpp"

namespace lcdlink {
namespace media {

/**
 * @brief IMediaIndex persisted as one JSON document
 *
 * Layout: {"devices": {"<device key>": {"<slot>": {file_name, local_path, transfer_id, updated_ms}}}}
 *
 * Every mutation rewrites the file (write to "<path>.tmp", then rename).
 * An empty path keeps the index in memory only.
 */
class JsonMediaIndex : public IMediaIndex {
public:
    explicit JsonMediaIndex(std::string path = "");

    // Loads the file if it exists. A missing file is an empty index.
    bool load();

    std::optional<MediaSlotEntry> get(const std::string &device_key, int slot) const override;
    bool put(const std::string &device_key, const MediaSlotEntry &entry) override;
    bool remove(const std::string &device_key, int slot) override;
    bool clear(const std::string &device_key) override;
    std::vector<MediaSlotEntry> entries(const std::string &device_key) const override;

    std::string last_error() const override;
    const std::string &path() const { return path_; }

private:
    using SlotMap = std::map<int, MediaSlotEntry>;

    // Caller holds mutex_
    bool save_locked();

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, SlotMap> devices_;
    std::string last_error_;
};

}  // namespace media
}  // namespace lcdlink
