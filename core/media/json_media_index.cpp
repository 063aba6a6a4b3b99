#include "json_media_index.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace lcdlink {
namespace media {

namespace fs = std::filesystem;

JsonMediaIndex::JsonMediaIndex(std::string path) : path_(std::move(path)) {}

bool JsonMediaIndex::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();

    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        LOG_INFO("[Media] No index at " << path_ << ", starting empty");
        return true;
    }

    std::ifstream in(path_);
    if (!in) {
        last_error_ = "Cannot open media index: " + path_;
        LOG_ERROR("[Media] " << last_error_);
        return false;
    }

    try {
        const auto doc = nlohmann::json::parse(in);
        const auto devices = doc.value("devices", nlohmann::json::object());
        for (auto dev = devices.begin(); dev != devices.end(); ++dev) {
            SlotMap &slots = devices_[dev.key()];
            for (auto item = dev.value().begin(); item != dev.value().end(); ++item) {
                MediaSlotEntry entry;
                entry.slot = std::stoi(item.key());
                entry.file_name = item.value().at("file_name").get<std::string>();
                entry.local_path = item.value().value("local_path", "");
                entry.transfer_id = item.value().value("transfer_id", 0);
                entry.updated_ms = item.value().value("updated_ms", static_cast<int64_t>(0));
                slots[entry.slot] = entry;
            }
        }
    } catch (const std::exception &e) {
        devices_.clear();
        last_error_ = "Invalid media index " + path_ + ": " + e.what();
        LOG_ERROR("[Media] " << last_error_);
        return false;
    }

    LOG_INFO("[Media] Loaded index for " << devices_.size() << " device(s) from " << path_);
    return true;
}

std::optional<MediaSlotEntry> JsonMediaIndex::get(const std::string &device_key, int slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dev = devices_.find(device_key);
    if (dev == devices_.end()) {
        return std::nullopt;
    }
    auto it = dev->second.find(slot);
    if (it == dev->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonMediaIndex::put(const std::string &device_key, const MediaSlotEntry &entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device_key][entry.slot] = entry;
    return save_locked();
}

bool JsonMediaIndex::remove(const std::string &device_key, int slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dev = devices_.find(device_key);
    if (dev == devices_.end() || dev->second.erase(slot) == 0) {
        return true;
    }
    if (dev->second.empty()) {
        devices_.erase(dev);
    }
    return save_locked();
}

bool JsonMediaIndex::clear(const std::string &device_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.erase(device_key) == 0) {
        return true;
    }
    return save_locked();
}

std::vector<MediaSlotEntry> JsonMediaIndex::entries(const std::string &device_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MediaSlotEntry> out;
    auto dev = devices_.find(device_key);
    if (dev != devices_.end()) {
        for (const auto &[slot, entry] : dev->second) {
            out.push_back(entry);
        }
    }
    return out;
}

std::string JsonMediaIndex::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool JsonMediaIndex::save_locked() {
    if (path_.empty()) {
        return true;
    }

    nlohmann::json devices = nlohmann::json::object();
    for (const auto &[key, slots] : devices_) {
        nlohmann::json slot_doc = nlohmann::json::object();
        for (const auto &[slot, entry] : slots) {
            slot_doc[std::to_string(slot)] = {{"file_name", entry.file_name},
                                              {"local_path", entry.local_path},
                                              {"transfer_id", entry.transfer_id},
                                              {"updated_ms", entry.updated_ms}};
        }
        devices[key] = std::move(slot_doc);
    }
    const nlohmann::json doc = {{"devices", std::move(devices)}};

    std::error_code ec;
    const fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            last_error_ = "Cannot write media index: " + tmp;
            LOG_ERROR("[Media] " << last_error_);
            return false;
        }
        out << doc.dump(2) << "\n";
        if (!out) {
            last_error_ = "Short write to media index: " + tmp;
            LOG_ERROR("[Media] " << last_error_);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        last_error_ = "Cannot replace media index " + path_ + ": " + ec.message();
        LOG_ERROR("[Media] " << last_error_);
        return false;
    }
    return true;
}

}  // namespace media
}  // namespace lcdlink
