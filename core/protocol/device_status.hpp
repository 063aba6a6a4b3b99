#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lcdlink {
namespace protocol {

// Snapshot returned by the "param" command. Never cached beyond the call that read it.
struct DeviceStatus {
    int brightness = 0;         // 0-100
    int rotation = 0;           // 0/90/180/270
    int osd_state = 0;
    int keep_alive_timeout_s = 0;
    int max_suspend_media_count = 0;
    bool display_in_sleep = false;
    std::vector<bool> suspend_media_active;  // Per-slot occupancy, device is authoritative

    bool slot_occupied(int slot) const {
        return slot >= 0 && static_cast<size_t>(slot) < suspend_media_active.size() &&
               suspend_media_active[static_cast<size_t>(slot)];
    }
};

bool parse_device_status(const nlohmann::json &payload, DeviceStatus &status, std::string &error);

bool is_valid_rotation(int degrees);

}  // namespace protocol
}  // namespace lcdlink
