#include "device_status.hpp"

namespace lcdlink {
namespace protocol {

namespace {

// Firmware encodes flags as 0/1 integers, some builds as booleans
bool read_flag(const nlohmann::json &value, bool &flag) {
    if (value.is_boolean()) {
        flag = value.get<bool>();
        return true;
    }
    if (value.is_number()) {
        flag = value.get<int>() != 0;
        return true;
    }
    return false;
}

}  // namespace

bool parse_device_status(const nlohmann::json &payload, DeviceStatus &status, std::string &error) {
    if (!payload.is_object()) {
        error = "Status payload is not an object";
        return false;
    }

    DeviceStatus parsed;
    try {
        if (!payload.contains("brightness") || !payload.contains("degree")) {
            error = "Status payload missing brightness/degree";
            return false;
        }
        parsed.brightness = payload.at("brightness").get<int>();
        parsed.rotation = payload.at("degree").get<int>();
        parsed.osd_state = payload.value("osdState", 0);
        parsed.keep_alive_timeout_s = payload.value("keepAliveTimeout", 0);
        parsed.max_suspend_media_count = payload.value("maxSuspendMediaCount", 0);
        if (payload.contains("displayInSleep") && !read_flag(payload.at("displayInSleep"), parsed.display_in_sleep)) {
            error = "displayInSleep must be a boolean or number";
            return false;
        }
        if (payload.contains("suspendMediaActive")) {
            const auto &active = payload.at("suspendMediaActive");
            if (!active.is_array()) {
                error = "suspendMediaActive is not an array";
                return false;
            }
            for (const auto &entry : active) {
                bool flag = false;
                if (!read_flag(entry, flag)) {
                    error = "suspendMediaActive entries must be booleans or numbers";
                    return false;
                }
                parsed.suspend_media_active.push_back(flag);
            }
        }
    } catch (const nlohmann::json::exception &e) {
        error = "Invalid status payload: " + std::string(e.what());
        return false;
    }

    if (parsed.brightness < 0 || parsed.brightness > 100) {
        error = "Brightness out of range: " + std::to_string(parsed.brightness);
        return false;
    }
    if (!is_valid_rotation(parsed.rotation)) {
        error = "Invalid rotation: " + std::to_string(parsed.rotation);
        return false;
    }
    if (parsed.max_suspend_media_count < 0) {
        error = "Negative maxSuspendMediaCount";
        return false;
    }
    if (parsed.max_suspend_media_count == 0) {
        parsed.max_suspend_media_count = static_cast<int>(parsed.suspend_media_active.size());
    }
    // Occupancy array is sized to the device-reported slot count
    parsed.suspend_media_active.resize(static_cast<size_t>(parsed.max_suspend_media_count), false);

    status = std::move(parsed);
    return true;
}

bool is_valid_rotation(int degrees) { return degrees == 0 || degrees == 90 || degrees == 180 || degrees == 270; }

}  // namespace protocol
}  // namespace lcdlink
