#include "hid_device_io.hpp"

#include <cwchar>
#include <mutex>

#include "logging/logger.hpp"

namespace lcdlink {
namespace transport {

namespace {

std::mutex g_library_mutex;
bool g_library_initialized = false;

// Serial numbers and product strings are ASCII in practice
std::string narrow(const wchar_t *text) {
    if (text == nullptr) {
        return "";
    }
    std::string out;
    const size_t len = std::wcslen(text);
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        const wchar_t c = text[i];
        out.push_back(c < 0x80 ? static_cast<char>(c) : '?');
    }
    return out;
}

}  // namespace

void HidReportIo::HidDeleter::operator()(hid_device *device) const noexcept {
    if (device != nullptr) {
        hid_close(device);
    }
}

HidReportIo::HidReportIo(hid_device *device, std::string path) : handle_(device), path_(std::move(path)) {}

HidReportIo::~HidReportIo() { close(); }

std::string HidReportIo::hid_error_string() const {
    if (!handle_) {
        return "device closed";
    }
    const wchar_t *err = hid_error(handle_.get());
    return err != nullptr ? narrow(err) : "unknown hidapi error";
}

bool HidReportIo::write_report(const std::vector<uint8_t> &report) {
    if (!handle_) {
        error_ = "Device closed: " + path_;
        return false;
    }
    if (report.empty()) {
        error_ = "Empty report";
        return false;
    }

    const int written = hid_write(handle_.get(), report.data(), report.size());
    if (written < 0) {
        error_ = "hid_write failed: " + hid_error_string();
        return false;
    }
    return true;
}

int HidReportIo::read_report(std::vector<uint8_t> &buffer, int timeout_ms) {
    if (!handle_) {
        error_ = "Device closed: " + path_;
        return -1;
    }

    buffer.resize(kMaxInputReportSize);
    const int n = hid_read_timeout(handle_.get(), buffer.data(), buffer.size(), timeout_ms);
    if (n < 0) {
        error_ = "hid_read_timeout failed: " + hid_error_string();
        buffer.clear();
        return -1;
    }
    buffer.resize(static_cast<size_t>(n));
    return n;
}

void HidReportIo::close() { handle_.reset(); }

HidDeviceEnumerator::HidDeviceEnumerator() { ensure_initialized(); }

bool HidDeviceEnumerator::ensure_initialized() {
    std::lock_guard<std::mutex> lock(g_library_mutex);
    if (g_library_initialized) {
        return true;
    }
    if (hid_init() != 0) {
        error_ = "hid_init failed";
        LOG_ERROR("[HID] " << error_);
        return false;
    }
    g_library_initialized = true;
    return true;
}

void HidDeviceEnumerator::release_library() {
    std::lock_guard<std::mutex> lock(g_library_mutex);
    if (g_library_initialized) {
        hid_exit();
        g_library_initialized = false;
    }
}

bool HidDeviceEnumerator::enumerate(uint16_t vendor_id, uint16_t product_id,
                                    std::vector<device::DeviceIdentity> &devices) {
    devices.clear();
    if (!ensure_initialized()) {
        return false;
    }

    hid_device_info *list = hid_enumerate(vendor_id, product_id);
    for (hid_device_info *info = list; info != nullptr; info = info->next) {
        if (info->path == nullptr) {
            continue;
        }
        device::DeviceIdentity identity;
        identity.vendor_id = info->vendor_id;
        identity.product_id = info->product_id;
        identity.path = info->path;
        identity.serial_number = narrow(info->serial_number);
        identity.product = narrow(info->product_string);
        devices.push_back(std::move(identity));
    }
    hid_free_enumeration(list);
    return true;
}

std::unique_ptr<IReportIo> HidDeviceEnumerator::open(const device::DeviceIdentity &identity) {
    if (!ensure_initialized()) {
        return nullptr;
    }

    hid_device *device = hid_open_path(identity.path.c_str());
    if (device == nullptr) {
        error_ = "hid_open_path failed for " + identity.path;
        return nullptr;
    }
    return std::make_unique<HidReportIo>(device, identity.path);
}

}  // namespace transport
}  // namespace lcdlink
