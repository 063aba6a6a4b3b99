#include "frame_codec.hpp"

#include <algorithm>
#include <cctype>

namespace lcdlink {
namespace protocol {

namespace {

std::string lowercase_extension(const std::string &path) {
    auto slash = path.find_last_of("/\\");
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace

FileType file_type_from_path(const std::string &path) {
    const std::string ext = lowercase_extension(path);
    if (ext == ".jpg" || ext == ".jpeg") {
        return FileType::JPEG;
    }
    if (ext == ".png") {
        return FileType::PNG;
    }
    return FileType::UNSPECIFIED;
}

std::vector<uint8_t> stuff_bytes(const std::vector<uint8_t> &data) {
    std::vector<uint8_t> out;
    out.reserve(data.size() + data.size() / 8 + 1);
    for (uint8_t b : data) {
        if (b == kFrameMarker) {
            out.push_back(kEscapeByte);
            out.push_back(kEscapedMarker);
        } else if (b == kEscapeByte) {
            out.push_back(kEscapeByte);
            out.push_back(kEscapedEscape);
        } else {
            out.push_back(b);
        }
    }
    return out;
}

bool unstuff_bytes(const uint8_t *data, size_t len, std::vector<uint8_t> &out) {
    out.clear();
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != kEscapeByte) {
            out.push_back(data[i]);
            continue;
        }
        if (i + 1 >= len) {
            return false;
        }
        const uint8_t code = data[++i];
        if (code == kEscapedMarker) {
            out.push_back(kFrameMarker);
        } else if (code == kEscapedEscape) {
            out.push_back(kEscapeByte);
        } else {
            return false;
        }
    }
    return true;
}

uint8_t compute_checksum(const uint8_t *data, size_t len) {
    uint8_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        sum = static_cast<uint8_t>(sum + data[i]);
    }
    return sum;
}

std::vector<uint8_t> encode_command_frame(const std::string &payload, uint8_t report_id) {
    const size_t frame_len = payload.size() + 5;

    std::vector<uint8_t> body;
    body.reserve(payload.size() + 3);
    body.push_back(static_cast<uint8_t>((frame_len >> 8) & 0xFF));
    body.push_back(static_cast<uint8_t>(frame_len & 0xFF));
    body.insert(body.end(), payload.begin(), payload.end());
    body.push_back(compute_checksum(body.data(), body.size()));

    std::vector<uint8_t> stuffed = stuff_bytes(body);

    std::vector<uint8_t> frame;
    frame.reserve(stuffed.size() + 3);
    frame.push_back(report_id);
    frame.push_back(kFrameMarker);
    frame.insert(frame.end(), stuffed.begin(), stuffed.end());
    frame.push_back(kFrameMarker);
    return frame;
}

bool decode_response_frame(const uint8_t *report, size_t len, std::string &payload, std::string &error) {
    // report id + start marker + len(2) + checksum + end marker
    if (report == nullptr || len < 6) {
        error = "Response too short (" + std::to_string(len) + " bytes)";
        return false;
    }
    if (report[0] != kResponseReportId) {
        error = "Unexpected report id " + std::to_string(report[0]);
        return false;
    }
    if (report[1] != kFrameMarker) {
        error = "Missing start marker";
        return false;
    }

    size_t end = len - 1;
    while (end > 1 && report[end] != kFrameMarker) {
        --end;
    }
    if (end <= 1) {
        error = "Missing end marker";
        return false;
    }

    std::vector<uint8_t> body;
    if (!unstuff_bytes(report + 2, end - 2, body)) {
        error = "Invalid escape sequence in response";
        return false;
    }
    if (body.size() < 3) {
        error = "Response body too short";
        return false;
    }

    const size_t declared = (static_cast<size_t>(body[0]) << 8) | body[1];
    const size_t payload_len = body.size() - 3;
    if (declared != payload_len + 5) {
        error = "Length mismatch (declared " + std::to_string(declared) + ", actual " +
                std::to_string(payload_len + 5) + ")";
        return false;
    }

    const uint8_t expected = compute_checksum(body.data(), body.size() - 1);
    if (expected != body.back()) {
        error = "Checksum mismatch";
        return false;
    }

    payload.assign(reinterpret_cast<const char *>(body.data() + 2), payload_len);
    return true;
}

bool encode_file_blocks(const uint8_t *data, size_t size, FileType type, uint8_t transfer_id, size_t block_size,
                        std::vector<std::vector<uint8_t>> &reports, std::string &error) {
    reports.clear();

    if (data == nullptr || size == 0) {
        error = "File data is empty";
        return false;
    }
    if (transfer_id > kMaxTransferId) {
        error = "Transfer id " + std::to_string(transfer_id) + " out of range (0-59)";
        return false;
    }
    if (block_size < 1 || block_size > kMaxBlockSize) {
        error = "Block size must be between 1 and " + std::to_string(kMaxBlockSize);
        return false;
    }

    const size_t block_count = (size + block_size - 1) / block_size;
    if (block_count > kMaxBlockCount) {
        error = "File too large (" + std::to_string(block_count) + " blocks)";
        return false;
    }

    reports.reserve(block_count);
    for (size_t index = 0; index < block_count; ++index) {
        const size_t offset = index * block_size;
        const size_t chunk = std::min(block_size, size - offset);
        const size_t length = kBlockMetadataSize + chunk;

        std::vector<uint8_t> report;
        report.reserve(4 + length);
        report.push_back(kFileTransferReportId);
        report.push_back(kBlockMarker);
        report.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        report.push_back(static_cast<uint8_t>(length & 0xFF));

        // Metadata: id, count, index, type, 14 reserved bytes
        report.push_back(transfer_id);
        report.push_back(static_cast<uint8_t>((block_count >> 8) & 0xFF));
        report.push_back(static_cast<uint8_t>(block_count & 0xFF));
        report.push_back(static_cast<uint8_t>((index >> 8) & 0xFF));
        report.push_back(static_cast<uint8_t>(index & 0xFF));
        report.push_back(static_cast<uint8_t>(type));
        report.insert(report.end(), 14, 0x00);

        report.insert(report.end(), data + offset, data + offset + chunk);
        reports.push_back(std::move(report));
    }

    return true;
}

std::vector<uint8_t> encode_subcommand(uint8_t subcommand) { return {kSubcommandReportId, subcommand, 0x00}; }

}  // namespace protocol
}  // namespace lcdlink
