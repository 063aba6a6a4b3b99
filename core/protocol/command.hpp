#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lcdlink {
namespace protocol {

// Command names understood by the display firmware
namespace commands {
constexpr const char *kBrightness = "brightness";
constexpr const char *kRotate = "rotate";
constexpr const char *kDisplayInSleep = "displayInSleep";
constexpr const char *kRealtimeDisplay = "realtimeDisplay";
constexpr const char *kTimeout = "timeout";
constexpr const char *kParam = "param";
constexpr const char *kTransport = "transport";
constexpr const char *kTransported = "transported";
constexpr const char *kDeleteMedia = "delMedia";
constexpr const char *kGetSerial = "getDeviceSN";
constexpr const char *kSetSerial = "setDeviceSN";
constexpr const char *kGetSkuColor = "getSKUColor";
constexpr const char *kSetSkuColor = "setSKUColor";
constexpr const char *kTimestamp = "timestamp";
}  // namespace commands

constexpr int kStatusOk = 200;
constexpr int kStatusErrorThreshold = 400;

// One request: verb ("POST" or "STATE"), command name and JSON payload
struct CommandRequest {
    std::string verb = "POST";
    std::string command;
    nlohmann::json payload = nlohmann::json::object();

    static CommandRequest post(const std::string &command, nlohmann::json payload = nlohmann::json::object());
    static CommandRequest keep_alive(int64_t timestamp_ms);
};

struct CommandResponse {
    std::string tag;            // First token of the status line
    int status_code = 0;
    uint32_t ack_number = 0;
    std::string content_type;
    size_t content_length = 0;
    std::optional<nlohmann::json> payload;

    bool success() const { return status_code == kStatusOk; }
    bool is_error() const { return status_code >= kStatusErrorThreshold; }
};

// "<verb> <command> 1\r\nSeqNumber=<seq>\r\nContentType=json\r\nContentLength=<n>\r\n\r\n<json>"
std::string format_request(const CommandRequest &request, uint32_t sequence_number);

// Parses the HTTP-like response text. Returns false when the status line is
// missing or the body is not valid JSON.
bool parse_response(const std::string &text, CommandResponse &response, std::string &error);

// Acks carry the request sequence number plus one
inline uint32_t expected_ack(uint32_t sequence_number) { return sequence_number + 1; }

}  // namespace protocol
}  // namespace lcdlink
