#include "command.hpp"

#include <sstream>
#include <vector>

namespace lcdlink {
namespace protocol {

namespace {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string &s, const char *prefix, std::string &rest) {
    const std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0) {
        return false;
    }
    rest = s.substr(p.size());
    return true;
}

bool parse_uint(const std::string &s, unsigned long long &value) {
    if (s.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        value = std::stoull(s, &pos);
        return pos == s.size();
    } catch (const std::exception &) {
        return false;
    }
}

}  // namespace

CommandRequest CommandRequest::post(const std::string &command, nlohmann::json payload) {
    CommandRequest request;
    request.verb = "POST";
    request.command = command;
    request.payload = std::move(payload);
    return request;
}

CommandRequest CommandRequest::keep_alive(int64_t timestamp_ms) {
    CommandRequest request;
    request.verb = "STATE";
    request.command = commands::kTimestamp;
    request.payload = nlohmann::json{{"timestamp", timestamp_ms}};
    return request;
}

std::string format_request(const CommandRequest &request, uint32_t sequence_number) {
    const std::string body = request.payload.dump();

    std::ostringstream out;
    out << request.verb << " " << request.command << " 1\r\n"
        << "SeqNumber=" << sequence_number << "\r\n"
        << "ContentType=json\r\n"
        << "ContentLength=" << body.size() << "\r\n"
        << "\r\n"
        << body;
    return out.str();
}

bool parse_response(const std::string &text, CommandResponse &response, std::string &error) {
    response = CommandResponse{};

    // Firmware pads responses with NUL bytes
    std::string cleaned = text.substr(0, text.find('\0'));

    std::vector<std::string> lines;
    std::istringstream in(cleaned);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    if (lines.empty()) {
        error = "Empty response";
        return false;
    }

    std::istringstream status_line(lines[0]);
    std::string status_token;
    if (!(status_line >> response.tag >> status_token)) {
        error = "Malformed status line: '" + lines[0] + "'";
        return false;
    }
    unsigned long long status = 0;
    if (!parse_uint(status_token, status)) {
        error = "Non-numeric status code: '" + status_token + "'";
        return false;
    }
    response.status_code = static_cast<int>(status);

    bool in_body = false;
    std::string body;
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string &l = lines[i];
        if (!in_body && l.find('{') != std::string::npos) {
            in_body = true;
        }

        if (in_body) {
            if (!body.empty()) {
                body += "\n";
            }
            body += l;
            continue;
        }

        std::string value;
        unsigned long long number = 0;
        if (starts_with(l, "AckNumber=", value)) {
            if (!parse_uint(value, number)) {
                error = "Invalid AckNumber: '" + value + "'";
                return false;
            }
            response.ack_number = static_cast<uint32_t>(number);
        } else if (starts_with(l, "ContentType=", value)) {
            response.content_type = value;
        } else if (starts_with(l, "ContentLength=", value)) {
            if (parse_uint(value, number)) {
                response.content_length = static_cast<size_t>(number);
            }
        }
    }

    if (!body.empty()) {
        try {
            response.payload = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error &e) {
            error = "Invalid JSON body: " + std::string(e.what());
            return false;
        }
    }

    return true;
}

}  // namespace protocol
}  // namespace lcdlink
