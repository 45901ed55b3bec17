#include "wire_codec.h"

#include <charconv>
#include <chrono>

namespace wire {

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string encode_frame(MessageType type, std::string_view payload) {
    return encode_frame(type, payload, now_millis());
}

std::string encode_frame(MessageType type, std::string_view payload, int64_t timestamp) {
    const std::string type_name = to_string(type);
    const std::string ts = std::to_string(timestamp);

    std::string encoded;
    encoded.reserve(type_name.size() + ts.size() + payload.size() + 2);
    encoded.append(type_name);
    encoded.push_back(kFieldDelimiter);
    encoded.append(ts);
    encoded.push_back(kFieldDelimiter);
    encoded.append(payload.data(), payload.size());
    return encoded;
}

std::optional<Frame> decode_frame(std::string_view line) {
    const size_t first = line.find(kFieldDelimiter);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t second = line.find(kFieldDelimiter, first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    Frame frame;
    frame.type_name = std::string(line.substr(0, first));
    frame.type = message_type_from_string(frame.type_name);

    const std::string_view ts = line.substr(first + 1, second - first - 1);
    int64_t parsed = 0;
    const auto result = std::from_chars(ts.data(), ts.data() + ts.size(), parsed);
    if (result.ec == std::errc() && result.ptr == ts.data() + ts.size()) {
        frame.timestamp = parsed;
    }

    frame.payload = std::string(line.substr(second + 1));
    return frame;
}

} // namespace wire
