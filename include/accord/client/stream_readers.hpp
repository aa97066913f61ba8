#pragma once

/// @file stream_readers.hpp
/// @brief Incremental decoders for the two streaming response bodies
///
/// Both readers accept arbitrary byte slices (a frame may be split across
/// reads) and report complete frames through callbacks.

#include <accord/contract/endpoint.hpp>
#include <accord/json/codec.hpp>
#include <accord/log/macros.hpp>
#include <accord/server/chunk_stream.hpp>

#include <json/json.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace accord::client {

/// text/event-stream decoder
class event_stream_reader {
public:
    using callback = std::function<void(const std::string& event, const Json::Value& data)>;

    explicit event_stream_reader(callback on_event) : on_event_(std::move(on_event)) {}

    /// Feed bytes; returns the number of events dispatched
    size_t feed(std::string_view data) {
        buffer_.append(data);
        size_t dispatched = 0;

        for (;;) {
            auto line_end = buffer_.find('\n');
            if (line_end == std::string::npos) {
                break;
            }
            std::string line = buffer_.substr(0, line_end);
            buffer_.erase(0, line_end + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (line.empty()) {
                if (dispatch()) {
                    ++dispatched;
                }
                continue;
            }
            if (line.front() == ':') {
                continue;
            }

            auto colon = line.find(':');
            std::string field = line.substr(0, colon);
            std::string value = colon == std::string::npos ? "" : line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ') {
                value.erase(0, 1);
            }

            if (field == "event") {
                event_ = std::move(value);
            } else if (field == "data") {
                if (has_data_) {
                    data_ += '\n';
                }
                data_ += value;
                has_data_ = true;
            }
        }
        return dispatched;
    }

private:
    bool dispatch() {
        if (!has_data_ && event_.empty()) {
            return false;
        }
        std::string name = event_.empty() ? "message" : std::exchange(event_, {});
        std::string text = std::exchange(data_, {});
        has_data_ = false;

        auto parsed = json::parse(text);
        on_event_(name, parsed ? *parsed : Json::Value(text));
        return true;
    }

    callback on_event_;
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
};

/// application/x-ndjson decoder for either framing
class chunk_stream_reader {
public:
    using callback = std::function<void(const Json::Value& chunk)>;

    chunk_stream_reader(contract::chunk_framing framing, callback on_chunk)
        : framing_(framing), on_chunk_(std::move(on_chunk)) {}

    /// Feed bytes; lines after the terminal frame are ignored
    void feed(std::string_view data) {
        buffer_.append(data);
        std::string::size_type line_end;
        while (!finished_ && (line_end = buffer_.find('\n')) != std::string::npos) {
            std::string line = buffer_.substr(0, line_end);
            buffer_.erase(0, line_end + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                handle_line(line);
            }
        }
    }

    /// Whether the terminal frame was seen
    bool finished() const noexcept { return finished_; }

    /// Final value carried by the terminal frame, if any
    const std::optional<Json::Value>& final_value() const noexcept { return final_; }

private:
    void handle_line(std::string_view line) {
        auto parsed = json::parse(line);
        if (!parsed) {
            ACCORD_LOG_WARNING("Skipping malformed stream line: {}", parsed.error());
            return;
        }
        const Json::Value& frame = *parsed;

        if (framing_ == contract::chunk_framing::envelope) {
            const std::string kind = frame.isObject() ? frame["kind"].asString() : "";
            if (kind == "final") {
                finished_ = true;
                if (frame.isMember("value")) {
                    final_ = frame["value"];
                }
            } else if (kind == "chunk") {
                on_chunk_(frame["value"]);
            } else {
                ACCORD_LOG_WARNING("Skipping stream line without a kind");
            }
            return;
        }

        const std::string marker(server::FINAL_MARKER_KEY);
        if (frame.isObject() && frame[marker].isBool() && frame[marker].asBool()) {
            finished_ = true;
            const Json::Value& value = frame[std::string(server::FINAL_DATA_KEY)];
            if (!value.isNull()) {
                final_ = value;
            }
            return;
        }
        on_chunk_(frame);
    }

    contract::chunk_framing framing_;
    callback on_chunk_;
    std::string buffer_;
    std::optional<Json::Value> final_;
    bool finished_ = false;
};

} // namespace accord::client
