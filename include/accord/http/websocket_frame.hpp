#pragma once

/// @file websocket_frame.hpp
/// @brief RFC 6455 framing for the message transport
///
/// Encodes text/close/ping/pong frames and reassembles fragmented messages.
/// Data messages and control frames come out of the parser in arrival order.

#include <array>
#include <cstdint>
#include <cstring>
#include <deque>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace accord::http::websocket {

/// WebSocket opcodes (RFC 6455 Section 5.2)
enum class opcode : uint8_t {
    continuation = 0x0,
    text = 0x1,
    binary = 0x2,
    close = 0x8,
    ping = 0x9,
    pong = 0xA,
};

inline constexpr bool is_control_frame(opcode op) noexcept {
    return static_cast<uint8_t>(op) >= 0x8;
}

inline constexpr bool is_valid_opcode(uint8_t op) noexcept {
    return op <= 0x2 || (op >= 0x8 && op <= 0xA);
}

/// WebSocket close status codes (RFC 6455 Section 7.4.1)
enum class close_code : uint16_t {
    normal = 1000,
    going_away = 1001,
    protocol_error = 1002,
    unsupported = 1003,
    no_status = 1005,          ///< No status received (never sent)
    abnormal = 1006,           ///< Connection dropped (never sent)
    invalid_data = 1007,
    policy_violation = 1008,
    too_large = 1009,
    unexpected = 1011,
};

/// Whether @p code may appear in a close frame on the wire. 1005, 1006 and
/// 1015 are reserved for local reporting.
inline constexpr bool is_sendable_close_code(uint16_t code) noexcept {
    return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1014) ||
           (code >= 3000 && code <= 4999);
}

/// Decoded frame header
struct frame_header {
    bool fin = true;
    opcode op = opcode::text;
    bool masked = false;
    uint64_t payload_len = 0;
    std::array<uint8_t, 4> mask_key = {};
};

/// XOR masking (its own inverse)
inline void apply_mask(char* data, size_t len, const std::array<uint8_t, 4>& key, size_t offset = 0) noexcept {
    for (size_t i = 0; i < len; ++i) {
        data[i] = static_cast<char>(static_cast<uint8_t>(data[i]) ^ key[(offset + i) % 4]);
    }
}

inline std::array<uint8_t, 4> generate_mask_key() {
    static thread_local std::mt19937 rng(std::random_device{}());
    uint32_t key = rng();
    return {
        static_cast<uint8_t>(key >> 24),
        static_cast<uint8_t>(key >> 16),
        static_cast<uint8_t>(key >> 8),
        static_cast<uint8_t>(key)
    };
}

/// Encode one unfragmented frame; client frames must be masked
inline std::string encode_frame(opcode op, std::string_view payload, bool mask) {
    std::string frame;
    frame.reserve(payload.size() + 14);

    frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(op)));

    uint8_t mask_bit = mask ? 0x80 : 0x00;
    if (payload.size() <= 125) {
        frame.push_back(static_cast<char>(mask_bit | payload.size()));
    } else if (payload.size() <= 0xFFFF) {
        frame.push_back(static_cast<char>(mask_bit | 126));
        frame.push_back(static_cast<char>(payload.size() >> 8));
        frame.push_back(static_cast<char>(payload.size()));
    } else {
        frame.push_back(static_cast<char>(mask_bit | 127));
        uint64_t len = payload.size();
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<char>(len >> (i * 8)));
        }
    }

    if (!mask) {
        frame.append(payload);
        return frame;
    }

    auto key = generate_mask_key();
    frame.append(reinterpret_cast<const char*>(key.data()), key.size());
    size_t start = frame.size();
    frame.append(payload);
    apply_mask(frame.data() + start, payload.size(), key);
    return frame;
}

inline std::string encode_text_frame(std::string_view text, bool mask = false) {
    return encode_frame(opcode::text, text, mask);
}

inline std::string encode_close_frame(close_code code = close_code::normal,
                                      std::string_view reason = "",
                                      bool mask = false) {
    std::string payload;
    auto value = static_cast<uint16_t>(code);
    payload.push_back(static_cast<char>(value >> 8));
    payload.push_back(static_cast<char>(value));
    // Control frame payloads are capped at 125 bytes
    payload.append(reason.substr(0, 123));
    return encode_frame(opcode::close, payload, mask);
}

inline std::string encode_ping_frame(std::string_view payload = "", bool mask = false) {
    return encode_frame(opcode::ping, payload.substr(0, 125), mask);
}

inline std::string encode_pong_frame(std::string_view payload = "", bool mask = false) {
    return encode_frame(opcode::pong, payload.substr(0, 125), mask);
}

/// Close frame payload split into code and reason
inline std::pair<close_code, std::string> parse_close_payload(std::string_view payload) {
    if (payload.size() < 2) {
        return {close_code::no_status, ""};
    }
    auto code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                      static_cast<uint8_t>(payload[1]));
    return {static_cast<close_code>(code), std::string(payload.substr(2))};
}

/// One complete unit produced by the parser
struct frame_event {
    opcode op = opcode::text;    ///< text/binary for data messages, else the control opcode
    std::string payload;
};

/// Incremental frame parser with message reassembly
class frame_parser {
public:
    /// @param require_mask Reject unmasked frames (server side)
    explicit frame_parser(bool require_mask = false, size_t max_message_size = 0)
        : require_mask_(require_mask), max_message_size_(max_message_size) {}

    /// Append bytes; returns false once a protocol error has been seen
    bool feed(std::string_view data) {
        if (failed_) {
            return false;
        }
        buffer_ += data;
        while (process_one()) {
        }
        return !failed_;
    }

    /// Next complete message or control frame, in arrival order
    std::optional<frame_event> next() {
        if (events_.empty()) {
            return std::nullopt;
        }
        auto ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    bool has_error() const noexcept { return failed_; }
    const std::string& error() const noexcept { return error_; }

    /// Close code to report for the current error
    close_code error_code() const noexcept { return error_code_; }

private:
    bool fail(std::string_view message, close_code code = close_code::protocol_error) {
        failed_ = true;
        error_ = message;
        error_code_ = code;
        return false;
    }

    bool process_one() {
        if (buffer_.size() < 2) {
            return false;
        }
        auto* bytes = reinterpret_cast<const uint8_t*>(buffer_.data());

        frame_header header;
        header.fin = (bytes[0] & 0x80) != 0;
        if ((bytes[0] & 0x70) != 0) {
            return fail("Reserved bits must be 0");
        }
        uint8_t raw_op = bytes[0] & 0x0F;
        if (!is_valid_opcode(raw_op)) {
            return fail("Invalid opcode");
        }
        header.op = static_cast<opcode>(raw_op);
        header.masked = (bytes[1] & 0x80) != 0;

        size_t header_size = 2;
        uint8_t len7 = bytes[1] & 0x7F;
        if (len7 == 126) {
            if (buffer_.size() < 4) return false;
            header.payload_len = (static_cast<uint64_t>(bytes[2]) << 8) | bytes[3];
            header_size = 4;
        } else if (len7 == 127) {
            if (buffer_.size() < 10) return false;
            header.payload_len = 0;
            for (int i = 2; i < 10; ++i) {
                header.payload_len = (header.payload_len << 8) | bytes[i];
            }
            if (header.payload_len & 0x8000000000000000ULL) {
                return fail("Invalid payload length");
            }
            header_size = 10;
        } else {
            header.payload_len = len7;
        }

        if (is_control_frame(header.op) && (header.payload_len > 125 || !header.fin)) {
            return fail("Invalid control frame");
        }
        if (require_mask_ && !header.masked) {
            return fail("Client frames must be masked");
        }
        if (max_message_size_ > 0 && !is_control_frame(header.op) &&
            partial_.size() + header.payload_len > max_message_size_) {
            return fail("Message exceeds maximum size", close_code::too_large);
        }

        if (header.masked) {
            if (buffer_.size() < header_size + 4) return false;
            std::memcpy(header.mask_key.data(), buffer_.data() + header_size, 4);
            header_size += 4;
        }

        if (buffer_.size() < header_size + header.payload_len) {
            return false;
        }

        std::string payload = buffer_.substr(header_size, header.payload_len);
        buffer_.erase(0, header_size + header.payload_len);
        if (header.masked) {
            apply_mask(payload.data(), payload.size(), header.mask_key);
        }

        if (is_control_frame(header.op)) {
            events_.push_back(frame_event{header.op, std::move(payload)});
            return true;
        }

        if (header.op == opcode::continuation) {
            if (!in_message_) {
                return fail("Continuation without a started message");
            }
        } else {
            if (in_message_) {
                return fail("New message started before previous completed");
            }
            in_message_ = true;
            message_op_ = header.op;
            partial_.clear();
        }

        partial_ += payload;
        if (header.fin) {
            events_.push_back(frame_event{message_op_, std::move(partial_)});
            partial_.clear();
            in_message_ = false;
        }
        return true;
    }

    bool require_mask_;
    size_t max_message_size_;
    std::string buffer_;
    std::string partial_;
    bool in_message_ = false;
    opcode message_op_ = opcode::text;
    std::deque<frame_event> events_;
    bool failed_ = false;
    std::string error_;
    close_code error_code_ = close_code::protocol_error;
};

} // namespace accord::http::websocket
