/*
 * control_message.hpp - Control pipe messages and wire framing
 *
 * Toolbar control messages travel between host and provider as frames:
 *
 *     byte 0      'T' sync indication
 *     bytes 1..3  message length, uint24 big-endian, counts bytes 4..end
 *     byte 4      control number
 *     byte 5      command
 *     bytes 6..   payload
 *
 * The shortest valid frame has message length 2 (empty payload).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class ControlCommand : uint8_t {
    INITIALIZED = 0,
    SET = 1,
    ADD = 2,
    REMOVE = 3,
    ENABLE = 4,
    DISABLE = 5,
    STATUSBAR_MESSAGE = 6,
    INFORMATION_MESSAGE = 7,
    WARNING_MESSAGE = 8,
    ERROR_MESSAGE = 9
};

constexpr uint8_t CONTROL_SYNC = 'T';
constexpr size_t CONTROL_HEADER_LEN = 4;
constexpr size_t CONTROL_MIN_MESSAGE_LEN = 2;
constexpr size_t CONTROL_MAX_MESSAGE_LEN = 0xFFFFFF;

class ControlMessage {
public:
    ControlMessage() = default;
    ControlMessage(uint8_t control_number, uint8_t command, std::vector<uint8_t> payload = {});
    ControlMessage(uint8_t control_number, ControlCommand command, std::vector<uint8_t> payload = {});
    ControlMessage(uint8_t control_number, ControlCommand command, const std::string& text);

    uint8_t control_number() const { return control_number_; }

    // Raw command code; codes above 9 are passed through unchanged
    uint8_t command_code() const { return command_; }

    // Known command, or nullopt for an unknown code
    std::optional<ControlCommand> command() const;
    bool is(ControlCommand command) const { return command_ == static_cast<uint8_t>(command); }

    const std::vector<uint8_t>& payload() const { return payload_; }
    std::string text() const { return std::string(payload_.begin(), payload_.end()); }

    // e.g. "Set", "Unknown(42)"
    std::string command_name() const;

    // e.g. "ControlMessage{control=3, command=Set, payload=5 bytes}"
    std::string describe() const;

    bool operator==(const ControlMessage& other) const;
    bool operator!=(const ControlMessage& other) const { return !(*this == other); }

private:
    uint8_t control_number_ = 0;
    uint8_t command_ = 0;
    std::vector<uint8_t> payload_;
};

class ControlMessageCodec {
public:
    // Append one frame for msg to out. Throws ExtcapError FRAMING if the
    // payload does not fit the 24-bit length field.
    static void encode(const ControlMessage& msg, std::vector<uint8_t>& out);
    static std::vector<uint8_t> encode(const ControlMessage& msg);

    // Take one complete frame off the front of buf. Returns nullopt (and
    // leaves buf untouched) until the whole frame has arrived. Throws
    // ExtcapError FRAMING on a bad sync byte or a message length below 2.
    static std::optional<ControlMessage> decode(std::vector<uint8_t>& buf);
};
