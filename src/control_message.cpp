/*
 * control_message.cpp - Control pipe messages and wire framing implementation
 */

#include "control_message.hpp"
#include "error.hpp"
#include <sstream>

ControlMessage::ControlMessage(uint8_t control_number, uint8_t command,
                               std::vector<uint8_t> payload)
    : control_number_(control_number),
      command_(command),
      payload_(std::move(payload)) {}

ControlMessage::ControlMessage(uint8_t control_number, ControlCommand command,
                               std::vector<uint8_t> payload)
    : ControlMessage(control_number, static_cast<uint8_t>(command), std::move(payload)) {}

ControlMessage::ControlMessage(uint8_t control_number, ControlCommand command,
                               const std::string& text)
    : ControlMessage(control_number, static_cast<uint8_t>(command),
                     std::vector<uint8_t>(text.begin(), text.end())) {}

std::optional<ControlCommand> ControlMessage::command() const {
    if (command_ > static_cast<uint8_t>(ControlCommand::ERROR_MESSAGE)) {
        return std::nullopt;
    }
    return static_cast<ControlCommand>(command_);
}

std::string ControlMessage::command_name() const {
    auto cmd = command();
    if (!cmd) {
        return "Unknown(" + std::to_string(command_) + ")";
    }

    switch (*cmd) {
        case ControlCommand::INITIALIZED:         return "Initialized";
        case ControlCommand::SET:                 return "Set";
        case ControlCommand::ADD:                 return "Add";
        case ControlCommand::REMOVE:              return "Remove";
        case ControlCommand::ENABLE:              return "Enable";
        case ControlCommand::DISABLE:             return "Disable";
        case ControlCommand::STATUSBAR_MESSAGE:   return "StatusbarMessage";
        case ControlCommand::INFORMATION_MESSAGE: return "InformationMessage";
        case ControlCommand::WARNING_MESSAGE:     return "WarningMessage";
        case ControlCommand::ERROR_MESSAGE:       return "ErrorMessage";
    }
    return "Unknown(" + std::to_string(command_) + ")";
}

std::string ControlMessage::describe() const {
    std::ostringstream oss;
    oss << "ControlMessage{control=" << static_cast<unsigned>(control_number_)
        << ", command=" << command_name()
        << ", payload=" << payload_.size() << " bytes}";
    return oss.str();
}

bool ControlMessage::operator==(const ControlMessage& other) const {
    return control_number_ == other.control_number_ &&
           command_ == other.command_ &&
           payload_ == other.payload_;
}

// ControlMessageCodec implementation

void ControlMessageCodec::encode(const ControlMessage& msg, std::vector<uint8_t>& out) {
    size_t msg_len = CONTROL_MIN_MESSAGE_LEN + msg.payload().size();
    if (msg_len > CONTROL_MAX_MESSAGE_LEN) {
        throw ExtcapError::framing("payload of " + std::to_string(msg.payload().size()) +
                                   " bytes does not fit a control frame");
    }

    out.reserve(out.size() + CONTROL_HEADER_LEN + msg_len);
    out.push_back(CONTROL_SYNC);
    out.push_back(static_cast<uint8_t>((msg_len >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((msg_len >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(msg_len & 0xFF));
    out.push_back(msg.control_number());
    out.push_back(msg.command_code());
    out.insert(out.end(), msg.payload().begin(), msg.payload().end());
}

std::vector<uint8_t> ControlMessageCodec::encode(const ControlMessage& msg) {
    std::vector<uint8_t> out;
    encode(msg, out);
    return out;
}

std::optional<ControlMessage> ControlMessageCodec::decode(std::vector<uint8_t>& buf) {
    if (buf.size() < CONTROL_HEADER_LEN) {
        return std::nullopt;
    }

    if (buf[0] != CONTROL_SYNC) {
        throw ExtcapError::framing("Sync Pipe Indication != 'T'");
    }

    size_t msg_len = (static_cast<size_t>(buf[1]) << 16) |
                     (static_cast<size_t>(buf[2]) << 8) |
                     static_cast<size_t>(buf[3]);
    if (msg_len < CONTROL_MIN_MESSAGE_LEN) {
        throw ExtcapError::framing("Message Length < 2");
    }

    size_t frame_len = CONTROL_HEADER_LEN + msg_len;
    if (buf.size() < frame_len) {
        return std::nullopt;
    }

    auto payload_begin = buf.begin() + CONTROL_HEADER_LEN + CONTROL_MIN_MESSAGE_LEN;
    auto frame_end = buf.begin() + static_cast<std::ptrdiff_t>(frame_len);
    ControlMessage msg(buf[4], buf[5], std::vector<uint8_t>(payload_begin, frame_end));

    buf.erase(buf.begin(), frame_end);
    return msg;
}
