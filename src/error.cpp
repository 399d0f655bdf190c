/*
 * error.cpp - Extcap error type implementation
 */

#include "error.hpp"

ExtcapError::ExtcapError(Kind kind, const std::string& message)
    : std::runtime_error(std::string(kind_name(kind)) + ":" + message),
      kind_(kind),
      message_(message) {}

const char* ExtcapError::kind_name(Kind kind) {
    switch (kind) {
        case Kind::IO:                return "Io";
        case Kind::FLAG_PARSE:        return "FlagParse";
        case Kind::FRAMING:           return "Framing";
        case Kind::MISSING_INTERFACE: return "MissingInterface";
        case Kind::INVALID_INTERFACE: return "InvalidInterface";
        case Kind::UNKNOWN_STEP:      return "UnknownStepRequested";
        case Kind::INVALID_STATE:     return "InvalidState";
        case Kind::NOT_IMPLEMENTED:   return "NotImplemented";
        case Kind::USER:              return "UserError";
    }
    return "Unknown";
}

ExtcapError ExtcapError::io(const std::string& message) {
    return ExtcapError(Kind::IO, message);
}

ExtcapError ExtcapError::flag_parse(const std::string& message) {
    return ExtcapError(Kind::FLAG_PARSE, message);
}

ExtcapError ExtcapError::framing(const std::string& message) {
    return ExtcapError(Kind::FRAMING, message);
}

ExtcapError ExtcapError::missing_interface() {
    return ExtcapError(Kind::MISSING_INTERFACE, "Missing interface");
}

ExtcapError ExtcapError::invalid_interface(const std::string& interface_name) {
    return ExtcapError(Kind::INVALID_INTERFACE, "Invalid interface: " + interface_name);
}

ExtcapError ExtcapError::unknown_step() {
    return ExtcapError(Kind::UNKNOWN_STEP, "Unknown step requested");
}

ExtcapError ExtcapError::invalid_state(const std::string& message) {
    return ExtcapError(Kind::INVALID_STATE, message);
}

ExtcapError ExtcapError::not_implemented(const std::string& operation) {
    return ExtcapError(Kind::NOT_IMPLEMENTED, operation + " is not implemented");
}

ExtcapError ExtcapError::user_error(const std::string& message) {
    return ExtcapError(Kind::USER, message);
}
