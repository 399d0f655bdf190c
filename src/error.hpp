/*
 * error.hpp - Extcap error type
 *
 * Every fatal condition the provider can hit is reported as an ExtcapError
 * carrying a Kind. Flag-parse and step-derivation errors abort before any
 * descriptor output; framing errors stay inside the control-pipe pump that
 * raised them; user errors come from the capture routine and are passed to
 * the process boundary unchanged.
 */

#pragma once

#include <stdexcept>
#include <string>

class ExtcapError : public std::runtime_error {
public:
    enum class Kind {
        IO,
        FLAG_PARSE,
        FRAMING,
        MISSING_INTERFACE,
        INVALID_INTERFACE,
        UNKNOWN_STEP,
        INVALID_STATE,
        NOT_IMPLEMENTED,
        USER
    };

    ExtcapError(Kind kind, const std::string& message);

    Kind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    // Human-readable kind name, e.g. "MissingInterface"
    static const char* kind_name(Kind kind);

    static ExtcapError io(const std::string& message);
    static ExtcapError flag_parse(const std::string& message);
    static ExtcapError framing(const std::string& message);
    static ExtcapError missing_interface();
    static ExtcapError invalid_interface(const std::string& interface_name);
    static ExtcapError unknown_step();
    static ExtcapError invalid_state(const std::string& message);
    static ExtcapError not_implemented(const std::string& operation);

    // Raised by capture routines for their own failures
    static ExtcapError user_error(const std::string& message);

private:
    Kind kind_;
    std::string message_;
};
