/*
 * control.hpp - Interface toolbar controls
 *
 * Controls are widgets the host places on its interface toolbar (checkbox,
 * button, drop-down, text field). They are declared for the whole provider,
 * not per interface, and numbered in registration order; the same number
 * addresses the control in control-pipe messages.
 */

#pragma once

#include "arg.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

enum class ControlType { BOOLEAN, BUTTON, SELECTOR, STRING };

enum class ButtonRole { CONTROL, LOGGER, HELP, RESTORE };

const char* control_type_name(ControlType type);
const char* button_role_name(ButtonRole role);

struct ControlValue {
    size_t control = UNASSIGNED_ORDINAL;   // Ordinal of the owning control
    std::string value;
    std::optional<std::string> display;
    std::optional<bool> is_default;

    ControlValue() = default;
    explicit ControlValue(std::string value,
                          std::optional<std::string> display = std::nullopt,
                          std::optional<bool> is_default = std::nullopt);

    // value {control=<n>}{value=<v>}{display=<d>}[{default=..}]
    void print(std::ostream& out) const;
};

class ExtcapControl {
public:
    explicit ExtcapControl(ControlType type);

    // A button always has a role; CONTROL if not given
    static ExtcapControl button(ButtonRole role);

    ControlType type;
    ButtonRole role = ButtonRole::CONTROL;   // BUTTON only
    std::optional<std::string> display;
    std::optional<std::string> default_value;
    std::optional<std::string> range;
    std::optional<std::string> validation;
    std::optional<std::string> tooltip;
    std::optional<std::string> placeholder;

    size_t number() const { return number_; }
    const std::vector<ControlValue>& values() const { return values_; }

    void add_value(ControlValue value);

    // control line followed by one value line per value
    void print(std::ostream& out) const;

private:
    friend class Extcap;
    void set_number(size_t number);

    size_t number_ = UNASSIGNED_ORDINAL;
    std::vector<ControlValue> values_;
};
