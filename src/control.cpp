/*
 * control.cpp - Interface toolbar controls implementation
 */

#include "control.hpp"
#include "descriptor.hpp"

const char* control_type_name(ControlType type) {
    switch (type) {
        case ControlType::BOOLEAN:  return "boolean";
        case ControlType::BUTTON:   return "button";
        case ControlType::SELECTOR: return "selector";
        case ControlType::STRING:   return "string";
    }
    return "none";
}

const char* button_role_name(ButtonRole role) {
    switch (role) {
        case ButtonRole::CONTROL: return "control";
        case ButtonRole::LOGGER:  return "logger";
        case ButtonRole::HELP:    return "help";
        case ButtonRole::RESTORE: return "restore";
    }
    return "control";
}

ControlValue::ControlValue(std::string value, std::optional<std::string> display,
                           std::optional<bool> is_default)
    : value(std::move(value)),
      display(std::move(display)),
      is_default(is_default) {}

void ControlValue::print(std::ostream& out) const {
    out << "value ";
    write_field(out, "control", static_cast<uint64_t>(control));
    write_field(out, "value", value);
    write_field(out, "display", display.value_or(value));
    write_opt_field(out, "default", is_default);
    out << "\n";
}

ExtcapControl::ExtcapControl(ControlType type) : type(type) {}

ExtcapControl ExtcapControl::button(ButtonRole role) {
    ExtcapControl control(ControlType::BUTTON);
    control.role = role;
    return control;
}

void ExtcapControl::set_number(size_t number) {
    number_ = number;
    for (auto& val : values_) {
        val.control = number;
    }
}

void ExtcapControl::add_value(ControlValue value) {
    value.control = number_;
    values_.push_back(std::move(value));
}

void ExtcapControl::print(std::ostream& out) const {
    out << "control ";
    write_field(out, "number", static_cast<uint64_t>(number_));
    write_field(out, "type", std::string(control_type_name(type)));
    if (type == ControlType::BUTTON) {
        write_field(out, "role", std::string(button_role_name(role)));
    }
    write_opt_field(out, "display", display);
    write_opt_field(out, "default", default_value);
    write_opt_field(out, "range", range);
    write_opt_field(out, "validation", validation);
    write_opt_field(out, "tooltip", tooltip);
    write_opt_field(out, "placeholder", placeholder);
    out << "\n";

    for (const auto& val : values_) {
        val.print(out);
    }
}
