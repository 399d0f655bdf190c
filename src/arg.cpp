/*
 * arg.cpp - Interface configuration arguments implementation
 */

#include "arg.hpp"
#include "descriptor.hpp"

const char* arg_type_name(ArgType type) {
    switch (type) {
        case ArgType::INTEGER:    return "integer";
        case ArgType::UNSIGNED:   return "unsigned";
        case ArgType::LONG:       return "long";
        case ArgType::DOUBLE:     return "double";
        case ArgType::STRING:     return "string";
        case ArgType::PASSWORD:   return "password";
        case ArgType::BOOLEAN:    return "boolean";
        case ArgType::BOOLFLAG:   return "boolflag";
        case ArgType::FILESELECT: return "fileselect";
        case ArgType::SELECTOR:   return "selector";
        case ArgType::RADIO:      return "radio";
        case ArgType::MULTICHECK: return "multicheck";
        case ArgType::TIMESTAMP:  return "timestamp";
    }
    return "none";
}

// ArgValue implementation

ArgValue::ArgValue(std::string value, std::optional<std::string> display,
                   std::optional<bool> is_default)
    : value(std::move(value)),
      display(std::move(display)),
      is_default(is_default) {}

void ArgValue::print(std::ostream& out) const {
    out << "value ";
    write_field(out, "arg", static_cast<uint64_t>(arg));
    write_field(out, "value", value);
    write_field(out, "display", display.value_or(value));
    write_opt_field(out, "default", is_default);
    out << "\n";
}

bool ArgValue::operator==(const ArgValue& other) const {
    return arg == other.arg && value == other.value &&
           display == other.display && is_default == other.is_default;
}

// ExtcapArg implementation

ExtcapArg::ExtcapArg(ArgType type, std::string name)
    : type(type), name(std::move(name)) {}

void ExtcapArg::set_number(size_t number) {
    number_ = number;
    for (auto& val : values_) {
        val.arg = number;
    }
}

void ExtcapArg::add_value(ArgValue value) {
    value.arg = number_;
    values_.push_back(std::move(value));
}

void ExtcapArg::replace_values(std::vector<ArgValue> values) {
    values_ = std::move(values);
    for (auto& val : values_) {
        val.arg = number_;
    }
}

std::optional<std::string> ExtcapArg::validate() const {
    if (name.empty()) {
        return std::string("argument name is empty");
    }
    if (name.find_first_of(" \t=") != std::string::npos) {
        return "argument name '" + name + "' contains whitespace or '='";
    }
    if (must_exist && type != ArgType::FILESELECT) {
        return "mustexist on '" + name + "' requires a fileselect argument";
    }
    if (!values_.empty() && type != ArgType::SELECTOR &&
        type != ArgType::RADIO && type != ArgType::MULTICHECK) {
        return "values on '" + name + "' require a selector, radio or multicheck argument";
    }
    return std::nullopt;
}

void ExtcapArg::print(std::ostream& out) const {
    out << "arg ";
    write_field(out, "number", static_cast<uint64_t>(number_));
    write_field(out, "call", "--" + name);
    write_field(out, "display", display.value_or(name));
    write_field(out, "type", std::string(arg_type_name(type)));
    write_opt_field(out, "default", default_value);
    write_opt_field(out, "range", range);
    write_opt_field(out, "validation", validation);
    write_opt_field(out, "mustexist", must_exist);
    write_opt_field(out, "reload", reload);
    write_opt_field(out, "placeholder", placeholder);
    write_opt_field(out, "tooltip", tooltip);
    write_opt_field(out, "group", group);
    out << "\n";

    for (const auto& val : values_) {
        val.print(out);
    }
}
