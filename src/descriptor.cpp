/*
 * descriptor.cpp - Descriptor protocol field helpers implementation
 */

#include "descriptor.hpp"

void write_field(std::ostream& out, const char* name, const std::string& value) {
    out << '{' << name << '=' << value << '}';
}

void write_field(std::ostream& out, const char* name, uint64_t value) {
    out << '{' << name << '=' << value << '}';
}

void write_opt_field(std::ostream& out, const char* name, const std::optional<std::string>& value) {
    if (value) {
        write_field(out, name, *value);
    }
}

void write_opt_field(std::ostream& out, const char* name, const std::optional<bool>& value) {
    if (value) {
        write_field(out, name, std::string(*value ? "true" : "false"));
    }
}
