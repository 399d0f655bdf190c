/*
 * iface.cpp - Capturable interface declaration implementation
 */

#include "iface.hpp"
#include "descriptor.hpp"
#include "log.hpp"
#include <algorithm>

ExtcapInterface::ExtcapInterface(std::string name) : name(std::move(name)) {}

bool ExtcapInterface::add_arg(ExtcapArg arg) {
    if (find_arg(arg.name)) {
        EXTCAP_DEBUG("interface '%s' already has argument '%s'", name.c_str(), arg.name.c_str());
        return false;
    }

    if (auto problem = arg.validate()) {
        EXTCAP_WARN("interface '%s': %s", name.c_str(), problem->c_str());
        return false;
    }

    arg.set_number(args_.size());
    args_.push_back(std::move(arg));
    return true;
}

void ExtcapInterface::config_debug() {
    if (debug_) {
        return;
    }
    debug_ = true;

    ExtcapArg debug(ArgType::BOOLFLAG, "debug");
    debug.display = "Run in debug mode";
    debug.default_value = "false";
    debug.tooltip = "Print debug messages";
    debug.group = "Debug";
    add_arg(std::move(debug));

    ExtcapArg debug_file(ArgType::STRING, "debug-file");
    debug_file.display = "Use a file for debug";
    debug_file.tooltip = "Set a file where the debug messages are written";
    debug_file.group = "Debug";
    add_arg(std::move(debug_file));
}

std::optional<size_t> ExtcapInterface::find_arg(const std::string& arg_name) const {
    auto it = std::find_if(args_.begin(), args_.end(),
                           [&](const ExtcapArg& a) { return a.name == arg_name; });
    if (it == args_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - args_.begin());
}

bool ExtcapInterface::has_reloadable_arg() const {
    return std::any_of(args_.begin(), args_.end(),
                       [](const ExtcapArg& a) { return a.is_reloadable(); });
}

void ExtcapInterface::print_interface(std::ostream& out) const {
    out << "interface ";
    write_field(out, "value", name);
    write_opt_field(out, "display", description);
    out << "\n";
}

void ExtcapInterface::print_dlt(std::ostream& out) const {
    out << "dlt ";
    write_field(out, "number", static_cast<uint64_t>(link_type));
    write_field(out, "name", link_type_name.value_or(name));
    write_opt_field(out, "display", link_type_description);
    out << "\n";
}

void ExtcapInterface::print_args(std::ostream& out) const {
    for (const auto& a : args_) {
        a.print(out);
    }
}
