/*
 * iface.hpp - Capturable interface declaration
 *
 * One ExtcapInterface per interface the provider offers to the host. It
 * carries the link type reported in the "dlt" line and owns the ordered
 * list of configuration arguments shown in the interface options dialog.
 *
 * Interfaces are built before Extcap::run() and are immutable afterwards,
 * except that one argument's values may be replaced by a reload request.
 */

#pragma once

#include "arg.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// DLT_USER0
constexpr uint32_t DEFAULT_LINK_TYPE = 147;

class ExtcapInterface {
public:
    explicit ExtcapInterface(std::string name);

    std::string name;                                  // Unique key, passed back as --extcap-interface
    std::optional<std::string> description;
    uint32_t link_type = DEFAULT_LINK_TYPE;
    std::optional<std::string> link_type_name;         // Falls back to the interface name
    std::optional<std::string> link_type_description;

    // Register an argument and assign its ordinal. An argument whose name is
    // already registered, or that fails validation, is ignored (returns false).
    bool add_arg(ExtcapArg arg);

    // Add the shared "debug" and "debug-file" arguments (once)
    void config_debug();
    bool has_debug() const { return debug_; }

    const std::vector<ExtcapArg>& args() const { return args_; }
    std::optional<size_t> find_arg(const std::string& arg_name) const;
    const ExtcapArg& arg(size_t index) const { return args_.at(index); }
    ExtcapArg& arg(size_t index) { return args_.at(index); }

    bool has_reloadable_arg() const;

    // interface {value=<name>}[{display=<descr>}]
    void print_interface(std::ostream& out) const;

    // dlt {number=<n>}{name=<name>}[{display=<descr>}]
    void print_dlt(std::ostream& out) const;

    // Every arg and value line, in registration order
    void print_args(std::ostream& out) const;

private:
    std::vector<ExtcapArg> args_;
    bool debug_ = false;
};
