/*
 * arg.hpp - Interface configuration arguments
 *
 * An ExtcapArg is one typed configuration item the host shows in the
 * interface options dialog. Every argument becomes a --<name> flag on the
 * provider's command line and one "arg" descriptor line; its selectable
 * values (ArgValue) follow as "value" lines referencing the argument's
 * ordinal.
 *
 * Usage: fill in the public fields, add values, then hand the argument to
 * ExtcapInterface::add_arg() which assigns the ordinal.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

enum class ArgType {
    INTEGER,
    UNSIGNED,
    LONG,
    DOUBLE,
    STRING,
    PASSWORD,
    BOOLEAN,
    BOOLFLAG,
    FILESELECT,
    SELECTOR,
    RADIO,
    MULTICHECK,
    TIMESTAMP
};

// Type keyword used in the descriptor, e.g. "unsigned"
const char* arg_type_name(ArgType type);

constexpr size_t UNASSIGNED_ORDINAL = SIZE_MAX;

struct ArgValue {
    size_t arg = UNASSIGNED_ORDINAL;   // Ordinal of the owning argument
    std::string value;
    std::optional<std::string> display;
    std::optional<bool> is_default;

    ArgValue() = default;
    explicit ArgValue(std::string value,
                      std::optional<std::string> display = std::nullopt,
                      std::optional<bool> is_default = std::nullopt);

    // value {arg=<n>}{value=<v>}{display=<d>}[{default=..}]
    void print(std::ostream& out) const;

    bool operator==(const ArgValue& other) const;
};

class ExtcapArg {
public:
    ExtcapArg(ArgType type, std::string name);

    ArgType type;
    std::string name;                        // Flag name without the leading --
    std::optional<std::string> display;      // Falls back to name
    std::optional<std::string> default_value;
    std::optional<std::string> range;        // e.g. "1,65535"
    std::optional<std::string> validation;   // Regex applied by the host
    std::optional<bool> must_exist;          // FILESELECT only
    std::optional<bool> reload;              // Values can be refreshed on demand
    std::optional<std::string> placeholder;
    std::optional<std::string> tooltip;
    std::optional<std::string> group;

    size_t number() const { return number_; }
    const std::vector<ArgValue>& values() const { return values_; }

    // Append a selectable value; it is stamped with this argument's ordinal
    void add_value(ArgValue value);

    // Replace all values with a reloaded set, keeping the ordinal
    void replace_values(std::vector<ArgValue> values);

    bool is_reloadable() const { return reload.value_or(false); }

    // The command-line flag takes a value unless this is a BOOLFLAG
    bool takes_value() const { return type != ArgType::BOOLFLAG; }

    // Cross-field check, run once when the argument is registered.
    // Returns a description of the first problem found.
    std::optional<std::string> validate() const;

    // arg line followed by one value line per value
    void print(std::ostream& out) const;

private:
    friend class ExtcapInterface;
    void set_number(size_t number);

    size_t number_ = UNASSIGNED_ORDINAL;
    std::vector<ArgValue> values_;
};
