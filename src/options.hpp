/*
 * options.hpp - Command-line flag registry and parser
 *
 * The provider is configured entirely through long command-line flags:
 * the fixed extcap flags the host always understands, plus one --<name>
 * flag per declared interface argument. FlagRegistry collects the flag
 * declarations (idempotent by name) and parses argv with getopt_long into
 * an Options set.
 *
 * Parsing checks per-flag "requires" / "conflicts with" rules and exclusive
 * groups; any violation, unknown flag, missing value or stray positional
 * argument raises ExtcapError FLAG_PARSE.
 */

#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct FlagSpec {
    std::string name;                         // Long name without --
    bool takes_value = false;
    std::string help;
    std::string value_name;                   // Shown in --help, e.g. "iface"
    std::vector<std::string> requires_flags;  // Must also be present
    std::vector<std::string> conflicts_with;  // Must not also be present
};

class Options {
public:
    bool is_present(const std::string& name) const;
    std::optional<std::string> value_of(const std::string& name) const;
    std::string value_or(const std::string& name, const std::string& fallback) const;

    // Numeric value clamped to [lo, hi]. An absent flag gives fallback, a
    // malformed one logs a warning and gives fallback as well.
    long long_in_range(const std::string& name, long fallback, long lo, long hi) const;

    // Record a flag; a later occurrence replaces an earlier one
    void set(const std::string& name, std::optional<std::string> value = std::nullopt);

    size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::optional<std::string>> values_;
};

class FlagRegistry {
public:
    // Declare a flag. Returns false (and changes nothing) if the name is
    // already declared.
    bool add(FlagSpec spec);

    bool contains(const std::string& name) const;

    // At most one flag of the group may be given
    void add_exclusive_group(std::vector<std::string> names);

    const std::vector<FlagSpec>& flags() const { return flags_; }

    // Parse argv (argv[0] is the program name). Throws ExtcapError FLAG_PARSE.
    Options parse(int argc, const char* const* argv) const;

    // Flag table for --help
    void print_flags(std::ostream& out) const;

private:
    const FlagSpec* find(const std::string& name) const;
    void check_rules(const Options& options) const;

    std::vector<FlagSpec> flags_;
    std::vector<std::vector<std::string>> exclusive_groups_;
};
