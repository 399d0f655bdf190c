/*
 * options.cpp - Command-line flag registry and parser implementation
 *
 * Builds a getopt_long option table from the registry on every parse and
 * works on a private copy of argv, since getopt_long permutes its input.
 */

#include "options.hpp"
#include "error.hpp"
#include "log.hpp"
#include <algorithm>
#include <getopt.h>
#include <iomanip>
#include <stdexcept>

namespace {

// getopt_long returns this plus the flag's index for every matched flag
constexpr int FLAG_INDEX_BASE = 0x100;

// Name part of a "--name" or "--name=value" token
std::string long_name(const char* token) {
    std::string name(token);
    if (name.compare(0, 2, "--") == 0) {
        name.erase(0, 2);
    }
    return name.substr(0, name.find('='));
}

}  // namespace

// Options implementation

bool Options::is_present(const std::string& name) const {
    return values_.find(name) != values_.end();
}

std::optional<std::string> Options::value_of(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Options::value_or(const std::string& name, const std::string& fallback) const {
    return value_of(name).value_or(fallback);
}

long Options::long_in_range(const std::string& name, long fallback, long lo, long hi) const {
    auto text = value_of(name);
    if (!text) {
        return fallback;
    }

    long value;
    try {
        size_t used = 0;
        value = std::stol(*text, &used);
        if (used != text->size()) {
            throw std::invalid_argument(*text);
        }
    } catch (const std::exception&) {
        EXTCAP_WARN("ignoring invalid --%s value '%s'", name.c_str(), text->c_str());
        return fallback;
    }

    long clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        EXTCAP_WARN("--%s value %ld out of range, using %ld", name.c_str(), value, clamped);
    }
    return clamped;
}

void Options::set(const std::string& name, std::optional<std::string> value) {
    values_[name] = std::move(value);
}

// FlagRegistry implementation

bool FlagRegistry::add(FlagSpec spec) {
    if (contains(spec.name)) {
        return false;
    }
    flags_.push_back(std::move(spec));
    return true;
}

bool FlagRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const FlagSpec* FlagRegistry::find(const std::string& name) const {
    auto it = std::find_if(flags_.begin(), flags_.end(),
                           [&](const FlagSpec& f) { return f.name == name; });
    return it == flags_.end() ? nullptr : &*it;
}

void FlagRegistry::add_exclusive_group(std::vector<std::string> names) {
    exclusive_groups_.push_back(std::move(names));
}

Options FlagRegistry::parse(int argc, const char* const* argv) const {
    std::vector<struct option> table;
    table.reserve(flags_.size() + 1);
    for (size_t i = 0; i < flags_.size(); ++i) {
        struct option opt{};
        opt.name = flags_[i].name.c_str();
        opt.has_arg = flags_[i].takes_value ? required_argument : no_argument;
        opt.flag = nullptr;
        opt.val = FLAG_INDEX_BASE + static_cast<int>(i);
        table.push_back(opt);
    }
    table.push_back(option{nullptr, 0, nullptr, 0});

    std::vector<std::string> storage(argv, argv + argc);
    std::vector<char*> args;
    args.reserve(storage.size() + 1);
    for (auto& s : storage) {
        args.push_back(&s[0]);
    }
    args.push_back(nullptr);

    auto offending = [&]() -> std::string {
        int idx = optind - 1;
        if (idx > 0 && idx < argc) {
            return args[idx];
        }
        return "?";
    };

    Options options;

    // optind = 0 makes glibc reinitialise its scanner for a fresh argv
    optind = 0;
    opterr = 0;
    int c;
    while ((c = getopt_long(argc, args.data(), ":", table.data(), nullptr)) != -1) {
        if (c == ':') {
            throw ExtcapError::flag_parse("option '" + offending() + "' requires a value");
        }
        if (c < FLAG_INDEX_BASE || c - FLAG_INDEX_BASE >= static_cast<int>(flags_.size())) {
            throw ExtcapError::flag_parse("unrecognized or ambiguous option '" + offending() + "'");
        }

        const FlagSpec& flag = flags_[static_cast<size_t>(c - FLAG_INDEX_BASE)];

        // getopt_long also matches unambiguous prefixes; only exact names count.
        // A value given as the next element leaves the flag one slot further back.
        const char* token = args[optind - 1];
        if (flag.takes_value && optarg == token && optind >= 2) {
            token = args[optind - 2];
        }
        if (long_name(token) != flag.name) {
            throw ExtcapError::flag_parse("unrecognized option '" + std::string(token) + "'");
        }

        if (flag.takes_value) {
            options.set(flag.name, std::string(optarg ? optarg : ""));
        } else {
            options.set(flag.name);
        }
    }

    if (optind < argc) {
        throw ExtcapError::flag_parse("unexpected argument '" + std::string(args[optind]) + "'");
    }

    check_rules(options);
    return options;
}

void FlagRegistry::check_rules(const Options& options) const {
    for (const auto& flag : flags_) {
        if (!options.is_present(flag.name)) {
            continue;
        }
        for (const auto& req : flag.requires_flags) {
            if (!options.is_present(req)) {
                throw ExtcapError::flag_parse("the argument '--" + flag.name +
                                              "' requires '--" + req + "'");
            }
        }
        for (const auto& other : flag.conflicts_with) {
            if (options.is_present(other)) {
                throw ExtcapError::flag_parse("the argument '--" + flag.name +
                                              "' cannot be used with '--" + other + "'");
            }
        }
    }

    for (const auto& group : exclusive_groups_) {
        std::vector<std::string> given;
        for (const auto& name : group) {
            if (options.is_present(name)) {
                given.push_back(name);
            }
        }
        if (given.size() > 1) {
            throw ExtcapError::flag_parse("the argument '--" + given[0] +
                                          "' cannot be used with '--" + given[1] + "'");
        }
    }
}

void FlagRegistry::print_flags(std::ostream& out) const {
    std::vector<std::string> columns;
    size_t width = 0;
    for (const auto& flag : flags_) {
        std::string col = "--" + flag.name;
        if (flag.takes_value) {
            col += " <" + (flag.value_name.empty() ? std::string("value") : flag.value_name) + ">";
        }
        width = std::max(width, col.size());
        columns.push_back(std::move(col));
    }

    for (size_t i = 0; i < flags_.size(); ++i) {
        out << "    " << std::left << std::setw(static_cast<int>(width)) << columns[i];
        if (!flags_[i].help.empty()) {
            out << "    " << flags_[i].help;
        }
        out << "\n";
    }
}
