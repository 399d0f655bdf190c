/*
 * extcap.hpp - Extcap provider controller
 *
 * Implements the host side of the extcap convention for one provider
 * executable. The host runs the provider several times, each time with a
 * different set of flags, and the flags select one step:
 *
 *     --extcap-interfaces                       list interfaces and controls
 *     --extcap-interface=X --extcap-dlts        list the link type of X
 *     --extcap-interface=X --extcap-config      list the arguments of X
 *         [--extcap-reload-option=A]            ... or only reload argument A
 *     --extcap-interface=X --capture --fifo=F   capture into F
 *         [--extcap-control-in=I --extcap-control-out=O]
 *
 * Listing steps print descriptor lines to stdout and finish. The capture
 * step opens the pcap sink, starts the control pipe when both control flags
 * were given, and hands over to the listener's capture routine.
 *
 * Usage: construct, add interfaces and controls, then run() once:
 *
 *     Extcap ex("mydump");
 *     ex.set_version("1.0");
 *     ex.add_interface(std::move(iface));
 *     return ex.run(listener, argc, argv);
 */

#pragma once

#include "control.hpp"
#include "control_pipe.hpp"
#include "iface.hpp"
#include "options.hpp"
#include "pcap_sink.hpp"
#include <functional>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Fixed flag names
extern const char* const OPT_EXTCAP_VERSION;
extern const char* const OPT_EXTCAP_INTERFACES;
extern const char* const OPT_EXTCAP_INTERFACE;
extern const char* const OPT_EXTCAP_DLTS;
extern const char* const OPT_EXTCAP_CONFIG;
extern const char* const OPT_EXTCAP_RELOAD_OPTION;
extern const char* const OPT_CAPTURE;
extern const char* const OPT_EXTCAP_CAPTURE_FILTER;
extern const char* const OPT_FIFO;
extern const char* const OPT_EXTCAP_CONTROL_IN;
extern const char* const OPT_EXTCAP_CONTROL_OUT;
extern const char* const OPT_DEBUG;
extern const char* const OPT_DEBUG_FILE;
extern const char* const OPT_HELP;
extern const char* const OPT_VERSION;

struct ExtcapStep {
    enum class Kind { NONE, QUERY_INTERFACES, QUERY_DLTS, CONFIG_INTERFACE, CAPTURE };

    Kind kind = Kind::NONE;
    bool reload = false;             // CONFIG_INTERFACE: --extcap-reload-option given
    bool has_control_pipe = false;   // CAPTURE: both control pipes given

    // Derive the step from parsed flags. First match wins: interfaces,
    // dlts, config, capture.
    static ExtcapStep from_options(const Options& options);

    // e.g. "Capture{has_control_pipe=true}"
    std::string to_string() const;
};

class Extcap;

// Provider callbacks. Every hook is optional; an unset hook gets its
// default behaviour at the point where the controller would call it.
struct ExtcapListener {
    // Default: Log::init() at DEBUG with --debug, WARN otherwise,
    // writing to --debug-file if given
    std::function<void(const Extcap&, bool debug, const std::optional<std::string>& debug_file)>
        init_log;

    // Runs after flag parsing, before the step is carried out.
    // Default: no change.
    std::function<void(Extcap&)> update_interfaces;

    // New values for a reloadable argument, or nullopt to keep the current
    // ones. Default: nullopt.
    std::function<std::optional<std::vector<ArgValue>>(
        const Extcap&, const ExtcapInterface&, const ExtcapArg&)>
        reload_option;

    // Default: the interface's link type with DEFAULT_SNAPLEN
    std::function<PcapHeader(const Extcap&, const ExtcapInterface&)> capture_header;

    // The capture loop. Control channels are present only when the host
    // passed both control pipes and they could be opened. Failures are
    // reported by throwing ExtcapError (user_error for the provider's own).
    // Unset: the capture step fails with NOT_IMPLEMENTED.
    std::function<void(const Extcap&, const ExtcapInterface&, PcapSink&,
                       std::optional<ControlChannels>)>
        capture;
};

class Extcap {
public:
    explicit Extcap(std::string name);

    // Non-copyable
    Extcap(const Extcap&) = delete;
    Extcap& operator=(const Extcap&) = delete;

    // Descriptive texts
    void set_version(const std::string& version) { version_ = version; }
    void set_help_url(const std::string& url) { help_url_ = url; }
    void set_about(const std::string& about) { about_ = about; }
    void set_usage(const std::string& usage) { usage_ = usage; }
    void set_after_help(const std::string& after_help) { after_help_ = after_help; }

    // Registration, before run(). Each interface argument adds a --<name>
    // flag unless one with that name already exists.
    void add_interface(ExtcapInterface iface);
    void add_control(ExtcapControl control);

    // Parse flags, carry out the step and return the process exit status
    // (0). Throws ExtcapError on any fatal condition. Descriptor output and
    // --help go to out.
    int run(ExtcapListener& listener, int argc, const char* const* argv,
            std::ostream& out = std::cout);
    int run(ExtcapListener& listener, int argc, char** argv, std::ostream& out = std::cout);

    // Available after run() has parsed the flags
    const ExtcapStep& step() const { return step_; }
    const Options& options() const { return options_; }
    const std::optional<std::string>& host_version() const { return host_version_; }

    const std::string& name() const { return name_; }
    const std::vector<ExtcapInterface>& interfaces() const { return interfaces_; }
    const std::vector<ExtcapControl>& controls() const { return controls_; }
    const FlagRegistry& flags() const { return flags_; }

    // Index of the interface selected with --extcap-interface.
    // Throws MISSING_INTERFACE or INVALID_INTERFACE.
    size_t selected_interface() const;

    void print_help(std::ostream& out) const;

private:
    void add_fixed_flags();
    void config_arg_flag(const ExtcapArg& arg);
    void config_reload_flag();
    void config_debug_flags();

    void init_log(ExtcapListener& listener);
    void print_version(std::ostream& out) const;
    void print_interfaces(std::ostream& out) const;
    void reload_option(ExtcapListener& listener, size_t ifidx, const std::string& arg_name,
                       std::ostream& out);
    void capture(ExtcapListener& listener, const ExtcapInterface& iface);

    std::optional<size_t> find_interface(const std::string& name) const;

    std::string name_;
    std::optional<std::string> version_;
    std::optional<std::string> help_url_;
    std::string about_;
    std::string usage_;
    std::string after_help_;

    FlagRegistry flags_;
    std::vector<ExtcapInterface> interfaces_;
    std::vector<ExtcapControl> controls_;

    bool ran_ = false;
    Options options_;
    ExtcapStep step_;
    std::optional<std::string> host_version_;
};
