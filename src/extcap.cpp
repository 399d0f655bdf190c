/*
 * extcap.cpp - Extcap provider controller implementation
 *
 * run() parses the flags once, derives the step, initialises logging, and
 * then either prints the requested descriptor lines or runs the capture.
 * Nothing is printed for a step whose interface selection is missing or
 * unknown.
 */

#include "extcap.hpp"
#include "descriptor.hpp"
#include "error.hpp"
#include "log.hpp"
#include <algorithm>
#include <memory>

const char* const OPT_EXTCAP_VERSION = "extcap-version";
const char* const OPT_EXTCAP_INTERFACES = "extcap-interfaces";
const char* const OPT_EXTCAP_INTERFACE = "extcap-interface";
const char* const OPT_EXTCAP_DLTS = "extcap-dlts";
const char* const OPT_EXTCAP_CONFIG = "extcap-config";
const char* const OPT_EXTCAP_RELOAD_OPTION = "extcap-reload-option";
const char* const OPT_CAPTURE = "capture";
const char* const OPT_EXTCAP_CAPTURE_FILTER = "extcap-capture-filter";
const char* const OPT_FIFO = "fifo";
const char* const OPT_EXTCAP_CONTROL_IN = "extcap-control-in";
const char* const OPT_EXTCAP_CONTROL_OUT = "extcap-control-out";
const char* const OPT_DEBUG = "debug";
const char* const OPT_DEBUG_FILE = "debug-file";
const char* const OPT_HELP = "help";
const char* const OPT_VERSION = "version";

// ExtcapStep implementation

ExtcapStep ExtcapStep::from_options(const Options& options) {
    ExtcapStep step;

    if (options.is_present(OPT_EXTCAP_INTERFACES)) {
        step.kind = Kind::QUERY_INTERFACES;
    } else if (options.is_present(OPT_EXTCAP_DLTS)) {
        step.kind = Kind::QUERY_DLTS;
    } else if (options.is_present(OPT_EXTCAP_CONFIG)) {
        step.kind = Kind::CONFIG_INTERFACE;
        step.reload = options.is_present(OPT_EXTCAP_RELOAD_OPTION);
    } else if (options.is_present(OPT_CAPTURE)) {
        step.kind = Kind::CAPTURE;
        step.has_control_pipe = options.is_present(OPT_EXTCAP_CONTROL_IN) &&
                                options.is_present(OPT_EXTCAP_CONTROL_OUT);
    }

    return step;
}

std::string ExtcapStep::to_string() const {
    switch (kind) {
        case Kind::NONE:             return "None";
        case Kind::QUERY_INTERFACES: return "QueryInterfaces";
        case Kind::QUERY_DLTS:       return "QueryDlts";
        case Kind::CONFIG_INTERFACE:
            return std::string("ConfigInterface{reload=") + (reload ? "true" : "false") + "}";
        case Kind::CAPTURE:
            return std::string("Capture{has_control_pipe=") +
                   (has_control_pipe ? "true" : "false") + "}";
    }
    return "None";
}

// Extcap implementation

Extcap::Extcap(std::string name) : name_(std::move(name)) {
    add_fixed_flags();
}

void Extcap::add_fixed_flags() {
    flags_.add({OPT_EXTCAP_VERSION, true, "Wireshark version", "ver", {}, {}});
    flags_.add({OPT_EXTCAP_INTERFACES, false, "List the extcap Interfaces", "", {}, {}});
    flags_.add({OPT_EXTCAP_INTERFACE, true, "Specify the extcap interface", "iface",
                {}, {OPT_EXTCAP_INTERFACES}});
    flags_.add({OPT_EXTCAP_DLTS, false, "List the DLTs", "", {}, {}});
    flags_.add({OPT_EXTCAP_CONFIG, false,
                "List the additional configuration for an interface", "", {}, {}});
    flags_.add({OPT_CAPTURE, false, "Run the capture", "", {OPT_FIFO}, {}});
    flags_.add({OPT_EXTCAP_CAPTURE_FILTER, true, "The capture filter", "filter",
                {OPT_CAPTURE}, {}});
    flags_.add({OPT_FIFO, true, "Dump data to file or fifo", "file", {OPT_CAPTURE}, {}});
    flags_.add({OPT_EXTCAP_CONTROL_IN, true, "The pipe for control messages from toolbar",
                "in-pipe", {OPT_CAPTURE}, {}});
    flags_.add({OPT_EXTCAP_CONTROL_OUT, true, "The pipe for control messages to toolbar",
                "out-pipe", {OPT_CAPTURE}, {}});
    flags_.add({OPT_HELP, false, "Print help information", "", {}, {}});
    flags_.add({OPT_VERSION, false, "Print version information", "", {}, {}});

    // The interface requirement of these is enforced when the step is
    // carried out, so it reports MISSING_INTERFACE
    flags_.add_exclusive_group({OPT_EXTCAP_DLTS, OPT_EXTCAP_CONFIG, OPT_CAPTURE});
}

void Extcap::config_arg_flag(const ExtcapArg& arg) {
    if (flags_.contains(arg.name)) {
        return;
    }
    flags_.add({arg.name, arg.takes_value(), arg.display.value_or(""),
                arg_type_name(arg.type), {}, {}});
}

void Extcap::config_reload_flag() {
    flags_.add({OPT_EXTCAP_RELOAD_OPTION, true, "Reload values for the given argument",
                "option", {OPT_EXTCAP_INTERFACE, OPT_EXTCAP_CONFIG}, {}});
}

void Extcap::config_debug_flags() {
    flags_.add({OPT_DEBUG, false, "Print additional messages", "", {}, {}});
    flags_.add({OPT_DEBUG_FILE, true, "Print debug messages to file", "file", {}, {}});
}

void Extcap::add_interface(ExtcapInterface iface) {
    if (find_interface(iface.name)) {
        EXTCAP_WARN("interface '%s' is already registered", iface.name.c_str());
        return;
    }

    if (iface.has_reloadable_arg()) {
        config_reload_flag();
    }
    if (iface.has_debug()) {
        config_debug_flags();
    }
    for (const auto& arg : iface.args()) {
        config_arg_flag(arg);
    }

    interfaces_.push_back(std::move(iface));
}

void Extcap::add_control(ExtcapControl control) {
    control.set_number(controls_.size());
    controls_.push_back(std::move(control));
}

std::optional<size_t> Extcap::find_interface(const std::string& name) const {
    auto it = std::find_if(interfaces_.begin(), interfaces_.end(),
                           [&](const ExtcapInterface& i) { return i.name == name; });
    if (it == interfaces_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - interfaces_.begin());
}

size_t Extcap::selected_interface() const {
    auto name = options_.value_of(OPT_EXTCAP_INTERFACE);
    if (!name) {
        throw ExtcapError::missing_interface();
    }

    auto idx = find_interface(*name);
    if (!idx) {
        throw ExtcapError::invalid_interface(*name);
    }
    return *idx;
}

int Extcap::run(ExtcapListener& listener, int argc, char** argv, std::ostream& out) {
    return run(listener, argc, const_cast<const char* const*>(argv), out);
}

int Extcap::run(ExtcapListener& listener, int argc, const char* const* argv,
                std::ostream& out) {
    if (ran_) {
        throw ExtcapError::invalid_state("Extcap::run() called twice");
    }
    ran_ = true;

    options_ = flags_.parse(argc, argv);

    if (options_.is_present(OPT_HELP)) {
        print_help(out);
        return 0;
    }
    if (options_.is_present(OPT_VERSION)) {
        out << name_ << " " << version_.value_or("unknown") << "\n";
        return 0;
    }

    step_ = ExtcapStep::from_options(options_);

    init_log(listener);
    EXTCAP_DEBUG("step = %s", step_.to_string().c_str());

    host_version_ = options_.value_of(OPT_EXTCAP_VERSION);
    EXTCAP_DEBUG("Wireshark version %s",
                 host_version_ ? host_version_->c_str() : "-not provided-");

    if (listener.update_interfaces) {
        listener.update_interfaces(*this);
    }

    if (step_.kind == ExtcapStep::Kind::QUERY_INTERFACES) {
        EXTCAP_DEBUG("list of interfaces required");
        print_version(out);
        print_interfaces(out);
        return 0;
    }

    size_t ifidx = selected_interface();
    EXTCAP_DEBUG("interface = %s", interfaces_[ifidx].name.c_str());

    switch (step_.kind) {
        case ExtcapStep::Kind::QUERY_DLTS:
            EXTCAP_DEBUG("interface DLTs required");
            interfaces_[ifidx].print_dlt(out);
            return 0;

        case ExtcapStep::Kind::CONFIG_INTERFACE:
            if (auto arg = options_.value_of(OPT_EXTCAP_RELOAD_OPTION)) {
                EXTCAP_DEBUG("interface config reload required for '%s' argument", arg->c_str());
                reload_option(listener, ifidx, *arg, out);
            } else {
                EXTCAP_DEBUG("interface config required");
                interfaces_[ifidx].print_args(out);
            }
            return 0;

        case ExtcapStep::Kind::CAPTURE:
            capture(listener, interfaces_[ifidx]);
            return 0;

        default:
            throw ExtcapError::unknown_step();
    }
}

void Extcap::init_log(ExtcapListener& listener) {
    bool debug = options_.is_present(OPT_DEBUG);
    std::optional<std::string> debug_file = options_.value_of(OPT_DEBUG_FILE);
    if (debug_file && debug_file->find_first_not_of(" \t") == std::string::npos) {
        debug_file.reset();
    }

    if (listener.init_log) {
        listener.init_log(*this, debug, debug_file);
    } else {
        Log::init(debug ? LogLevel::DEBUG : LogLevel::WARN, debug_file);
    }

    EXTCAP_DEBUG("=======================");
    EXTCAP_DEBUG("Log initialized debug=%s debug_file=%s",
                 debug ? "true" : "false", debug_file ? debug_file->c_str() : "");
}

void Extcap::print_version(std::ostream& out) const {
    out << "extcap ";
    write_field(out, "version", version_.value_or("unknown"));
    write_opt_field(out, "help", help_url_);
    out << "\n";
}

void Extcap::print_interfaces(std::ostream& out) const {
    for (const auto& iface : interfaces_) {
        iface.print_interface(out);
    }
    for (const auto& control : controls_) {
        control.print(out);
    }
}

void Extcap::reload_option(ExtcapListener& listener, size_t ifidx,
                           const std::string& arg_name, std::ostream& out) {
    ExtcapInterface& iface = interfaces_[ifidx];

    auto aidx = iface.find_arg(arg_name);
    if (!aidx) {
        EXTCAP_WARN("reload_option() arg '%s' not available for interface '%s'",
                    arg_name.c_str(), iface.name.c_str());
        return;
    }

    std::optional<std::vector<ArgValue>> values;
    if (listener.reload_option) {
        values = listener.reload_option(*this, iface, iface.arg(*aidx));
    }

    if (values) {
        EXTCAP_DEBUG("reload_option() arg '%s' for interface '%s' has got %zu values",
                     arg_name.c_str(), iface.name.c_str(), values->size());
        iface.arg(*aidx).replace_values(std::move(*values));
    } else {
        EXTCAP_DEBUG("reload_option() arg '%s' for interface '%s' nothing has changed",
                     arg_name.c_str(), iface.name.c_str());
    }

    iface.arg(*aidx).print(out);
}

void Extcap::capture(ExtcapListener& listener, const ExtcapInterface& iface) {
    if (!listener.capture) {
        throw ExtcapError::not_implemented("capture");
    }

    std::string fifo = options_.value_or(OPT_FIFO, "-");
    std::string filter = options_.value_or(OPT_EXTCAP_CAPTURE_FILTER, "");
    EXTCAP_DEBUG("capture required fifo=%s capture_filter=%s", fifo.c_str(), filter.c_str());

    std::unique_ptr<ControlPipe> control_pipe;
    if (step_.has_control_pipe) {
        std::string ctrl_in = options_.value_or(OPT_EXTCAP_CONTROL_IN, "");
        std::string ctrl_out = options_.value_or(OPT_EXTCAP_CONTROL_OUT, "");
        EXTCAP_DEBUG("capture with control in=%s out=%s", ctrl_in.c_str(), ctrl_out.c_str());
        try {
            control_pipe = ControlPipe::open(ctrl_in, ctrl_out);
        } catch (const ExtcapError& e) {
            EXTCAP_WARN("continuing without control pipes: %s", e.what());
        }
    }

    PcapHeader header;
    if (listener.capture_header) {
        header = listener.capture_header(*this, iface);
    } else {
        header.link_type = iface.link_type;
    }
    EXTCAP_DEBUG("capture pcap header: link_type=%u snaplen=%u",
                 header.link_type, header.snaplen);

    PcapSink sink;
    if (!sink.open(fifo, header)) {
        throw ExtcapError::io(sink.get_error());
    }

    std::optional<ControlChannels> channels;
    if (control_pipe) {
        channels = control_pipe->start();
    }
    EXTCAP_DEBUG("capture starting %s control pipes", channels ? "with" : "without");

    // On an exception the ControlPipe destructor stops the pumps
    try {
        listener.capture(*this, iface, sink, channels);
    } catch (const ExtcapError& e) {
        EXTCAP_DEBUG("capture failed: %s", e.what());
        throw;
    }

    if (control_pipe) {
        control_pipe->stop();
    }
    EXTCAP_DEBUG("capture finished, %llu packets written",
                 static_cast<unsigned long long>(sink.packets_written()));
}

void Extcap::print_help(std::ostream& out) const {
    out << name_;
    if (version_) {
        out << " " << *version_;
    }
    out << "\n";
    if (!about_.empty()) {
        out << about_ << "\n";
    }

    out << "\nUSAGE:\n    " << (usage_.empty() ? name_ + " [OPTIONS]" : usage_) << "\n";
    out << "\nOPTIONS:\n";
    flags_.print_flags(out);

    if (!after_help_.empty()) {
        out << "\n" << after_help_ << "\n";
    }
}
