/*
 * test_arg_dump.cpp - Interface argument showcase provider
 *
 * The "tadump" interface declares a validated string, a selector and a
 * reloadable selector whose values depend on the first selector. The
 * capture writes a single packet listing the argument values it received.
 */

#include "error.hpp"
#include "extcap.hpp"
#include "log.hpp"
#include <iostream>
#include <string>
#include <vector>

static const char* const OPT_SERVER = "server";
static const char* const OPT_SERVER_VALID =
    "\\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\\.){3}"
    "(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\\b";
static const char* const OPT_DLT_MAX = "dlt-max";
static const char* const OPT_DLT = "dlt";

static const uint32_t DLT_USER0 = 147;
static const uint32_t DLT_USER15 = 162;

// DLT flag value limited to DLT_USER0..DLT_USER15
static uint32_t option_dlt(const Extcap& extcap, const char* name, uint32_t fallback) {
    return static_cast<uint32_t>(
        extcap.options().long_in_range(name, fallback, DLT_USER0, DLT_USER15));
}

static std::vector<ArgValue> dlt_values(uint32_t last) {
    std::vector<ArgValue> values;
    for (uint32_t n = DLT_USER0; n <= last; n++) {
        values.emplace_back(std::to_string(n), "DLT_USER" + std::to_string(n - DLT_USER0));
    }
    return values;
}

static ExtcapInterface make_interface() {
    ExtcapInterface tadump("tadump");
    tadump.description = "Test extcap arguments";
    tadump.link_type = DLT_USER0;
    tadump.link_type_description = "DLT_USER0 or non-default value";

    ExtcapArg server(ArgType::STRING, OPT_SERVER);
    server.display = "Server IP";
    server.validation = OPT_SERVER_VALID;
    tadump.add_arg(server);

    ExtcapArg dlt_max(ArgType::SELECTOR, OPT_DLT_MAX);
    dlt_max.display = "Max. DLT number";
    dlt_max.default_value = std::to_string(DLT_USER15);
    dlt_max.tooltip = "DLT_USER0-DLT_USER15";
    for (auto& value : dlt_values(DLT_USER15)) {
        dlt_max.add_value(value);
    }
    tadump.add_arg(dlt_max);

    ExtcapArg dlt(ArgType::SELECTOR, OPT_DLT);
    dlt.display = "DLT number";
    dlt.default_value = std::to_string(DLT_USER0);
    dlt.reload = true;
    dlt.placeholder = "Load DLTs...";
    dlt.tooltip = "DLT_USER0-DLT_USERmax";
    tadump.add_arg(dlt);

    tadump.config_debug();
    return tadump;
}

int main(int argc, char** argv) {
    Extcap extcap("test_arg_dump");
    extcap.set_version("0.0.1");
    extcap.set_about("Test extcap arguments (extcap example)");
    extcap.add_interface(make_interface());

    ExtcapListener listener;
    listener.reload_option = [](const Extcap& ex, const ExtcapInterface&, const ExtcapArg&) {
        uint32_t dlt_max = option_dlt(ex, OPT_DLT_MAX, DLT_USER15);
        EXTCAP_DEBUG("reload_option() dlt_max=%u", dlt_max);
        return std::optional<std::vector<ArgValue>>(dlt_values(dlt_max));
    };
    listener.capture_header = [](const Extcap& ex, const ExtcapInterface& iface) {
        PcapHeader header;
        header.link_type = option_dlt(ex, OPT_DLT, iface.link_type);
        EXTCAP_DEBUG("capture_header() dlt=%u", header.link_type);
        return header;
    };
    listener.capture = [](const Extcap& ex, const ExtcapInterface&, PcapSink& sink,
                          std::optional<ControlChannels>) {
        std::string msg = "Test arguments:\n";
        for (const char* name : {OPT_SERVER, OPT_DLT_MAX, OPT_DLT}) {
            if (auto value = ex.options().value_of(name)) {
                msg += std::string(name) + "=" + *value + "\n";
            }
        }
        EXTCAP_DEBUG("capture() %s", msg.c_str());

        if (!sink.write_now(msg)) {
            throw ExtcapError::user_error(sink.get_error());
        }
        EXTCAP_DEBUG("capture() finished");
    };

    try {
        return extcap.run(listener, argc, argv);
    } catch (const ExtcapError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
