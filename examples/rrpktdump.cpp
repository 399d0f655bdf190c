/*
 * rrpktdump.cpp - Random packet generator provider
 *
 * Offers one interface, "rrpkt", whose capture writes packets of random
 * length and content until the requested count is reached or the process
 * receives SIGINT/SIGTERM.
 *
 *     rrpktdump --extcap-interfaces
 *     rrpktdump --extcap-interface=rrpkt --extcap-dlts
 *     rrpktdump --extcap-interface=rrpkt --extcap-config
 *     rrpktdump --extcap-interface=rrpkt --dlt=150 --count=10 --fifo=FILE --capture
 */

#include "error.hpp"
#include "extcap.hpp"
#include "log.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

static const char* const OPT_MAXBYTES = "maxbytes";
static const long OPT_MAXBYTES_DEFAULT = 5000;
static const long OPT_MAXBYTES_MAX = 5000;
static const char* const OPT_COUNT = "count";
static const long OPT_COUNT_DEFAULT = 1000;
static const char* const OPT_DELAY = "delay";
static const long OPT_DELAY_DEFAULT = 0;
static const char* const OPT_DLT = "dlt";

static const uint32_t DLT_USER0 = 147;
static const uint32_t DLT_USER15 = 162;

static std::atomic<bool> g_running{true};

extern "C" void on_signal(int) {
    g_running.store(false);
}

static const long NO_LIMIT = std::numeric_limits<long>::max();

static ExtcapInterface make_interface() {
    ExtcapInterface rrpkt("rrpkt");
    rrpkt.description = "Random packet generator";
    rrpkt.link_type = DLT_USER0;
    rrpkt.link_type_description = "DLT_USER0 or non-default value";

    ExtcapArg maxbytes(ArgType::UNSIGNED, OPT_MAXBYTES);
    maxbytes.display = "Max bytes in a packet";
    maxbytes.default_value = std::to_string(OPT_MAXBYTES_DEFAULT);
    maxbytes.range = "1,5000";
    maxbytes.tooltip = "The max number of bytes in a packet";
    rrpkt.add_arg(maxbytes);

    ExtcapArg count(ArgType::LONG, OPT_COUNT);
    count.display = "Number of packets";
    count.default_value = std::to_string(OPT_COUNT_DEFAULT);
    count.tooltip = "Number of packets to generate (-1 for infinite)";
    rrpkt.add_arg(count);

    ExtcapArg delay(ArgType::INTEGER, OPT_DELAY);
    delay.display = "Packet delay (ms)";
    delay.default_value = std::to_string(OPT_DELAY_DEFAULT);
    delay.tooltip = "Milliseconds to wait after writing each packet";
    rrpkt.add_arg(delay);

    ExtcapArg dlt(ArgType::SELECTOR, OPT_DLT);
    dlt.display = "DLT number";
    dlt.default_value = std::to_string(DLT_USER0);
    dlt.tooltip = "DLT_USER0-DLT_USER15";
    for (uint32_t n = DLT_USER0; n <= DLT_USER15; n++) {
        dlt.add_value(ArgValue(std::to_string(n), "DLT_USER" + std::to_string(n - DLT_USER0)));
    }
    rrpkt.add_arg(dlt);

    rrpkt.config_debug();
    return rrpkt;
}

static void capture(const Extcap& extcap, PcapSink& sink) {
    const Options& options = extcap.options();
    long maxbytes = options.long_in_range(OPT_MAXBYTES, OPT_MAXBYTES_DEFAULT, 1, OPT_MAXBYTES_MAX);
    long count = options.long_in_range(OPT_COUNT, OPT_COUNT_DEFAULT, -1, NO_LIMIT);
    long delay = options.long_in_range(OPT_DELAY, OPT_DELAY_DEFAULT, 0, NO_LIMIT);
    EXTCAP_DEBUG("capture() maxbytes=%ld count=%ld delay=%ld", maxbytes, count, delay);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<long> length(1, maxbytes);
    std::uniform_int_distribution<int> byte(0, 255);

    long written = 0;
    while (g_running.load()) {
        if (count >= 0 && written == count) {
            EXTCAP_DEBUG("count %ld reached", written);
            break;
        }

        std::vector<uint8_t> data(static_cast<size_t>(length(rng)));
        for (auto& b : data) {
            b = static_cast<uint8_t>(byte(rng));
        }

        if (!sink.write_now(data.data(), data.size())) {
            throw ExtcapError::user_error(sink.get_error());
        }
        written++;

        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }

    if (!g_running.load()) {
        EXTCAP_DEBUG("SIGINT or SIGTERM received");
    }
    EXTCAP_DEBUG("capture() finished");
}

int main(int argc, char** argv) {
    Extcap extcap("rrpktdump");
    extcap.set_version("0.0.1");
    extcap.set_about("Random packets generator (extcap example)");
    extcap.set_help_url("http://abcd");
    extcap.set_usage("rrpktdump --extcap-interfaces\n"
                     "    rrpktdump --extcap-interface=rrpkt --extcap-dlts\n"
                     "    rrpktdump --extcap-interface=rrpkt --extcap-config\n"
                     "    rrpktdump --extcap-interface=rrpkt --dlt=150 --count=10 "
                     "--fifo=FILENAME --capture");
    extcap.set_after_help("Notes:\n  just example");
    extcap.add_interface(make_interface());

    ExtcapListener listener;
    listener.capture_header = [](const Extcap& ex, const ExtcapInterface& iface) {
        PcapHeader header;
        header.link_type = static_cast<uint32_t>(
            ex.options().long_in_range(OPT_DLT, iface.link_type, DLT_USER0, DLT_USER15));
        EXTCAP_DEBUG("capture_header() dlt=%u", header.link_type);
        return header;
    };
    listener.capture = [](const Extcap& ex, const ExtcapInterface&, PcapSink& sink,
                          std::optional<ControlChannels>) {
        capture(ex, sink);
    };

    try {
        int rc = extcap.run(listener, argc, argv);
        EXTCAP_DEBUG("DONE");
        return rc;
    } catch (const ExtcapError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
