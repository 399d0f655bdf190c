/*
 * test_control_dump.cpp - Interface toolbar showcase provider
 *
 * Declares two interfaces and one control of every kind. During capture
 * every message received from the toolbar is written as a packet and
 * echoed to the logger button. Pressing "Stop 3" ends the capture, as
 * does the host closing the control pipe. Without control pipes the
 * capture runs until SIGINT/SIGTERM.
 */

#include "error.hpp"
#include "extcap.hpp"
#include "log.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

static const uint32_t DLT_USER10 = 157;

static const uint8_t CTRL_STOP = 3;
static const uint8_t CTRL_LOGGER = 4;

static const std::chrono::milliseconds WAIT_INTERVAL{50};

static std::atomic<bool> g_running{true};

extern "C" void on_signal(int) {
    g_running.store(false);
}

static void write_msg(PcapSink& sink, const std::string& msg) {
    EXTCAP_DEBUG("write_msg() %s", msg.c_str());
    if (!sink.write_now(msg)) {
        throw ExtcapError::user_error(sink.get_error());
    }
}

// Append a line to the logger control's window
static void write_log(const std::optional<ControlChannels>& channels, const std::string& msg) {
    if (!channels) {
        return;
    }
    ControlMessage line(CTRL_LOGGER, ControlCommand::ADD, msg + "\n");
    if (!channels->to_host->try_push(line)) {
        EXTCAP_WARN("logger queue full, dropping '%s'", msg.c_str());
    }
}

static void capture(PcapSink& sink, const std::optional<ControlChannels>& channels) {
    EXTCAP_DEBUG("capture()");

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    write_log(channels, "Begin");
    write_msg(sink, "Begin");

    while (g_running.load()) {
        if (!channels) {
            std::this_thread::sleep_for(WAIT_INTERVAL);
            continue;
        }

        auto msg = channels->from_host->pop_for(WAIT_INTERVAL);
        if (!msg) {
            if (channels->from_host->is_finished()) {
                EXTCAP_DEBUG("control stream ended");
                break;
            }
            continue;
        }

        EXTCAP_DEBUG("capture() ctrl msg received %s", msg->describe().c_str());
        write_msg(sink, msg->describe());
        write_log(channels, msg->describe());

        if (msg->control_number() == CTRL_STOP && msg->is(ControlCommand::SET)) {
            EXTCAP_DEBUG("Stop pressed");
            break;
        }
    }

    write_log(channels, "End");
    write_msg(sink, "End");
    EXTCAP_DEBUG("capture() finished");
}

static ExtcapInterface make_interface(const std::string& name, const std::string& description) {
    ExtcapInterface iface(name);
    iface.description = description;
    iface.link_type = DLT_USER10;
    iface.config_debug();
    return iface;
}

static void add_controls(Extcap& extcap) {
    ExtcapControl boolean(ControlType::BOOLEAN);
    boolean.display = "Boolean 0";
    boolean.tooltip = "Checkbox 0";
    extcap.add_control(boolean);

    ExtcapControl text(ControlType::STRING);
    text.display = "String 1";
    text.tooltip = "Text 1";
    text.placeholder = "Enter something ...";
    extcap.add_control(text);

    ExtcapControl select(ControlType::SELECTOR);
    select.display = "Select 2";
    select.add_value(ControlValue("V1"));
    select.add_value(ControlValue("V2", std::string("Val2")));
    select.add_value(ControlValue("V3"));
    extcap.add_control(select);

    ExtcapControl stop = ExtcapControl::button(ButtonRole::CONTROL);
    stop.display = "Stop 3";
    stop.tooltip = "Stop capture";
    extcap.add_control(stop);

    ExtcapControl logger = ExtcapControl::button(ButtonRole::LOGGER);
    logger.display = "Log 4";
    extcap.add_control(logger);

    ExtcapControl help = ExtcapControl::button(ButtonRole::HELP);
    help.display = "Help 5";
    extcap.add_control(help);

    ExtcapControl restore = ExtcapControl::button(ButtonRole::RESTORE);
    restore.display = "Restore 6";
    extcap.add_control(restore);
}

int main(int argc, char** argv) {
    Extcap extcap("test_control_dump");
    extcap.set_version("0.0.1");
    extcap.set_about("Test extcap controls (extcap example)");
    extcap.set_help_url("http://abcd");

    extcap.add_interface(make_interface("tcdump1", "Test extcap controls No.1"));
    extcap.add_interface(make_interface("tcdump2", "Test extcap controls No.2"));
    add_controls(extcap);

    ExtcapListener listener;
    listener.capture = [](const Extcap&, const ExtcapInterface&, PcapSink& sink,
                          std::optional<ControlChannels> channels) {
        capture(sink, channels);
    };

    try {
        return extcap.run(listener, argc, argv);
    } catch (const ExtcapError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
