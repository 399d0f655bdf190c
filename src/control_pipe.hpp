/*
 * control_pipe.hpp - Control pipe engine
 *
 * Bridges the two named pipes the host passes with --extcap-control-in /
 * --extcap-control-out to a pair of bounded in-process queues:
 *
 *     control-in pipe  --> inbound pump  --decode--> from_host queue --> capture
 *     capture --> to_host queue --> outbound pump --encode--> control-out pipe
 *
 * Each pump runs on its own thread, so a stalled peer in one direction never
 * holds up the other. A pump that hits a framing or I/O error ends alone;
 * the other pump and the capture routine keep running.
 *
 * Lifecycle: NEW --start()--> STARTED --stop()--> STOPPED. start() and stop()
 * may each be called once; anything else throws ExtcapError INVALID_STATE.
 * stop() signals both pumps, which notice within one poll interval, and
 * joins them. Frames fully received before stop() stay in from_host;
 * a partially received frame is discarded.
 */

#pragma once

#include "bounded_queue.hpp"
#include "control_message.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using ControlQueue = BoundedQueue<ControlMessage>;

// Queue endpoints handed to the capture routine
struct ControlChannels {
    std::shared_ptr<ControlQueue> from_host;   // Messages received from the toolbar
    std::shared_ptr<ControlQueue> to_host;     // Messages to send to the toolbar
};

class ControlPipe {
public:
    static constexpr size_t QUEUE_CAPACITY = 128;
    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

    enum class State { NEW, STARTED, STOPPED };

    // Takes ownership of both descriptors
    ControlPipe(int fd_in, int fd_out);
    ~ControlPipe();

    // Non-copyable
    ControlPipe(const ControlPipe&) = delete;
    ControlPipe& operator=(const ControlPipe&) = delete;

    // Open the host's pipes: in_path for reading, out_path for writing.
    // Throws ExtcapError IO.
    static std::unique_ptr<ControlPipe> open(const std::string& in_path,
                                             const std::string& out_path);

    ControlChannels start();
    void stop();

    State state() const { return state_; }

private:
    void inbound_loop();
    void outbound_loop();

    // Hand a decoded message to the capture side, waiting out backpressure
    bool deliver(const ControlMessage& msg);

    // Write a whole frame, polling between partial writes
    bool write_frame(const std::vector<uint8_t>& frame);

    void close_fds();

    int fd_in_ = -1;
    int fd_out_ = -1;
    State state_ = State::NEW;

    std::atomic<bool> stop_in_{false};
    std::atomic<bool> stop_out_{false};
    std::thread in_thread_;
    std::thread out_thread_;

    std::shared_ptr<ControlQueue> from_host_;
    std::shared_ptr<ControlQueue> to_host_;
};
