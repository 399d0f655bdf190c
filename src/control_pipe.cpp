/*
 * control_pipe.cpp - Control pipe engine implementation
 *
 * Both pumps poll their descriptor with POLL_INTERVAL as timeout and check
 * their stop token between polls, the same way a capture loop checks its
 * running flag between dispatch calls.
 */

#include "control_pipe.hpp"
#include "error.hpp"
#include "log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>

ControlPipe::ControlPipe(int fd_in, int fd_out) : fd_in_(fd_in), fd_out_(fd_out) {}

ControlPipe::~ControlPipe() {
    if (state_ == State::STARTED) {
        stop();
    }
    close_fds();
}

std::unique_ptr<ControlPipe> ControlPipe::open(const std::string& in_path,
                                               const std::string& out_path) {
    int fd_in = ::open(in_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_in < 0) {
        throw ExtcapError::io("cannot open control-in pipe '" + in_path + "': " +
                              std::strerror(errno));
    }

    int fd_out = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_out < 0) {
        int err = errno;
        ::close(fd_in);
        throw ExtcapError::io("cannot open control-out pipe '" + out_path + "': " +
                              std::strerror(err));
    }

    return std::make_unique<ControlPipe>(fd_in, fd_out);
}

ControlChannels ControlPipe::start() {
    if (state_ != State::NEW) {
        EXTCAP_ERROR("start() called in wrong state");
        throw ExtcapError::invalid_state("control pipe start() called in wrong state");
    }

    // Partial writes are resumed after poll, so the write side must not block
    int flags = fcntl(fd_out_, F_GETFL);
    if (flags < 0 || fcntl(fd_out_, F_SETFL, flags | O_NONBLOCK) < 0) {
        EXTCAP_WARN("cannot make control-out non-blocking: %s", std::strerror(errno));
    }

    from_host_ = std::make_shared<ControlQueue>(QUEUE_CAPACITY);
    to_host_ = std::make_shared<ControlQueue>(QUEUE_CAPACITY);

    state_ = State::STARTED;
    in_thread_ = std::thread([this]() { inbound_loop(); });
    out_thread_ = std::thread([this]() { outbound_loop(); });

    EXTCAP_DEBUG("control pipe started");
    return ControlChannels{from_host_, to_host_};
}

void ControlPipe::stop() {
    if (state_ != State::STARTED) {
        EXTCAP_ERROR("stop() called in wrong state");
        throw ExtcapError::invalid_state("control pipe stop() called in wrong state");
    }

    stop_in_.store(true);
    stop_out_.store(true);
    from_host_->close();
    to_host_->close();

    if (in_thread_.joinable()) {
        in_thread_.join();
    }
    if (out_thread_.joinable()) {
        out_thread_.join();
    }

    state_ = State::STOPPED;
    EXTCAP_DEBUG("control pipe stopped");
}

void ControlPipe::close_fds() {
    if (fd_in_ >= 0) {
        ::close(fd_in_);
        fd_in_ = -1;
    }
    if (fd_out_ >= 0) {
        ::close(fd_out_);
        fd_out_ = -1;
    }
}

void ControlPipe::inbound_loop() {
    EXTCAP_DEBUG("inbound pump started");

    std::vector<uint8_t> buffer;
    uint8_t chunk[4096];
    bool running = true;

    while (running && !stop_in_.load()) {
        struct pollfd pfd{};
        pfd.fd = fd_in_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, static_cast<int>(POLL_INTERVAL.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            EXTCAP_ERROR("poll on control-in failed: %s", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::read(fd_in_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            EXTCAP_ERROR("read from control-in failed: %s", std::strerror(errno));
            break;
        }
        if (n == 0) {
            EXTCAP_DEBUG("control-in closed by the host");
            break;
        }

        buffer.insert(buffer.end(), chunk, chunk + n);

        try {
            while (auto msg = ControlMessageCodec::decode(buffer)) {
                EXTCAP_DEBUG("received %s", msg->describe().c_str());
                if (!deliver(*msg)) {
                    running = false;
                    break;
                }
            }
        } catch (const ExtcapError& e) {
            EXTCAP_ERROR("control-in: %s", e.what());
            running = false;
        }
    }

    // Lets the capture routine see end of stream once it has drained the queue
    from_host_->close();
    EXTCAP_DEBUG("inbound pump stopped");
}

bool ControlPipe::deliver(const ControlMessage& msg) {
    if (from_host_->try_push(msg)) {
        return true;
    }

    while (!stop_in_.load()) {
        if (from_host_->push_for(msg, POLL_INTERVAL)) {
            return true;
        }
        if (from_host_->is_closed()) {
            break;
        }
    }

    EXTCAP_WARN("dropping %s: control pipe is stopping", msg.describe().c_str());
    return false;
}

void ControlPipe::outbound_loop() {
    // A reader that went away must show up as EPIPE on this thread
    // rather than SIGPIPE for the whole process
    sigset_t sigpipe;
    sigemptyset(&sigpipe);
    sigaddset(&sigpipe, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &sigpipe, nullptr);

    EXTCAP_DEBUG("outbound pump started");

    while (!stop_out_.load()) {
        auto msg = to_host_->pop_for(POLL_INTERVAL);
        if (!msg) {
            if (to_host_->is_finished()) {
                break;
            }
            continue;
        }

        EXTCAP_DEBUG("sending %s", msg->describe().c_str());

        std::vector<uint8_t> frame;
        try {
            ControlMessageCodec::encode(*msg, frame);
        } catch (const ExtcapError& e) {
            EXTCAP_ERROR("not sent: %s", e.what());
            continue;
        }

        if (!write_frame(frame)) {
            break;
        }
    }

    // Producers get false from push() instead of filling a queue nobody drains
    to_host_->close();
    EXTCAP_DEBUG("outbound pump stopped");
}

bool ControlPipe::write_frame(const std::vector<uint8_t>& frame) {
    size_t written = 0;

    while (written < frame.size()) {
        if (stop_out_.load()) {
            return false;
        }

        struct pollfd pfd{};
        pfd.fd = fd_out_;
        pfd.events = POLLOUT;

        int rc = ::poll(&pfd, 1, static_cast<int>(POLL_INTERVAL.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            EXTCAP_ERROR("poll on control-out failed: %s", std::strerror(errno));
            return false;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::write(fd_out_, frame.data() + written, frame.size() - written);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            EXTCAP_ERROR("write to control-out failed: %s", std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }

    return true;
}
