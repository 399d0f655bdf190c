/*
 * pcap_sink.hpp - pcap output stream for the capture step
 *
 * Writes the classic pcap format (global header, then one record per packet
 * with seconds, microseconds, captured and original length) to the path
 * the host passed with --fifo, or to stdout for "-". libpcap does the
 * encoding through a "dead" handle that exists only to carry the link type
 * and snapshot length.
 *
 * Usage: open() with the header the listener chose, write() packets, and
 * let the destructor (or close()) flush and release the stream.
 */

#pragma once

#include <cstdint>
#include <pcap.h>
#include <string>
#include <vector>

constexpr uint32_t DEFAULT_SNAPLEN = 65535;

struct PcapHeader {
    uint32_t link_type = 147;              // DLT_USER0
    uint32_t snaplen = DEFAULT_SNAPLEN;
};

class PcapSink {
public:
    PcapSink() = default;
    ~PcapSink();

    // Non-copyable
    PcapSink(const PcapSink&) = delete;
    PcapSink& operator=(const PcapSink&) = delete;

    // Open path ("-" = stdout) and write the global header
    bool open(const std::string& path, const PcapHeader& header);
    void close();

    // Append one packet record and flush it to the reader.
    // original_length of 0 means "same as data size".
    bool write(uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data, size_t len,
               uint32_t original_length = 0);
    bool write(uint32_t ts_sec, uint32_t ts_usec, const std::vector<uint8_t>& data);

    // Same, timestamped with the current wall clock
    bool write_now(const uint8_t* data, size_t len);
    bool write_now(const std::string& text);

    bool is_open() const { return dumper_ != nullptr; }
    const PcapHeader& header() const { return header_; }
    uint64_t packets_written() const { return packets_written_; }
    std::string get_error() const { return error_; }

private:
    pcap_t* handle_ = nullptr;
    pcap_dumper_t* dumper_ = nullptr;
    PcapHeader header_;
    uint64_t packets_written_ = 0;
    std::string error_;
};
