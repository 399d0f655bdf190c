/*
 * pcap_sink.cpp - pcap output stream implementation
 *
 * pcap_dump_open() writes the global header immediately and treats "-" as
 * stdout. Every record is flushed right away because the host reads the
 * fifo live.
 */

#include "pcap_sink.hpp"
#include <algorithm>
#include <chrono>

PcapSink::~PcapSink() {
    close();
}

bool PcapSink::open(const std::string& path, const PcapHeader& header) {
    if (handle_) {
        close();
    }

    handle_ = pcap_open_dead(static_cast<int>(header.link_type), static_cast<int>(header.snaplen));
    if (handle_ == nullptr) {
        error_ = "pcap_open_dead failed for link type " + std::to_string(header.link_type);
        return false;
    }

    dumper_ = pcap_dump_open(handle_, path.c_str());
    if (dumper_ == nullptr) {
        error_ = "cannot open '" + path + "': " + pcap_geterr(handle_);
        pcap_close(handle_);
        handle_ = nullptr;
        return false;
    }

    if (pcap_dump_flush(dumper_) == -1) {
        error_ = "cannot write pcap header to '" + path + "'";
        close();
        return false;
    }

    header_ = header;
    packets_written_ = 0;
    error_.clear();
    return true;
}

void PcapSink::close() {
    if (dumper_) {
        pcap_dump_close(dumper_);
        dumper_ = nullptr;
    }
    if (handle_) {
        pcap_close(handle_);
        handle_ = nullptr;
    }
}

bool PcapSink::write(uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data, size_t len,
                     uint32_t original_length) {
    if (!dumper_) {
        error_ = "pcap sink is not open";
        return false;
    }

    // Records never exceed the snapshot length announced in the header
    size_t caplen = std::min<size_t>(len, header_.snaplen);

    struct pcap_pkthdr hdr{};
    hdr.ts.tv_sec = static_cast<time_t>(ts_sec);
    hdr.ts.tv_usec = static_cast<suseconds_t>(ts_usec);
    hdr.caplen = static_cast<bpf_u_int32>(caplen);
    hdr.len = original_length != 0 ? original_length : static_cast<bpf_u_int32>(len);

    pcap_dump(reinterpret_cast<u_char*>(dumper_), &hdr, data);

    if (pcap_dump_flush(dumper_) == -1) {
        error_ = "pcap write failed";
        return false;
    }

    ++packets_written_;
    return true;
}

bool PcapSink::write(uint32_t ts_sec, uint32_t ts_usec, const std::vector<uint8_t>& data) {
    return write(ts_sec, ts_usec, data.data(), data.size());
}

bool PcapSink::write_now(const uint8_t* data, size_t len) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
    return write(static_cast<uint32_t>(usecs / 1000000),
                 static_cast<uint32_t>(usecs % 1000000), data, len);
}

bool PcapSink::write_now(const std::string& text) {
    return write_now(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}
