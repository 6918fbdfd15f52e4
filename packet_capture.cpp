#include "packet_capture.hpp"

#include <arpa/inet.h>
#include <poll.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <stdexcept>

#include "log_system.hpp"

#ifndef DLT_LINUX_SLL2
#define DLT_LINUX_SLL2 276
#endif

PcapCapture::PcapCapture(const std::string& interface, const std::string& filter)
    : handle(nullptr), datalink(DLT_EN10MB) {
    std::memset(errbuf, 0, PCAP_ERRBUF_SIZE);
    const std::string dev = interface.empty() ? "any" : interface;

    handle = pcap_open_live(dev.c_str(), 65535, 0, 100, errbuf);
    if (!handle) {
        throw std::runtime_error("Error opening device: " + dev + ": " + errbuf);
    }

    if (pcap_setnonblock(handle, 1, errbuf) == -1) {
        std::string message = std::string("Error setting non-blocking mode: ") + errbuf;
        pcap_close(handle);
        throw std::runtime_error(message);
    }

    if (!filter.empty()) {
        struct bpf_program fp;
        if (pcap_compile(handle, &fp, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1) {
            std::string message = std::string("Error compiling filter: ") + pcap_geterr(handle);
            pcap_close(handle);
            throw std::runtime_error(message);
        }
        if (pcap_setfilter(handle, &fp) == -1) {
            std::string message = std::string("Error setting filter: ") + pcap_geterr(handle);
            pcap_freecode(&fp);
            pcap_close(handle);
            throw std::runtime_error(message);
        }
        pcap_freecode(&fp);
    }

    datalink = pcap_datalink(handle);
}

PcapCapture::~PcapCapture() {
    if (handle) pcap_close(handle);
}

int PcapCapture::linkHeaderLength(const u_char* frame, size_t length) const {
    switch (datalink) {
        case DLT_EN10MB: {
            if (length < 14) return -1;
            uint16_t type = static_cast<uint16_t>((frame[12] << 8) | frame[13]);
            // 802.1Q tagged frame.
            if (type == 0x8100) return length < 18 ? -1 : 18;
            return 14;
        }
        case DLT_LINUX_SLL:
            return 16;
        case DLT_LINUX_SLL2:
            return 20;
        case DLT_RAW:
            return 0;
        case DLT_NULL:
            return 4;
        default:
            return -1;
    }
}

std::optional<Packet> PcapCapture::next(int timeout_ms) {
    if (!handle) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int fd = pcap_get_selectable_fd(handle);

    while (true) {
        struct pcap_pkthdr* header = nullptr;
        const u_char* frame = nullptr;
        int status = pcap_next_ex(handle, &header, &frame);
        if (status == 1) {
            int offset = linkHeaderLength(frame, header->caplen);
            if (offset < 0 || static_cast<size_t>(offset) >= header->caplen) continue;
            std::optional<Packet> packet = parsePacket(frame + offset, header->caplen - offset);
            if (packet) return packet;
            continue;
        }
        if (status < 0) {
            logsys.Warning("Capture error: ", pcap_geterr(handle));
            return std::nullopt;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return std::nullopt;
        int wait = static_cast<int>(std::min<long long>(remaining, 50));
        if (fd >= 0) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            poll(&pfd, 1, wait);
        } else {
            struct timespec pause = {0, wait * 1000000L};
            nanosleep(&pause, nullptr);
        }
    }
}

std::unique_ptr<CaptureSource> PcapCaptureFactory::open(const std::string& filter) {
    try {
        return std::make_unique<PcapCapture>(interface_, filter);
    } catch (const std::runtime_error& e) {
        logsys.Warning("Passive capture unavailable: ", e.what());
        return nullptr;
    }
}
