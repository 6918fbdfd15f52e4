#include "probe_engine.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

#include "log_system.hpp"

namespace {

// Closes the descriptor when the probe returns.
class SocketHandle {
public:
    explicit SocketHandle(int fd = -1) : fd_(fd) {}
    ~SocketHandle() { if (fd_ >= 0) close(fd_); }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    SocketHandle(SocketHandle&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

SocketHandle openSendSocket(bool ipv6) {
    int fd = socket(ipv6 ? AF_INET6 : AF_INET, SOCK_RAW, IPPROTO_RAW);
    if (fd < 0) {
        logsys.Debug("Failed to create raw send socket: ", strerror(errno));
        return SocketHandle();
    }
    if (!ipv6) {
        int one = 1;
        if (setsockopt(fd, IPPROTO_IP, IP_HDRINCL, &one, sizeof(one)) < 0) {
            logsys.Debug("Failed to set IP_HDRINCL: ", strerror(errno));
            close(fd);
            return SocketHandle();
        }
    }
    return SocketHandle(fd);
}

SocketHandle openListenSocket(bool ipv6, int protocol) {
    int fd = socket(ipv6 ? AF_INET6 : AF_INET, SOCK_RAW, protocol);
    if (fd < 0) {
        logsys.Debug("Failed to create raw listen socket: ", strerror(errno));
        return SocketHandle();
    }
    if (ipv6) {
        int one = 1;
        if (setsockopt(fd, IPPROTO_IPV6, IPV6_RECVHOPLIMIT, &one, sizeof(one)) < 0) {
            logsys.Debug("Failed to set IPV6_RECVHOPLIMIT: ", strerror(errno));
        }
    }
    return SocketHandle(fd);
}

bool sendBytes(const std::vector<uint8_t>& datagram, bool ipv6, const std::string& dst_ip) {
    SocketHandle sock = openSendSocket(ipv6);
    if (!sock.valid()) return false;

    ssize_t sent;
    if (ipv6) {
        struct sockaddr_in6 dest;
        std::memset(&dest, 0, sizeof(dest));
        dest.sin6_family = AF_INET6;
        if (inet_pton(AF_INET6, dst_ip.c_str(), &dest.sin6_addr) != 1) {
            logsys.Debug("Invalid IPv6 address: ", dst_ip);
            return false;
        }
        sent = sendto(sock.get(), datagram.data(), datagram.size(), 0,
                      reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    } else {
        struct sockaddr_in dest;
        std::memset(&dest, 0, sizeof(dest));
        dest.sin_family = AF_INET;
        if (inet_pton(AF_INET, dst_ip.c_str(), &dest.sin_addr) != 1) {
            logsys.Debug("Invalid IP address: ", dst_ip);
            return false;
        }
        sent = sendto(sock.get(), datagram.data(), datagram.size(), 0,
                      reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    }
    if (sent < 0) {
        logsys.Debug("sendto ", dst_ip, " failed: ", strerror(errno));
        return false;
    }
    return true;
}

// Reads one datagram from a raw socket. IPv4 raw sockets deliver the IP
// header, IPv6 ones only the upper-layer segment.
std::optional<Packet> readReply(int fd, bool ipv6, uint8_t protocol) {
    uint8_t buffer[65536];
    if (!ipv6) {
        ssize_t received = recv(fd, buffer, sizeof(buffer), 0);
        if (received <= 0) return std::nullopt;
        return parsePacket(buffer, static_cast<size_t>(received));
    }

    struct sockaddr_in6 from;
    std::memset(&from, 0, sizeof(from));
    struct iovec iov;
    iov.iov_base = buffer;
    iov.iov_len = sizeof(buffer);
    uint8_t control[CMSG_SPACE(sizeof(int))];
    struct msghdr msg;
    std::memset(&msg, 0, sizeof(msg));
    msg.msg_name = &from;
    msg.msg_namelen = sizeof(from);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);

    ssize_t received = recvmsg(fd, &msg, 0);
    if (received <= 0) return std::nullopt;

    Packet packet;
    packet.ipv6 = true;
    char address[INET6_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET6, &from.sin6_addr, address, sizeof(address));
    packet.src_ip = address;
    for (struct cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr; cmsg = CMSG_NXTHDR(&msg, cmsg)) {
        if (cmsg->cmsg_level == IPPROTO_IPV6 && cmsg->cmsg_type == IPV6_HOPLIMIT) {
            int hop_limit = 0;
            std::memcpy(&hop_limit, CMSG_DATA(cmsg), sizeof(hop_limit));
            packet.ttl = static_cast<uint8_t>(hop_limit);
        }
    }
    if (!parseSegment(protocol, buffer, static_cast<size_t>(received), packet)) return std::nullopt;
    return packet;
}

} // namespace

bool matchesFlow(const Packet& probe, const Packet& reply) {
    // ICMP errors may come from any hop on the path; the quoted datagram decides.
    if (reply.isIcmp()) {
        return reply.quoted_dst_ip == probe.dst_ip &&
               reply.quoted_protocol == probe.protocol &&
               reply.quoted_src_port == probe.src_port &&
               reply.quoted_dst_port == probe.dst_port;
    }
    return reply.src_ip == probe.dst_ip &&
           reply.protocol == probe.protocol &&
           reply.src_port == probe.dst_port &&
           reply.dst_port == probe.src_port;
}

bool RawSocketTransport::send(const Packet& packet) {
    return sendBytes(serializePacket(packet), packet.ipv6, packet.dst_ip);
}

bool RawSocketTransport::sendDatagram(const std::vector<uint8_t>& datagram, bool ipv6,
                                      const std::string& dst_ip) {
    return sendBytes(datagram, ipv6, dst_ip);
}

std::optional<Packet> RawSocketTransport::sendAndWait(const Packet& packet, int timeout_ms) {
    const uint8_t icmp_protocol = packet.ipv6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP;
    SocketHandle transport_sock = openListenSocket(packet.ipv6, packet.protocol);
    SocketHandle icmp_sock = openListenSocket(packet.ipv6, icmp_protocol);
    if (!transport_sock.valid()) return std::nullopt;

    // Listeners are open before the probe leaves so a fast reply is not lost.
    if (!send(packet)) return std::nullopt;

    struct pollfd fds[2];
    nfds_t count = 0;
    uint8_t protocols[2];
    fds[count].fd = transport_sock.get();
    fds[count].events = POLLIN;
    protocols[count++] = packet.protocol;
    if (icmp_sock.valid()) {
        fds[count].fd = icmp_sock.get();
        fds[count].events = POLLIN;
        protocols[count++] = icmp_protocol;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;
        int ready = poll(fds, count, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            logsys.Debug("poll failed: ", strerror(errno));
            break;
        }
        if (ready == 0) break;
        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & POLLIN)) continue;
            std::optional<Packet> reply = readReply(fds[i].fd, packet.ipv6, protocols[i]);
            if (reply && matchesFlow(packet, *reply)) {
                return reply;
            }
        }
    }
    return std::nullopt;
}

std::string localAddressFor(const std::string& ip, bool ipv6) {
    SocketHandle sock(socket(ipv6 ? AF_INET6 : AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) return "";

    char address[INET6_ADDRSTRLEN] = {0};
    if (ipv6) {
        struct sockaddr_in6 dest;
        std::memset(&dest, 0, sizeof(dest));
        dest.sin6_family = AF_INET6;
        dest.sin6_port = htons(80);
        if (inet_pton(AF_INET6, ip.c_str(), &dest.sin6_addr) != 1) return "";
        if (connect(sock.get(), reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) < 0) return "";
        struct sockaddr_in6 local;
        socklen_t len = sizeof(local);
        if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&local), &len) < 0) return "";
        inet_ntop(AF_INET6, &local.sin6_addr, address, sizeof(address));
    } else {
        struct sockaddr_in dest;
        std::memset(&dest, 0, sizeof(dest));
        dest.sin_family = AF_INET;
        dest.sin_port = htons(80);
        if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) return "";
        if (connect(sock.get(), reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) < 0) return "";
        struct sockaddr_in local;
        socklen_t len = sizeof(local);
        if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&local), &len) < 0) return "";
        inet_ntop(AF_INET, &local.sin_addr, address, sizeof(address));
    }
    return address;
}

int openTcpConnection(const std::string& ip, bool ipv6, int port, int timeout_ms) {
    struct sockaddr_storage target;
    socklen_t target_len;
    std::memset(&target, 0, sizeof(target));
    if (ipv6) {
        struct sockaddr_in6* addr = reinterpret_cast<struct sockaddr_in6*>(&target);
        addr->sin6_family = AF_INET6;
        addr->sin6_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET6, ip.c_str(), &addr->sin6_addr) != 1) return -1;
        target_len = sizeof(struct sockaddr_in6);
    } else {
        struct sockaddr_in* addr = reinterpret_cast<struct sockaddr_in*>(&target);
        addr->sin_family = AF_INET;
        addr->sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, ip.c_str(), &addr->sin_addr) != 1) return -1;
        target_len = sizeof(struct sockaddr_in);
    }

    int sock = socket(ipv6 ? AF_INET6 : AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return -1;
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    int result = connect(sock, reinterpret_cast<struct sockaddr*>(&target), target_len);
    if (result < 0 && errno != EINPROGRESS) {
        close(sock);
        return -1;
    }
    if (result < 0) {
        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, timeout_ms) <= 0) {
            close(sock);
            return -1;
        }
        int optval = 0;
        socklen_t optlen = sizeof(optval);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0 || optval != 0) {
            close(sock);
            return -1;
        }
    }

    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return sock;
}

bool hasRawSocketPrivileges() {
    if (geteuid() == 0) return true;
    SocketHandle sock(socket(AF_INET, SOCK_RAW, IPPROTO_TCP));
    return sock.valid();
}
