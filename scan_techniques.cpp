#include "scan_techniques.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>

#include <algorithm>
#include <cctype>
#include <map>

#include "log_system.hpp"
#include "os_fingerprint.hpp"

namespace {

const std::map<std::string, std::vector<uint8_t>>& mimicBanners() {
    static const auto bytes = [](const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    };
    static const std::map<std::string, std::vector<uint8_t>> banners = {
        {"HTTP", bytes("HTTP/1.1 200 OK\r\nServer: Apache\r\nContent-Length: 0\r\n\r\n")},
        {"SSH", bytes("SSH-2.0-OpenSSH_8.2p1\r\n")},
        {"FTP", bytes("220 FTP Server Ready\r\n")},
        {"SMTP", bytes("220 mail.example.com ESMTP Postfix\r\n")},
        {"IMAP", bytes("* OK IMAP4rev1 Server Ready\r\n")},
        {"POP3", bytes("+OK POP3 server ready\r\n")},
        {"MYSQL", {0x4a, 0x00, 0x00, 0x00, 0x0a, 0x35, 0x2e, 0x37, 0x2e, 0x33, 0x39, 0x00}},
        {"RDP", {0x03, 0x00, 0x00, 0x13, 0x0e, 0xd0, 0x00, 0x00, 0x12, 0x34,
                 0x00, 0x02, 0x01, 0x08, 0x00, 0x01, 0x00, 0x00, 0x00}},
    };
    return banners;
}

// A SYN probe that got a decisive answer.
struct SynExchange {
    Packet probe;
    Packet reply;
};

bool isPortUnreachable(const Packet& reply) {
    if (reply.protocol == IPPROTO_ICMP) return reply.icmp_type == 3 && reply.icmp_code == 3;
    if (reply.protocol == IPPROTO_ICMPV6) return reply.icmp_type == 1 && reply.icmp_code == 4;
    return false;
}

} // namespace

std::string classifySyn(const std::optional<Packet>& reply) {
    if (!reply || !reply->isTcp()) return STATE_FILTERED;
    if (reply->hasFlags(TH_SYN | TH_ACK)) return STATE_OPEN;
    if (reply->tcp_flags & TH_RST) return STATE_CLOSED;
    return STATE_FILTERED;
}

std::string classifyAck(const std::optional<Packet>& reply) {
    if (reply && reply->isTcp() && (reply->tcp_flags & TH_RST)) return STATE_UNFILTERED;
    return STATE_FILTERED;
}

std::string classifyStealth(const std::optional<Packet>& reply) {
    if (reply && reply->isTcp() && (reply->tcp_flags & TH_RST)) return STATE_CLOSED;
    return STATE_OPEN_FILTERED;
}

std::string classifyWindow(const std::optional<Packet>& reply) {
    if (!reply || !reply->isTcp()) return STATE_FILTERED;
    return reply->window != 0 ? STATE_OPEN : STATE_CLOSED;
}

std::string classifyUdp(const std::optional<Packet>& reply) {
    if (!reply) return STATE_OPEN_FILTERED;
    if (reply->isUdp()) return STATE_OPEN;
    if (reply->isIcmp()) return isPortUnreachable(*reply) ? STATE_CLOSED : STATE_FILTERED;
    return STATE_FILTERED;
}

uint8_t probeFlags(ScanTechnique technique) {
    switch (technique) {
        case ScanTechnique::SYN:
        case ScanTechnique::TLS_ECHO:
        case ScanTechnique::MIMIC:
        case ScanTechnique::FRAG:
            return TH_SYN;
        case ScanTechnique::ACK:
        case ScanTechnique::WINDOW:
            return TH_ACK;
        case ScanTechnique::FIN:
            return TH_FIN;
        case ScanTechnique::XMAS:
            return TH_FIN | TH_PUSH | TH_URG;
        case ScanTechnique::NULL_SCAN:
        case ScanTechnique::UDP:
        case ScanTechnique::SSL:
            return 0;
    }
    return 0;
}

std::vector<uint8_t> mimicPayload(const std::string& protocol) {
    std::string key = protocol;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto it = mimicBanners().find(key);
    if (it == mimicBanners().end()) {
        logsys.Warning("Unknown protocol '", protocol, "', using empty payload.");
        return {};
    }
    const std::vector<uint8_t>& banner = it->second;
    size_t length = std::min(banner.size(), MIMIC_PAYLOAD_LIMIT);
    return std::vector<uint8_t>(banner.begin(), banner.begin() + length);
}

std::vector<uint8_t> tlsEchoPayload() {
    // Handshake record, TLS 1.2, ServerHello of length 0x2b.
    std::vector<uint8_t> payload = {0x16, 0x03, 0x03, 0x00, 0x2f, 0x02, 0x00, 0x00, 0x2b, 0x03, 0x03};
    std::uniform_int_distribution<int> byte(0, 255);
    for (int i = 0; i < 32; ++i) {
        payload.push_back(static_cast<uint8_t>(byte(packetRng())));
    }
    payload.push_back(0x00);
    return payload;
}

FragmentSettings fragmentSettings(const ScanConfig& config) {
    FragmentSettings settings;
    settings.min_size = config.frag_min_size;
    settings.max_size = config.frag_max_size;
    settings.first_min_size = config.frag_first_min_size;
    settings.min_delay_ms = config.frag_min_delay_ms;
    settings.max_delay_ms = config.frag_max_delay_ms;
    settings.timeout_ms = config.frag_timeout_ms;
    settings.two_frags = config.frag_two_frags;
    settings.max_tries = config.max_tries;
    return settings;
}

TechniqueRunner::TechniqueRunner(const ScanConfig& config, const TargetDescriptor& target,
                                 ProbeTransport& transport, TlsProber& tls, FragmentScanner& fragments)
    : config_(config), target_(target), builder_(target, config.evasions),
      transport_(transport), tls_(tls), fragments_(fragments) {
    if (std::find(config.techniques.begin(), config.techniques.end(), ScanTechnique::MIMIC) !=
        config.techniques.end()) {
        mimic_payload_ = mimicPayload(config.mimic_protocol);
    }
}

RetryPolicy TechniqueRunner::policyFor(ScanTechnique technique) const {
    RetryPolicy policy;
    policy.backoff_ms = config_.retry_backoff_ms;
    switch (technique) {
        case ScanTechnique::SYN:
        case ScanTechnique::TLS_ECHO:
        case ScanTechnique::MIMIC:
        case ScanTechnique::FRAG:
            policy.max_tries = config_.max_tries;
            break;
        case ScanTechnique::ACK:
        case ScanTechnique::FIN:
        case ScanTechnique::XMAS:
        case ScanTechnique::NULL_SCAN:
        case ScanTechnique::WINDOW:
        case ScanTechnique::UDP:
        case ScanTechnique::SSL:
            policy.max_tries = 1;
            break;
    }
    return policy;
}

TechniqueOutcome TechniqueRunner::run(ScanTechnique technique, uint16_t port) {
    TechniqueOutcome outcome;
    switch (technique) {
        case ScanTechnique::SYN:
            return synFamily(technique, port, {});
        case ScanTechnique::TLS_ECHO:
            return synFamily(technique, port, tlsEchoPayload());
        case ScanTechnique::MIMIC:
            return synFamily(technique, port, mimic_payload_);
        case ScanTechnique::ACK:
        case ScanTechnique::FIN:
        case ScanTechnique::XMAS:
        case ScanTechnique::NULL_SCAN:
        case ScanTechnique::WINDOW:
            outcome.state = singleProbe(technique, port);
            return outcome;
        case ScanTechnique::UDP:
            outcome.state = udpProbe(port);
            return outcome;
        case ScanTechnique::SSL:
            return sslProbe(port);
        case ScanTechnique::FRAG:
            outcome.state = fragments_.scan(builder_, port);
            return outcome;
    }
    outcome.state = STATE_FILTERED;
    return outcome;
}

TechniqueOutcome TechniqueRunner::synFamily(ScanTechnique technique, uint16_t port,
                                            const std::vector<uint8_t>& payload) {
    std::optional<SynExchange> exchange = retryWithBackoff(policyFor(technique),
        [&](int) -> std::optional<SynExchange> {
            Packet probe = builder_.tcp(port, TH_SYN, payload);
            std::optional<Packet> reply = transport_.sendAndWait(probe, config_.timeout_scan_ms);
            if (classifySyn(reply) == STATE_FILTERED) return std::nullopt;
            return SynExchange{probe, *reply};
        });

    TechniqueOutcome outcome;
    if (!exchange) {
        outcome.state = STATE_FILTERED;
        return outcome;
    }
    outcome.state = classifySyn(exchange->reply);
    if (outcome.state == STATE_OPEN) {
        if (!transport_.send(builder_.rstFor(exchange->probe))) {
            logsys.Debug("RST teardown to ", target_.ip, ":", port, " failed");
        }
        outcome.os_guess = guessOs(exchange->reply);
    }
    logsys.Debug(techniqueName(technique), " ", target_.ip, ":", port, " -> ",
                 tcpFlagString(exchange->reply.tcp_flags), " ", outcome.state);
    return outcome;
}

std::string TechniqueRunner::singleProbe(ScanTechnique technique, uint16_t port) {
    std::optional<Packet> reply = retryWithBackoff(policyFor(technique), [&](int) {
        return transport_.sendAndWait(builder_.tcp(port, probeFlags(technique)), config_.timeout_scan_ms);
    });
    switch (technique) {
        case ScanTechnique::ACK:
            return classifyAck(reply);
        case ScanTechnique::WINDOW:
            return classifyWindow(reply);
        case ScanTechnique::FIN:
        case ScanTechnique::XMAS:
        case ScanTechnique::NULL_SCAN:
            return classifyStealth(reply);
        case ScanTechnique::SYN:
        case ScanTechnique::UDP:
        case ScanTechnique::SSL:
        case ScanTechnique::TLS_ECHO:
        case ScanTechnique::MIMIC:
        case ScanTechnique::FRAG:
            break;
    }
    return classifySyn(reply);
}

std::string TechniqueRunner::udpProbe(uint16_t port) {
    static const std::vector<uint8_t> payload = {'p', 'r', 'o', 'b', 'e'};
    std::optional<Packet> reply = retryWithBackoff(policyFor(ScanTechnique::UDP), [&](int) {
        return transport_.sendAndWait(builder_.udp(port, payload), config_.timeout_scan_ms);
    });
    return classifyUdp(reply);
}

TechniqueOutcome TechniqueRunner::sslProbe(uint16_t port) {
    TechniqueOutcome outcome;
    std::optional<TlsSession> session = tls_.probe(target_, port, config_.timeout_connect_ms);
    if (!session) {
        outcome.state = STATE_CLOSED;
        return outcome;
    }
    outcome.state = STATE_OPEN;
    outcome.tls_version = session->version;
    outcome.cert = session->cert;
    return outcome;
}
