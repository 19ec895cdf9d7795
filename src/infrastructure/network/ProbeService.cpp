#include "infrastructure/network/ProbeService.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <future>
#include <memory>
#include <random>
#include <system_error>
#include <thread>

#ifdef __linux__
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace netscan::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr size_t ICMP_HEADER_SIZE = 8;

#ifdef __linux__
/**
 * Closes the socket on scope exit.
 */
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

// Datagram ICMP sockets deliver the ICMP message only; raw sockets prepend
// the IP header.
const uint8_t* icmpPayload(const uint8_t* data, size_t length, bool rawSocket) {
    if (!rawSocket) {
        return length >= ICMP_HEADER_SIZE ? data : nullptr;
    }
    if (length < 20) {
        return nullptr;
    }
    size_t ipHeaderLen = static_cast<size_t>((data[0] & 0x0F) * 4);
    if (length < ipHeaderLen + ICMP_HEADER_SIZE) {
        return nullptr;
    }
    return data + ipHeaderLen;
}
#endif

} // namespace

ProbeService::ProbeService(NeighborTable neighbors, size_t maxPendingLookups)
    : neighbors_(std::move(neighbors)), maxPendingLookups_(maxPendingLookups),
      pendingLookups_(std::make_shared<std::atomic<size_t>>(0)) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("ProbeService initialized with ICMP identifier: {}", identifier_);
}

uint16_t ProbeService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> ProbeService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

bool ProbeService::isAlive(const std::string& ip, std::chrono::milliseconds timeout) {
#ifdef __linux__
    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        spdlog::debug("Liveness probe skipped, invalid address: {}", ip);
        return false;
    }

    bool rawSocket = false;
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd < 0) {
        fd = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        rawSocket = true;
    }
    if (fd < 0) {
        spdlog::debug("Liveness probe to {} failed: no ICMP socket (need ping_group_range or "
                      "CAP_NET_RAW)",
                      ip);
        return false;
    }
    SocketGuard sock(fd);

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        spdlog::debug("Liveness probe to {} failed: {}", ip, std::strerror(errno));
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<uint8_t, 1024> recvBuffer{};

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready <= 0) {
            return false;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        if (received < 0) {
            return false;
        }

        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        const uint8_t* icmp =
            icmpPayload(recvBuffer.data(), static_cast<size_t>(received), rawSocket);
        if (icmp == nullptr || icmp[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = (static_cast<uint16_t>(icmp[4]) << 8) | icmp[5];
        uint16_t recvSeq = (static_cast<uint16_t>(icmp[6]) << 8) | icmp[7];

        // The kernel rewrites the identifier of datagram ICMP sockets.
        if (recvSeq == seq && (!rawSocket || recvId == identifier_)) {
            return true;
        }
    }
#else
    (void)ip;
    (void)timeout;
    return false;
#endif
}

std::optional<std::string> ProbeService::resolveNeighbor(const std::string& ip) {
    return neighbors_.lookup(ip);
}

std::optional<std::string> ProbeService::resolveHostname(const std::string& ip,
                                                         std::chrono::milliseconds timeout) {
#ifdef __linux__
    struct sockaddr_in sa {};
    sa.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) {
        return std::nullopt;
    }

    // Reserve a slot; the lookup thread releases it when getnameinfo returns.
    auto pending = pendingLookups_;
    if (pending->fetch_add(1) >= maxPendingLookups_) {
        pending->fetch_sub(1);
        spdlog::debug("Reverse DNS for {} skipped, {} lookups still pending", ip,
                      maxPendingLookups_);
        return std::nullopt;
    }

    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    auto future = promise->get_future();

    try {
        std::thread([promise, pending, sa]() {
            std::array<char, NI_MAXHOST> host{};
            int rc = getnameinfo(reinterpret_cast<const struct sockaddr*>(&sa), sizeof(sa),
                                 host.data(), host.size(), nullptr, 0, NI_NAMEREQD);
            if (rc == 0) {
                promise->set_value(std::string(host.data()));
            } else {
                promise->set_value(std::nullopt);
            }
            pending->fetch_sub(1);
        }).detach();
    } catch (const std::system_error& e) {
        pending->fetch_sub(1);
        spdlog::debug("Reverse DNS for {} not started: {}", ip, e.what());
        return std::nullopt;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::debug("Reverse DNS for {} timed out after {}ms", ip, timeout.count());
        return std::nullopt;
    }

    auto name = future.get();
    if (name && name->empty()) {
        return std::nullopt;
    }
    return name;
#else
    (void)ip;
    (void)timeout;
    return std::nullopt;
#endif
}

std::vector<core::NeighborEntry> ProbeService::snapshotNeighborTable() {
    return neighbors_.snapshot();
}

} // namespace netscan::infra
