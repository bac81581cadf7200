#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

namespace transport
{

static bool resolve_ipv4(const config::Endpoint &ep, sockaddr_in &out)
{
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port   = htons(ep.port);
    if (inet_pton(AF_INET, ep.host.c_str(), &out.sin_addr) == 1)
        return true;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res     = nullptr;
    const int rc      = getaddrinfo(ep.host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res)
    {
        LOG_ERROR("getaddrinfo(%s) failed: %s", ep.host.c_str(), gai_strerror(rc));
        return false;
    }
    out.sin_addr = reinterpret_cast<sockaddr_in *>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

UdpTransport::UdpTransport(UdpConfig cfg) : cfg_(std::move(cfg)) {}

UdpTransport::~UdpTransport()
{
    stop();
}

bool UdpTransport::start(const Settings &s, OnFrame on_rx)
{
    stop();
    settings_ = s;
    on_rx_    = std::move(on_rx);

    sockaddr_in local{};
    if (!resolve_ipv4(cfg_.bind, local) || !resolve_ipv4(cfg_.peer, peer_addr_))
        return false;

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    if (bind(fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) == -1)
    {
        LOG_ERROR("bind(%s:%u) failed: %s", cfg_.bind.host.c_str(), (unsigned)cfg_.bind.port,
                  std::strerror(errno));
        close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t   len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &len) == 0)
        local_port_ = ntohs(bound.sin_port);

    {
        std::lock_guard<std::mutex> lk(fd_mu_);
        fd_ = fd;
    }
    running_.store(true);
    rx_thr_ = std::thread([this] { rx_loop(); });
    LOG_INFO("udp: bound %s:%u, peer %s:%u", cfg_.bind.host.c_str(), (unsigned)local_port_,
             cfg_.peer.host.c_str(), (unsigned)cfg_.peer.port);
    return true;
}

bool UdpTransport::send(const Frame &one_frame)
{
    std::lock_guard<std::mutex> lk(fd_mu_);
    if (!running_.load() || fd_ == -1)
        return false;
    if (one_frame.size() > settings_.frame_mtu)
    {
        LOG_ERROR("udp: frame of %zu bytes exceeds mtu %zu", one_frame.size(),
                  settings_.frame_mtu);
        return false;
    }
    while (true)
    {
        ssize_t n = sendto(fd_, one_frame.data(), one_frame.size(), 0,
                           reinterpret_cast<const sockaddr *>(&peer_addr_), sizeof(peer_addr_));
        if (n == static_cast<ssize_t>(one_frame.size()))
            return true;
        if (n == -1 && errno == EINTR)
            continue;
        LOG_WARN("udp: sendto() failed: %s", n == -1 ? std::strerror(errno) : "short write");
        return false;
    }
}

void UdpTransport::rx_loop()
{
    // one spare byte so an oversized datagram is detectable
    std::vector<std::uint8_t> buf(settings_.frame_mtu + 1);
    while (running_.load())
    {
        pollfd pfd{fd_, POLLIN, 0};
        int    rc = poll(&pfd, 1, 100);
        if (rc == 0)
            continue;
        if (rc == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("udp: poll() failed: %s", std::strerror(errno));
            break;
        }
        ssize_t n = recv(fd_, buf.data(), buf.size(), 0);
        if (n == -1)
        {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNREFUSED)
                continue;  // ECONNREFUSED: ICMP from a peer that is not up yet
            LOG_ERROR("udp: recv() failed: %s", std::strerror(errno));
            break;
        }
        if (static_cast<std::size_t>(n) > settings_.frame_mtu)
        {
            LOG_WARN("udp: dropping oversized datagram (%zd bytes)", n);
            continue;
        }
        if (on_rx_)
            on_rx_(Frame(buf.begin(), buf.begin() + n));
    }
}

void UdpTransport::stop()
{
    running_.store(false);
    if (rx_thr_.joinable())
        rx_thr_.join();
    std::lock_guard<std::mutex> lk(fd_mu_);
    if (fd_ != -1)
    {
        close(fd_);
        fd_ = -1;
    }
}

bool UdpTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(fd_mu_);
    return running_.load() && fd_ != -1;
}

}  // namespace transport
