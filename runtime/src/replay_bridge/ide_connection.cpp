#include "replay_bridge/ide_connection.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

SocketIdeChannel::~SocketIdeChannel() {
    close();
}

bool SocketIdeChannel::connectTo(const std::string& host, int port, std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        error = "Cannot resolve " + host + ": " + gai_strerror(rc);
        return false;
    }

    int sock = -1;
    for (addrinfo* a = addresses; a != nullptr; a = a->ai_next) {
        sock = ::socket(a->ai_family, a->ai_socktype, a->ai_protocol);
        if (sock < 0) continue;
        if (::connect(sock, a->ai_addr, a->ai_addrlen) == 0) break;
        error = std::strerror(errno);
        ::close(sock);
        sock = -1;
    }
    ::freeaddrinfo(addresses);

    if (sock < 0) {
        error = "Cannot connect to the IDE at " + host + ":" + service +
                (error.empty() ? "" : ": " + error);
        return false;
    }

    fd = sock;
    LOG_INFO("Connected to the IDE at ", host, ":", port);
    return true;
}

bool SocketIdeChannel::readCommand(std::string& command) {
    char buffer[4096];
    for (;;) {
        auto nul = pending.find('\0');
        if (nul != std::string::npos) {
            command = pending.substr(0, nul);
            pending.erase(0, nul + 1);
            return true;
        }

        int sock = fd;
        if (sock < 0) return false;
        ssize_t n = ::recv(sock, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (!pending.empty()) {
                LOG_DEBUG("IDE closed with an unterminated command: ", pending);
            }
            return false;
        }
        pending.append(buffer, static_cast<size_t>(n));
    }
}

bool SocketIdeChannel::writePacket(const std::string& packet) {
    size_t offset = 0;
    while (offset < packet.size()) {
        int sock = fd;
        if (sock < 0) return false;
        ssize_t n = ::send(sock, packet.data() + offset, packet.size() - offset, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            LOG_WARNING("Writing to the IDE failed: ", std::strerror(errno));
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

void SocketIdeChannel::close() {
    int sock = fd.exchange(-1);
    if (sock >= 0) {
        ::shutdown(sock, SHUT_RDWR);
        ::close(sock);
    }
}
