// SPDX-License-Identifier: MIT

// lib/stream/dns_resolver.hpp
#pragma once

#include <netdb.h>
#include <sys/socket.h>

#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace wme_pipe {

// One address a stream socket can connect() to
struct Endpoint {
    sockaddr_storage address{};
    socklen_t length = 0;

    int family() const { return address.ss_family; }
    const sockaddr* data() const { return reinterpret_cast<const sockaddr*>(&address); }
};

// Blocking getaddrinfo lookup of host:port for TCP, in the resolver's
// preference order. Never empty on success.
inline std::expected<std::vector<Endpoint>, Error> ResolveEndpoints(std::string_view host,
                                                                    uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV | AI_ADDRCONFIG;

    addrinfo* raw = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(std::string(host).c_str(), service.c_str(), &hints, &raw);
    if (rc != 0) {
        return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
                                     fmt::format("cannot resolve {}: {}", host, gai_strerror(rc))});
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> list(raw, &::freeaddrinfo);

    std::vector<Endpoint> endpoints;
    for (const addrinfo* ai = list.get(); ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
        Endpoint ep;
        std::memcpy(&ep.address, ai->ai_addr, ai->ai_addrlen);
        ep.length = ai->ai_addrlen;
        endpoints.push_back(ep);
    }
    if (endpoints.empty()) {
        return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
                                     fmt::format("{} has no usable addresses", host)});
    }
    return endpoints;
}

}  // namespace wme_pipe
