// Scan target validation (SSRF guard)

#include "target_validator.h"
#include "core/url_utils.h"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace {

bool env_allows_private() {
    const char* v = std::getenv("INJSCAN_ALLOW_PRIVATE");
    return v && std::strcmp(v, "1") == 0;
}

bool private_v4(uint32_t a) {
    auto in = [a](uint32_t net, int bits) {
        uint32_t mask = bits == 0 ? 0 : 0xFFFFFFFFu << (32 - bits);
        return (a & mask) == (net & mask);
    };
    return in(0x00000000u, 8)          // 0.0.0.0/8
        || in(0x0A000000u, 8)          // 10.0.0.0/8
        || in(0x64400000u, 10)         // 100.64.0.0/10
        || in(0x7F000000u, 8)          // 127.0.0.0/8
        || in(0xA9FE0000u, 16)         // 169.254.0.0/16
        || in(0xAC100000u, 12)         // 172.16.0.0/12
        || in(0xC0A80000u, 16)         // 192.168.0.0/16
        || in(0xE0000000u, 4)          // multicast
        || a == 0xFFFFFFFFu;
}

std::string strip_brackets(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

} // namespace

TargetValidator::TargetValidator(bool allow_private, Resolver resolver)
    : allow_private_(allow_private || env_allows_private()),
      resolver_(resolver ? std::move(resolver) : Resolver(&TargetValidator::system_resolve)) {}

bool TargetValidator::is_private_address(const std::string& address) {
    in_addr v4{};
    if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
        return private_v4(ntohl(v4.s_addr));
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, address.c_str(), &v6) != 1) {
        return false;
    }
    const unsigned char* b = v6.s6_addr;

    static const unsigned char zero[16] = {0};
    if (std::memcmp(b, zero, 15) == 0 && (b[15] == 0 || b[15] == 1)) {
        return true;                                    // :: and ::1
    }
    static const unsigned char mapped[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};
    if (std::memcmp(b, mapped, 12) == 0) {
        uint32_t a = (uint32_t(b[12]) << 24) | (uint32_t(b[13]) << 16) | (uint32_t(b[14]) << 8) | b[15];
        return private_v4(a);
    }
    if ((b[0] & 0xFE) == 0xFC) return true;             // fc00::/7
    if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return true;   // fe80::/10
    if (b[0] == 0xFF) return true;                      // multicast
    return false;
}

std::vector<std::string> TargetValidator::system_resolve(const std::string& host) {
    std::vector<std::string> out;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) {
        return out;
    }

    for (addrinfo* p = res; p; p = p->ai_next) {
        char buf[INET6_ADDRSTRLEN] = {0};
        if (p->ai_family == AF_INET) {
            auto* sa = reinterpret_cast<sockaddr_in*>(p->ai_addr);
            inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf));
        } else if (p->ai_family == AF_INET6) {
            auto* sa = reinterpret_cast<sockaddr_in6*>(p->ai_addr);
            inet_ntop(AF_INET6, &sa->sin6_addr, buf, sizeof(buf));
        } else {
            continue;
        }
        out.emplace_back(buf);
    }
    freeaddrinfo(res);
    return out;
}

bool TargetValidator::accepts(const std::string& target, std::string& error) const {
    url::UrlParts parts;
    if (target.empty() || !url::split(target, parts)) {
        error = "malformed target URL '" + target + "'";
        return false;
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        error = "unsupported scheme '" + parts.scheme + "' (http and https only)";
        return false;
    }
    if (parts.host.empty()) {
        error = "target URL has no host";
        return false;
    }
    if (allow_private_) {
        return true;
    }

    std::string host = strip_brackets(parts.host);
    std::vector<std::string> addresses;
    in6_addr probe{};
    if (inet_pton(AF_INET, host.c_str(), &probe) == 1 || inet_pton(AF_INET6, host.c_str(), &probe) == 1) {
        addresses.push_back(host);
    } else {
        addresses = resolver_(host);
    }

    if (addresses.empty()) {
        error = "cannot resolve host '" + host + "'";
        return false;
    }
    for (const auto& a : addresses) {
        if (is_private_address(a)) {
            error = "host '" + host + "' resolves to non-public address " + a +
                    " (set allow_private_targets to scan test environments)";
            return false;
        }
    }
    return true;
}

void TargetValidator::validate(const std::string& target) const {
    std::string error;
    if (!accepts(target, error)) {
        throw std::invalid_argument(error);
    }
}
