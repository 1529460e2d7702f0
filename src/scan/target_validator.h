#pragma once
#include <functional>
#include <string>
#include <vector>

// Pre-flight check of a scan target.
// A seed URL must be an absolute http(s) URL, and unless private targets are
// allowed every address its host resolves to must be public. Loopback,
// private, link-local, CGNAT and unspecified ranges are refused.

class TargetValidator {
public:
    using Resolver = std::function<std::vector<std::string>(const std::string& host)>;

    /**
     * @brief Create a validator
     * @param allow_private Skip the address check (test environments). The
     *        INJSCAN_ALLOW_PRIVATE=1 environment variable has the same effect.
     * @param resolver Host name to addresses; getaddrinfo() when empty
     */
    explicit TargetValidator(bool allow_private = false, Resolver resolver = Resolver());

    /**
     * @brief Check a seed URL
     * @param target URL to scan
     * @throws std::invalid_argument with the reason if the target is refused
     */
    void validate(const std::string& target) const;

    /**
     * @brief Same check without exceptions
     * @param target URL to scan
     * @param error Set to the reason when refused
     * @return true if the target may be scanned
     */
    bool accepts(const std::string& target, std::string& error) const;

    bool allows_private() const { return allow_private_; }

    /**
     * @brief True for loopback, private, link-local, CGNAT, multicast and
     *        unspecified IPv4/IPv6 addresses (IPv4-mapped IPv6 included)
     * @param address Numeric address
     */
    static bool is_private_address(const std::string& address);

    /// Addresses of a host via getaddrinfo(), empty if it does not resolve.
    static std::vector<std::string> system_resolve(const std::string& host);

private:
    bool allow_private_;
    Resolver resolver_;
};
