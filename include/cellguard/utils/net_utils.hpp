/**
 * @file net_utils.hpp
 * @brief Address, CIDR and port parsing helpers
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cellguard {
namespace utils {

/**
 * @struct Ipv4Network
 * @brief Parsed IPv4 CIDR block (host byte order)
 */
struct Ipv4Network {
    std::uint32_t address{0};   ///< Address as written (host bits may be set)
    int prefix_length{0};       ///< 0-32

    /// Address with host bits cleared
    std::uint32_t NetworkAddress() const {
        return prefix_length == 0 ? 0u : (address & (0xFFFFFFFFu << (32 - prefix_length)));
    }
};

/**
 * @class NetUtils
 * @brief Stateless network string helpers
 */
class NetUtils {
public:
    /**
     * @brief Parse a dotted-quad IPv4 address
     * @return Address in host byte order, or std::nullopt when malformed
     */
    static std::optional<std::uint32_t> ParseIPv4(const std::string& str);

    static std::string FormatIPv4(std::uint32_t address);

    /**
     * @brief Check if string is a literal IPv4 or IPv6 address
     */
    static bool IsIPAddress(const std::string& str);

    /**
     * @brief Parse "a.b.c.d/n" (IPv4 only)
     * @return Parsed network, or std::nullopt when malformed
     */
    static std::optional<Ipv4Network> ParseIPv4Cidr(const std::string& str);

    /**
     * @brief Check if string is an IPv4 or IPv6 CIDR block
     */
    static bool IsCIDR(const std::string& str);

    /**
     * @brief Parse a port number with an optional "/tcp" or "/udp" suffix
     *
     * @code
     * ParsePort("8080");      // 8080
     * ParsePort("53/udp");    // 53
     * ParsePort("80/sctp");   // nullopt
     * ParsePort("http");      // nullopt
     * @endcode
     *
     * Range is not checked; callers validate 1-65535 themselves so that
     * out-of-range values can be reported distinctly.
     */
    static std::optional<long> ParsePort(const std::string& str);
};

} // namespace utils
} // namespace cellguard
