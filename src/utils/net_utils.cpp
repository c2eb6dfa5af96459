/**
 * @file net_utils.cpp
 * @brief Implementation of address, CIDR and port parsing
 *
 * Address literals are validated with inet_pton, which rejects leading
 * garbage, short forms and out-of-range octets.
 *
 * @date 2025
 */

#include "cellguard/utils/net_utils.hpp"

#include <arpa/inet.h>

#include <charconv>

namespace cellguard {
namespace utils {

namespace {

std::optional<int> ParsePrefix(const std::string& str, int max_prefix) {
    if (str.empty() || str.size() > 3) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    if (value < 0 || value > max_prefix) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

std::optional<std::uint32_t> NetUtils::ParseIPv4(const std::string& str) {
    in_addr addr{};
    if (inet_pton(AF_INET, str.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string NetUtils::FormatIPv4(std::uint32_t address) {
    in_addr addr{};
    addr.s_addr = htonl(address);
    char buffer[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        return "";
    }
    return buffer;
}

bool NetUtils::IsIPAddress(const std::string& str) {
    if (ParseIPv4(str)) {
        return true;
    }
    in6_addr addr6{};
    return inet_pton(AF_INET6, str.c_str(), &addr6) == 1;
}

std::optional<Ipv4Network> NetUtils::ParseIPv4Cidr(const std::string& str) {
    auto slash = str.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    auto address = ParseIPv4(str.substr(0, slash));
    auto prefix = ParsePrefix(str.substr(slash + 1), 32);
    if (!address || !prefix) {
        return std::nullopt;
    }

    Ipv4Network network;
    network.address = *address;
    network.prefix_length = *prefix;
    return network;
}

bool NetUtils::IsCIDR(const std::string& str) {
    if (ParseIPv4Cidr(str)) {
        return true;
    }

    auto slash = str.find('/');
    if (slash == std::string::npos) {
        return false;
    }
    in6_addr addr6{};
    if (inet_pton(AF_INET6, str.substr(0, slash).c_str(), &addr6) != 1) {
        return false;
    }
    return ParsePrefix(str.substr(slash + 1), 128).has_value();
}

std::optional<long> NetUtils::ParsePort(const std::string& str) {
    std::string number = str;
    auto slash = str.find('/');
    if (slash != std::string::npos) {
        std::string proto = str.substr(slash + 1);
        if (proto != "tcp" && proto != "udp") {
            return std::nullopt;
        }
        number = str.substr(0, slash);
    }

    if (number.empty()) {
        return std::nullopt;
    }

    long value = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc() || ptr != number.data() + number.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace utils
} // namespace cellguard
