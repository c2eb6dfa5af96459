/**
 * @file hash_utils.hpp
 * @brief Non-cryptographic hashing for deterministic resource allocation
 *
 * Workspace subnets and bridge names are derived from a stable 32-bit hash of
 * the workspace identifier so that every process computes the same
 * assignment without shared state.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>

namespace cellguard {
namespace utils {

/**
 * @class HashUtils
 * @brief Stable string hashing helpers
 */
class HashUtils {
public:
    /**
     * @brief 32-bit FNV-1a hash
     *
     * Offset basis 2166136261, prime 16777619. Output is identical on every
     * platform and process.
     */
    static std::uint32_t Fnv1a32(const std::string& data);

    /**
     * @brief Lowercase hexadecimal rendering of a 32-bit value (8 chars)
     */
    static std::string ToHex32(std::uint32_t value);
};

} // namespace utils
} // namespace cellguard
