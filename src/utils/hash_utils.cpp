/**
 * @file hash_utils.cpp
 * @brief FNV-1a implementation
 *
 * @date 2025
 */

#include "cellguard/utils/hash_utils.hpp"

#include <iomanip>
#include <sstream>

namespace cellguard {
namespace utils {

namespace {

constexpr std::uint32_t kFnvOffsetBasis = 2166136261u;
constexpr std::uint32_t kFnvPrime = 16777619u;

} // anonymous namespace

std::uint32_t HashUtils::Fnv1a32(const std::string& data) {
    std::uint32_t hash = kFnvOffsetBasis;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

std::string HashUtils::ToHex32(std::uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

} // namespace utils
} // namespace cellguard
