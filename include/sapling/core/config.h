#ifndef SAPLING_CORE_CONFIG_H
#define SAPLING_CORE_CONFIG_H

#include <cstddef>

namespace sapling::core::config {

inline constexpr std::size_t kDefaultNodeCapacity = 16;
inline constexpr std::size_t kParentListReserve = 1;
inline constexpr std::size_t kDefaultDiagnosticEventLimit = 1024;

}  // namespace sapling::core::config

#endif  // SAPLING_CORE_CONFIG_H
