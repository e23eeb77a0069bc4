#pragma once

#include <cstddef>

// Platform detection and requirements
#ifndef __linux__
    #error "This codebase targets Linux"
#endif

#if __cplusplus < 202002L
    #error "This codebase requires C++20 or later"
#endif

// Verify 128-bit integer support (required for Amount / Delta)
#if !defined(__SIZEOF_INT128__)
    #error "128-bit integer support required for reserve and delta arithmetic"
#endif

namespace flash_amm::core {

// Engine-wide constants
constexpr std::size_t ADDRESS_SIZE = 20;
constexpr std::size_t MARKING_BITS = 24;

}  // namespace flash_amm::core
