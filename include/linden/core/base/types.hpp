// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_TYPES_HPP_
#define LND_PUBLIC_CORE_BASE_TYPES_HPP_


#include <climits>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <type_traits>


namespace lnd {


/**
 * Integral type used for allocation quantities.
 */
using size_type = std::size_t;


/**
 * 8-bit unsigned integral type.
 */
using uint8 = std::uint8_t;


/**
 * 32-bit signed integral type.
 */
using int32 = std::int32_t;


/**
 * 64-bit signed integral type.
 */
using int64 = std::int64_t;


/**
 * 64-bit unsigned integral type.
 */
using uint64 = std::uint64_t;


/**
 * Unsigned integer type capable of holding a pointer to void
 */
using uintptr = std::uintptr_t;


/**
 * Precision used if no precision is explicitly specified.
 */
using default_precision = double;


/**
 * Number of bits in a byte
 */
constexpr size_type byte_size = CHAR_BIT;


/**
 * Calls a given macro for each value type.
 *
 * The macro should take one argument, which is replaced by the value type.
 */
#define LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(_macro) \
    template _macro(float);                         \
    template _macro(double);                        \
    template _macro(std::complex<float>);           \
    template _macro(std::complex<double>)


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_TYPES_HPP_
