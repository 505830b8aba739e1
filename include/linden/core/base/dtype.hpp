// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_DTYPE_HPP_
#define LND_PUBLIC_CORE_BASE_DTYPE_HPP_


#include <complex>
#include <iosfwd>
#include <string>


#include <linden/core/base/types.hpp>


namespace lnd {


/**
 * Runtime tag of the numeric value type of an operator or a vector.
 */
enum class dtype : uint8 { float32, float64, complex64, complex128 };


namespace detail {


template <typename ValueType>
struct dtype_of_impl {};

template <>
struct dtype_of_impl<float> {
    static constexpr dtype value = dtype::float32;
};

template <>
struct dtype_of_impl<double> {
    static constexpr dtype value = dtype::float64;
};

template <>
struct dtype_of_impl<std::complex<float>> {
    static constexpr dtype value = dtype::complex64;
};

template <>
struct dtype_of_impl<std::complex<double>> {
    static constexpr dtype value = dtype::complex128;
};


}  // namespace detail


/**
 * Returns the dtype tag of a value type.
 */
template <typename ValueType>
constexpr dtype dtype_of()
{
    return detail::dtype_of_impl<ValueType>::value;
}


/**
 * Checks whether the dtype describes complex values.
 */
constexpr bool is_complex(dtype type)
{
    return type == dtype::complex64 || type == dtype::complex128;
}


/**
 * Checks whether the dtype uses double precision (float64 or complex128).
 */
constexpr bool is_double_precision(dtype type)
{
    return type == dtype::float64 || type == dtype::complex128;
}


/**
 * Returns the complex dtype of the same precision.
 */
constexpr dtype complex_dtype(dtype type)
{
    return is_double_precision(type) ? dtype::complex128 : dtype::complex64;
}


/**
 * Checks whether two dtypes are of the same kind, i.e. both real or both
 * complex. Values of the same kind can be converted into each other.
 */
constexpr bool is_same_kind(dtype first, dtype second)
{
    return is_complex(first) == is_complex(second);
}


/**
 * Returns the dtype able to represent the values of both arguments: it is
 * complex if either argument is complex and uses the higher of both
 * precisions.
 */
constexpr dtype promote(dtype first, dtype second)
{
    const bool complex = is_complex(first) || is_complex(second);
    const bool dbl = is_double_precision(first) || is_double_precision(second);
    if (complex) {
        return dbl ? dtype::complex128 : dtype::complex64;
    }
    return dbl ? dtype::float64 : dtype::float32;
}


/**
 * Returns the name of the dtype ("float32", "float64", "complex64" or
 * "complex128").
 */
std::string to_string(dtype type);


/**
 * Parses a dtype from its name. Besides the names returned by to_string,
 * the C++ spellings "float", "double", "complex<float>" and "complex<double>"
 * are accepted.
 *
 * @throws InvalidStateError  if the name is unknown
 */
dtype dtype_from_string(const std::string& name);


std::ostream& operator<<(std::ostream& os, dtype type);


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_DTYPE_HPP_
