// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_MATH_HPP_
#define LND_PUBLIC_CORE_BASE_MATH_HPP_


#include <cmath>
#include <complex>
#include <limits>
#include <type_traits>


#include <linden/core/base/types.hpp>


namespace lnd {
namespace detail {


template <typename T>
struct remove_complex_impl {
    using type = T;
};

template <typename T>
struct remove_complex_impl<std::complex<T>> {
    using type = T;
};


template <typename T>
struct to_complex_impl {
    using type = std::complex<T>;
};

template <typename T>
struct to_complex_impl<std::complex<T>> {
    using type = std::complex<T>;
};


template <typename T>
struct is_complex_impl : std::false_type {};

template <typename T>
struct is_complex_impl<std::complex<T>> : std::true_type {};


template <typename T>
struct next_precision_impl {};

template <>
struct next_precision_impl<float> {
    using type = double;
};

template <>
struct next_precision_impl<double> {
    using type = float;
};

template <typename T>
struct next_precision_impl<std::complex<T>> {
    using type = std::complex<typename next_precision_impl<T>::type>;
};


}  // namespace detail


/**
 * Obtains a real counterpart of a std::complex type, and leaves the type
 * unchanged if it is not a complex type.
 */
template <typename T>
using remove_complex = typename detail::remove_complex_impl<T>::type;


/**
 * Obtains a complex counterpart of a real type, and leaves the type
 * unchanged if it is a complex type.
 */
template <typename T>
using to_complex = typename detail::to_complex_impl<T>::type;


/**
 * Obtains the other floating point precision of the same kind
 * (float <-> double, complex<float> <-> complex<double>).
 */
template <typename T>
using next_precision = typename detail::next_precision_impl<T>::type;


/**
 * Checks if T is a complex type.
 */
template <typename T>
constexpr bool is_complex()
{
    return detail::is_complex_impl<T>::value;
}


/**
 * Returns the additive identity for T.
 */
template <typename T>
constexpr T zero()
{
    return T{};
}


/**
 * Returns the multiplicative identity for T.
 */
template <typename T>
constexpr T one()
{
    return T(1);
}


template <typename T>
constexpr T conj(const T& x)
{
    return x;
}

template <typename T>
std::complex<T> conj(const std::complex<T>& x)
{
    return std::conj(x);
}


template <typename T>
constexpr T real(const T& x)
{
    return x;
}

template <typename T>
constexpr T real(const std::complex<T>& x)
{
    return x.real();
}


template <typename T>
constexpr T imag(const T&)
{
    return T{};
}

template <typename T>
constexpr T imag(const std::complex<T>& x)
{
    return x.imag();
}


/**
 * Returns the squared magnitude |x|^2 as a real number.
 */
template <typename T>
constexpr remove_complex<T> squared_norm(const T& x)
{
    return lnd::real(lnd::conj(x) * x);
}


template <typename T>
remove_complex<T> abs(const T& x)
{
    return std::abs(x);
}


template <typename T>
T sqrt(const T& x)
{
    return std::sqrt(x);
}


template <typename T>
constexpr bool is_zero(const T& value)
{
    return value == zero<T>();
}


template <typename T>
constexpr bool is_nonzero(const T& value)
{
    return value != zero<T>();
}


/**
 * Converts a value between the supported value types. Imaginary parts are
 * dropped when converting a complex value to a real type.
 */
template <typename Target, typename Source>
Target convert_value(const Source& value)
{
    if constexpr (is_complex<Target>()) {
        using target_real = remove_complex<Target>;
        return Target(static_cast<target_real>(lnd::real(value)),
                      static_cast<target_real>(lnd::imag(value)));
    } else {
        return static_cast<Target>(lnd::real(value));
    }
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_MATH_HPP_
