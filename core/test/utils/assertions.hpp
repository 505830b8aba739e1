// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_CORE_TEST_UTILS_ASSERTIONS_HPP_
#define LND_CORE_TEST_UTILS_ASSERTIONS_HPP_


#include <algorithm>
#include <cmath>
#include <complex>
#include <initializer_list>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/array.hpp>
#include <linden/core/base/vector.hpp>


#include "core/base/dispatch_helper.hpp"


namespace lnd {
namespace test {
namespace assertions {
namespace detail {


using value_list = std::vector<std::complex<double>>;


/**
 * Returns the values of an array, realizing it if it is lazy.
 */
inline value_list values_of(const Array* a)
{
    return vector_dispatch(a, [](auto dense) -> value_list {
        auto eager = dense->realize();
        value_list values;
        for (const auto& v : eager->get_data()) {
            values.emplace_back(v);
        }
        return values;
    });
}


template <typename T>
value_list values_of(const std::unique_ptr<T>& ptr)
{
    return values_of(static_cast<const Array*>(ptr.get()));
}


template <typename T>
value_list values_of(const std::shared_ptr<T>& ptr)
{
    return values_of(static_cast<const Array*>(ptr.get()));
}


template <typename T>
value_list values_of(T* ptr)
{
    return values_of(static_cast<const Array*>(ptr));
}


template <typename T>
value_list values_of(const std::vector<T>& list)
{
    value_list values;
    for (const auto& v : list) {
        values.emplace_back(v);
    }
    return values;
}


/**
 * Turns an initializer list into a vector, so it can be passed through the
 * assertion macros.
 */
template <typename T>
std::vector<T> l(std::initializer_list<T> list)
{
    return std::vector<T>(list);
}


inline std::string print(const value_list& values)
{
    std::stringstream ss;
    ss << "[";
    for (const auto& v : values) {
        ss << " ";
        if (v.imag() == 0.0) {
            ss << v.real();
        } else {
            ss << v;
        }
    }
    ss << " ]";
    return ss.str();
}


}  // namespace detail


/**
 * Checks if two vectors are near each other: they have the same length, and
 * the relative error ||first - second|| / max(||first||, ||second||) is at
 * most the tolerance.
 */
template <typename First, typename Second>
::testing::AssertionResult vectors_near(const std::string& first_expression,
                                        const std::string& second_expression,
                                        const std::string& tolerance_expression,
                                        const First& first,
                                        const Second& second, double tolerance)
{
    auto first_values = detail::values_of(first);
    auto second_values = detail::values_of(second);
    if (first_values.size() != second_values.size()) {
        return ::testing::AssertionFailure()
               << "Expected vectors of equal length\n\t" << first_expression
               << " is of length " << first_values.size() << "\n\t"
               << second_expression << " is of length "
               << second_values.size();
    }
    double diff_norm = 0.0;
    double first_norm = 0.0;
    double second_norm = 0.0;
    for (size_type i = 0; i < first_values.size(); ++i) {
        diff_norm += std::norm(first_values[i] - second_values[i]);
        first_norm += std::norm(first_values[i]);
        second_norm += std::norm(second_values[i]);
    }
    const auto err = std::sqrt(diff_norm) /
                     std::max(std::sqrt(std::max(first_norm, second_norm)),
                              std::numeric_limits<double>::min());
    if (diff_norm == 0.0 || err <= tolerance) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure()
           << "Relative error between " << first_expression << " and "
           << second_expression << " is " << err << "\n"
           << "\twhich is larger than " << tolerance_expression
           << " (which is " << tolerance << ")\n"
           << first_expression << " is:\n\t"
           << detail::print(first_values) << "\n"
           << second_expression << " is:\n\t"
           << detail::print(second_values);
}


}  // namespace assertions
}  // namespace test
}  // namespace lnd


/**
 * Checks if two vectors are near each other.
 *
 * More formally, it checks whether the following equation holds:
 *
 * ```
 * ||_vec1 - _vec2|| <= _tol * max(||_vec1||, ||_vec2||)
 * ```
 *
 * The vectors can be arrays (lazy ones are realized), or lists of values
 * written as `l({1.0, 2.0})`.
 *
 * @param _vec1  first vector
 * @param _vec2  second vector
 * @param _tol  tolerance
 */
#define LND_ASSERT_VECTOR_NEAR(_vec1, _vec2, _tol)                    \
    {                                                                 \
        using ::lnd::test::assertions::detail::l;                     \
        ASSERT_PRED_FORMAT3(::lnd::test::assertions::vectors_near,    \
                            _vec1, _vec2, static_cast<double>(_tol)); \
    }


/**
 * @copydoc LND_ASSERT_VECTOR_NEAR
 */
#define LND_EXPECT_VECTOR_NEAR(_vec1, _vec2, _tol)                    \
    {                                                                 \
        using ::lnd::test::assertions::detail::l;                     \
        EXPECT_PRED_FORMAT3(::lnd::test::assertions::vectors_near,    \
                            _vec1, _vec2, static_cast<double>(_tol)); \
    }


#endif  // LND_CORE_TEST_UTILS_ASSERTIONS_HPP_
