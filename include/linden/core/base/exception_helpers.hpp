// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_EXCEPTION_HELPERS_HPP_
#define LND_PUBLIC_CORE_BASE_EXCEPTION_HELPERS_HPP_


#include <string>
#include <typeinfo>


#include <linden/core/base/dim.hpp>
#include <linden/core/base/dtype.hpp>
#include <linden/core/base/exception.hpp>
#include <linden/core/base/name_demangling.hpp>


namespace lnd {


/**
 * Adds the definition of a function which throws NotImplemented.
 */
#define LND_NOT_IMPLEMENTED                                        \
    {                                                              \
        throw ::lnd::NotImplemented(__FILE__, __LINE__, __func__); \
    }                                                              \
    static_assert(true,                                            \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


/**
 * Creates a NotSupported exception.
 * This macro sets the correct information about the location of the error
 * and fills the exception with data about _obj.
 *
 * @param _obj  the object referenced by NotSupported exception
 *
 * @return NotSupported
 */
#define LND_NOT_SUPPORTED(_obj)                                    \
    {                                                              \
        throw ::lnd::NotSupported(                                 \
            __FILE__, __LINE__, __func__,                          \
            ::lnd::name_demangling::get_type_name(typeid(_obj)));  \
    }                                                              \
    static_assert(true,                                            \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


namespace detail {


template <typename T>
inline dim<2> get_size(const T& op)
{
    return op->get_size();
}

inline dim<2> get_size(const dim<2>& size) { return size; }


template <typename T>
inline dtype get_dtype(const T& op)
{
    return op->get_dtype();
}

inline dtype get_dtype(const dtype& type) { return type; }


}  // namespace detail


/**
 * Asserts that _op1 is a square matrix.
 *
 * @throw BadDimension  if _op1 is not a square matrix.
 */
#define LND_ASSERT_IS_SQUARE_MATRIX(_op1)                                \
    if (::lnd::detail::get_size(_op1)[0] !=                              \
        ::lnd::detail::get_size(_op1)[1]) {                              \
        throw ::lnd::BadDimension(__FILE__, __LINE__, __func__, #_op1,   \
                                  ::lnd::detail::get_size(_op1)[0],      \
                                  ::lnd::detail::get_size(_op1)[1],      \
                                  "expected square matrix");             \
    }


/**
 * Asserts that _op1 can be applied to _op2.
 *
 * @throw DimensionMismatch  if _op1 cannot be applied to _op2.
 */
#define LND_ASSERT_CONFORMANT(_op1, _op2)                                     \
    if (::lnd::detail::get_size(_op1)[1] !=                                   \
        ::lnd::detail::get_size(_op2)[0]) {                                   \
        throw ::lnd::DimensionMismatch(__FILE__, __LINE__, __func__, #_op1,   \
                                       ::lnd::detail::get_size(_op1)[0],      \
                                       ::lnd::detail::get_size(_op1)[1],      \
                                       #_op2,                                 \
                                       ::lnd::detail::get_size(_op2)[0],      \
                                       ::lnd::detail::get_size(_op2)[1],      \
                                       "expected matching inner dimensions"); \
    }


/**
 * Asserts that _op1 has the same number of rows as _op2.
 *
 * @throw DimensionMismatch  if _op1 and _op2 do not have the same number of
 *                           rows.
 */
#define LND_ASSERT_EQUAL_ROWS(_op1, _op2)                                      \
    if (::lnd::detail::get_size(_op1)[0] !=                                    \
        ::lnd::detail::get_size(_op2)[0]) {                                    \
        throw ::lnd::DimensionMismatch(                                        \
            __FILE__, __LINE__, __func__, #_op1,                               \
            ::lnd::detail::get_size(_op1)[0],                                  \
            ::lnd::detail::get_size(_op1)[1], #_op2,                           \
            ::lnd::detail::get_size(_op2)[0],                                  \
            ::lnd::detail::get_size(_op2)[1], "expected matching row length"); \
    }


/**
 * Asserts that _op1 has the same number of columns as _op2.
 *
 * @throw DimensionMismatch  if _op1 and _op2 do not have the same number of
 *                           columns.
 */
#define LND_ASSERT_EQUAL_COLS(_op1, _op2)                                   \
    if (::lnd::detail::get_size(_op1)[1] !=                                 \
        ::lnd::detail::get_size(_op2)[1]) {                                 \
        throw ::lnd::DimensionMismatch(__FILE__, __LINE__, __func__, #_op1, \
                                       ::lnd::detail::get_size(_op1)[0],    \
                                       ::lnd::detail::get_size(_op1)[1],    \
                                       #_op2,                               \
                                       ::lnd::detail::get_size(_op2)[0],    \
                                       ::lnd::detail::get_size(_op2)[1],    \
                                       "expected matching column length");  \
    }


/**
 * Asserts that _op1 has the same number of rows and columns as _op2.
 *
 * @throw DimensionMismatch  if _op1 and _op2 do not have the same
 *                           dimensions.
 */
#define LND_ASSERT_EQUAL_DIMENSIONS(_op1, _op2)                             \
    if (::lnd::detail::get_size(_op1) != ::lnd::detail::get_size(_op2)) {   \
        throw ::lnd::DimensionMismatch(                                     \
            __FILE__, __LINE__, __func__, #_op1,                            \
            ::lnd::detail::get_size(_op1)[0],                               \
            ::lnd::detail::get_size(_op1)[1], #_op2,                        \
            ::lnd::detail::get_size(_op2)[0],                               \
            ::lnd::detail::get_size(_op2)[1], "expected equal dimensions"); \
    }


/**
 * Asserts that the values of _op1 and _op2 are of the same kind, i.e. both
 * real or both complex.
 *
 * @throw DtypeMismatch  if one of them is real and the other one complex.
 */
#define LND_ASSERT_SAME_KIND(_op1, _op2)                                     \
    if (!::lnd::is_same_kind(::lnd::detail::get_dtype(_op1),                 \
                             ::lnd::detail::get_dtype(_op2))) {              \
        throw ::lnd::DtypeMismatch(                                          \
            __FILE__, __LINE__, __func__, #_op1,                             \
            ::lnd::to_string(::lnd::detail::get_dtype(_op1)), #_op2,         \
            ::lnd::to_string(::lnd::detail::get_dtype(_op2)),                \
            "expected values of the same kind (real or complex)");           \
    }


/**
 * Asserts that _val1 and _val2 are equal.
 *
 * @throw ValueMismatch  if _val1 and _val2 are not equal.
 */
#define LND_ASSERT_EQ(_val1, _val2)                                            \
    if (_val1 != _val2) {                                                      \
        throw ::lnd::ValueMismatch(__FILE__, __LINE__, __func__, _val1, _val2, \
                                   "expected equal values");                   \
    }


/**
 * Ensures that a memory access is in the bounds.
 *
 * @param _index  the index which is being accessed
 * @param _bound  the bound of the array being accessed
 *
 * @throw OutOfBoundsError  if `_index >= _bound`
 */
#define LND_ENSURE_IN_BOUNDS(_index, _bound)                                 \
    if (_index >= _bound) {                                                  \
        throw ::lnd::OutOfBoundsError(__FILE__, __LINE__, _index, _bound);   \
    }                                                                        \
    static_assert(true,                                                      \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


/**
 * Throws an InvalidStateError with the given message.
 *
 * @param _message  the error message describing the invalid state
 */
#define LND_INVALID_STATE(_message)                                          \
    {                                                                        \
        throw ::lnd::InvalidStateError(__FILE__, __LINE__, __func__,         \
                                       _message);                            \
    }                                                                        \
    static_assert(true,                                                      \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


/**
 * Throws an InvalidStateError if _condition is not satisfied.
 *
 * @param _condition  the condition that needs to hold
 * @param _message  the error message describing the invalid state
 */
#define LND_THROW_IF_INVALID(_condition, _message)                           \
    {                                                                        \
        if (!(_condition)) {                                                 \
            throw ::lnd::InvalidStateError(__FILE__, __LINE__, __func__,     \
                                           _message);                        \
        }                                                                    \
    }                                                                        \
    static_assert(true,                                                      \
                  "This assert is used to counter the false positive extra " \
                  "semi-colon warnings")


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_EXCEPTION_HELPERS_HPP_
