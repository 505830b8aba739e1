// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_PRECISION_DISPATCH_HPP_
#define LND_PUBLIC_CORE_BASE_PRECISION_DISPATCH_HPP_


#include <memory>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {


/**
 * Converts the given array to a Vector<ValueType>.
 *
 * If the array already is a Vector<ValueType>, no copy is made. Arrays of the
 * other precision of the same kind are converted, and real arrays are
 * promoted to complex if ValueType is complex. The conversions are lazy
 * operations for lazy arrays.
 *
 * @tparam ValueType  the value type to convert to
 *
 * @param in  the array to convert
 *
 * @throws DtypeMismatch  if a complex array is converted to a real type
 */
template <typename ValueType>
std::shared_ptr<const Vector<ValueType>> make_temporary_conversion(
    const Array* in)
{
    using real_type = remove_complex<ValueType>;
    if (auto same = dynamic_cast<const Vector<ValueType>*>(in)) {
        return {same, [](const Vector<ValueType>*) {}};
    }
    if (auto other = dynamic_cast<const Vector<next_precision<ValueType>>*>(
            in)) {
        return other->convert_to_next_precision();
    }
    if constexpr (is_complex<ValueType>()) {
        if (auto real_same = dynamic_cast<const Vector<real_type>*>(in)) {
            return real_same->make_complex();
        }
        if (auto real_other =
                dynamic_cast<const Vector<next_precision<real_type>>*>(in)) {
            return real_other->make_complex()->convert_to_next_precision();
        }
    }
    throw DtypeMismatch(__FILE__, __LINE__, __func__, "operator",
                        to_string(dtype_of<ValueType>()), "input",
                        to_string(in->get_dtype()),
                        "complex values cannot be passed to a real operator");
}


/**
 * Converts a result computed in precision ValueType back to the precision of
 * the array it was computed from. The kind (real or complex) of the result
 * is kept.
 *
 * @param result  the result
 * @param input_type  the dtype of the original input
 */
template <typename ValueType>
std::unique_ptr<Array> convert_to_input_precision(
    std::unique_ptr<Vector<ValueType>> result, dtype input_type)
{
    if (is_double_precision(input_type) ==
        is_double_precision(dtype_of<ValueType>())) {
        return result;
    }
    return result->convert_to_next_precision();
}


/**
 * Calls the given function with the given array converted to
 * Vector<ValueType> (see make_temporary_conversion), and converts the result
 * back to the precision of the input.
 *
 * This is how operators evaluate in their own value type while accepting
 * inputs of either precision.
 *
 * @param fn  the given function, taking a `const Vector<ValueType>*` and
 *            returning a `std::unique_ptr<Vector<ValueType>>`
 * @param in  the input array
 */
template <typename ValueType, typename Function>
std::unique_ptr<Array> precision_dispatch(Function fn, const Array* in)
{
    auto converted = make_temporary_conversion<ValueType>(in);
    return convert_to_input_precision<ValueType>(fn(converted.get()),
                                                 in->get_dtype());
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_PRECISION_DISPATCH_HPP_
