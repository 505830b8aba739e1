// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_CORE_SOLVER_SOLVER_BOILERPLATE_HPP_
#define LND_CORE_SOLVER_SOLVER_BOILERPLATE_HPP_


#include <memory>


#include <linden/core/base/array.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace solver {
namespace detail {


/**
 * Takes ownership of an operator result and returns it as a vector of the
 * solver's value type, converting it if it was computed in another
 * precision.
 */
template <typename ValueType>
std::shared_ptr<const Vector<ValueType>> as_solver_vector(
    std::unique_ptr<Array> in)
{
    if (auto same = dynamic_cast<Vector<ValueType>*>(in.get())) {
        in.release();
        return std::shared_ptr<const Vector<ValueType>>(same);
    }
    return make_temporary_conversion<ValueType>(in.get());
}


/**
 * Creates the scalar handle holding `value`.
 */
template <typename ValueType>
std::shared_ptr<const Vector<ValueType>> solver_scalar(
    std::shared_ptr<const Executor> exec, ValueType value)
{
    return Vector<ValueType>::create_filled(std::move(exec), 1, value);
}


}  // namespace detail
}  // namespace solver
}  // namespace lnd


#endif  // LND_CORE_SOLVER_SOLVER_BOILERPLATE_HPP_
