// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_MATRIX_ZERO_HPP_
#define LND_PUBLIC_CORE_MATRIX_ZERO_HPP_


#include <memory>


#include <linden/core/base/lin_op.hpp>


namespace lnd {
namespace matrix {


/**
 * The Zero matrix maps every vector to the zero vector of length M. It does
 * not store any values.
 *
 * The result of a lazy input is lazy as well, so a Zero matrix can be part of
 * a deferred graph like any other operator.
 *
 * @tparam ValueType  precision of matrix elements
 *
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Zero : public LinOp, public EnableCreateMethod<Zero<ValueType>> {
    friend class EnableCreateMethod<Zero>;

public:
    using value_type = ValueType;

protected:
    /**
     * Creates a Zero matrix.
     *
     * @param exec  Executor associated to the matrix
     * @param size  size of the matrix
     * @param flags  eagerness of the matrix
     */
    Zero(std::shared_ptr<const Executor> exec, const dim<2>& size,
         const eagerness& flags = {});

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;
};


}  // namespace matrix
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_MATRIX_ZERO_HPP_
