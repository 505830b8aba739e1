// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_MATRIX_IDENTITY_HPP_
#define LND_PUBLIC_CORE_MATRIX_IDENTITY_HPP_


#include <memory>


#include <linden/core/base/lin_op.hpp>


namespace lnd {
namespace matrix {


/**
 * This class is a utility which efficiently implements the identity matrix (a
 * linear operator which maps each vector to itself).
 *
 * Objects of the Identity class always represent a square matrix, and
 * don't require any storage for their values. Both maps return a new handle
 * to the input values.
 *
 * @tparam ValueType  precision of matrix elements
 *
 * @ingroup identity
 * @ingroup mat_formats
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Identity : public LinOp, public EnableCreateMethod<Identity<ValueType>> {
    friend class EnableCreateMethod<Identity>;

public:
    using value_type = ValueType;

protected:
    /**
     * Creates an Identity matrix of the specified size.
     *
     * @param exec  Executor associated to the matrix
     * @param size  size of the matrix
     * @param flags  eagerness of the matrix
     */
    Identity(std::shared_ptr<const Executor> exec, size_type size,
             const eagerness& flags = {});

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;
};


}  // namespace matrix
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_MATRIX_IDENTITY_HPP_
