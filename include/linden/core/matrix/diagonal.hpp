// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_MATRIX_DIAGONAL_HPP_
#define LND_PUBLIC_CORE_MATRIX_DIAGONAL_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace matrix {


/**
 * This class is a utility which efficiently implements the diagonal matrix (a
 * linear operator which scales a vector row wise).
 *
 * Objects of the Diagonal class always represent a square matrix, and
 * require one array to store their values. The adjoint scales with the
 * complex conjugate of the diagonal.
 *
 * @tparam ValueType  precision of matrix elements
 *
 * @ingroup diagonal
 * @ingroup mat_formats
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Diagonal : public LinOp, public EnableCreateMethod<Diagonal<ValueType>> {
    friend class EnableCreateMethod<Diagonal>;

public:
    using value_type = ValueType;

    /**
     * Returns the diagonal of the matrix.
     */
    const std::vector<value_type>& get_diagonal() const
    {
        return diag_->get_data();
    }

protected:
    /**
     * Creates a Diagonal matrix from the values of its diagonal.
     *
     * @param exec  Executor associated to the matrix
     * @param diag  the diagonal values
     * @param flags  eagerness of the matrix
     */
    Diagonal(std::shared_ptr<const Executor> exec,
             std::vector<value_type> diag, const eagerness& flags = {});

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::shared_ptr<const Vector<value_type>> diag_;
    std::shared_ptr<const Vector<value_type>> conj_diag_;
};


}  // namespace matrix
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_MATRIX_DIAGONAL_HPP_
