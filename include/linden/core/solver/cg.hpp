// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_SOLVER_CG_HPP_
#define LND_PUBLIC_CORE_SOLVER_CG_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>
#include <linden/core/solver/solver_base.hpp>
#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace solver {


/**
 * CG or the conjugate gradient method is an iterative type Krylov subspace
 * method which is suitable for symmetric positive definite problems.
 *
 * Though this method performs very well for symmetric positive definite
 * matrices, it is in general not suitable for general matrices.
 *
 * The implementation uses the forward map of the system matrix only, once
 * per iteration.
 *
 * @tparam ValueType  precision of the elements of the system matrix
 *
 * @ingroup solvers
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Cg : public SolverBase<ValueType> {
public:
    using value_type = ValueType;

    LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
    {
        /**
         * Criterion factories.
         */
        std::vector<std::shared_ptr<const stop::CriterionFactory>>
            LND_FACTORY_PARAMETER_VECTOR(criteria, nullptr);
    };
    LND_ENABLE_LIN_OP_FACTORY(Cg, parameters, Factory);
    LND_ENABLE_BUILD_METHOD(Factory);

protected:
    result<ValueType> solve_impl(
        std::shared_ptr<const Vector<ValueType>> b,
        std::shared_ptr<const Vector<ValueType>> x) const override;

    /**
     * @throws BadDimension  if the system matrix is not square
     */
    explicit Cg(const Factory* factory,
                std::shared_ptr<const LinOp> system_matrix);
};


}  // namespace solver
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_SOLVER_CG_HPP_
