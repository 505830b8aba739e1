// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_SOLVER_CGLS_HPP_
#define LND_PUBLIC_CORE_SOLVER_CGLS_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/solver/solver_base.hpp>
#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace solver {


/**
 * CGLS or the conjugate gradient method for least squares is an iterative
 * type Krylov subspace method which solves the damped least squares problem
 *
 * min_x ||b - A x||^2 + damping^2 ||x||^2
 *
 * for a system matrix A of any shape, by applying the conjugate gradient
 * method to the normal equations (A^H A + damping^2 I) x = A^H b without
 * forming A^H A.
 *
 * Each iteration applies the forward and the adjoint map of A once. All
 * coefficients of the method are scalar handles, so for a lazy right-hand
 * side the whole iteration is recorded in a single deferred graph, and only
 * the stopping criteria realize scalars.
 *
 * The stopping criteria are checked with the data residual r = b - A x as
 * `residual`, and the squared norm of the normal equation residual
 * s = A^H r - damping^2 x as `implicit_sq_residual_norm`.
 *
 * @tparam ValueType  precision of the elements of the system matrix
 *
 * @ingroup solvers
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Cgls : public SolverBase<ValueType> {
public:
    using value_type = ValueType;
    using absolute_type = remove_complex<ValueType>;

    LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
    {
        /**
         * Criterion factories.
         */
        std::vector<std::shared_ptr<const stop::CriterionFactory>>
            LND_FACTORY_PARAMETER_VECTOR(criteria, nullptr);

        /**
         * Damping coefficient of the Tikhonov regularization.
         */
        absolute_type LND_FACTORY_PARAMETER(damping, zero<absolute_type>());
    };
    LND_ENABLE_LIN_OP_FACTORY(Cgls, parameters, Factory);
    LND_ENABLE_BUILD_METHOD(Factory);

protected:
    result<ValueType> solve_impl(
        std::shared_ptr<const Vector<ValueType>> b,
        std::shared_ptr<const Vector<ValueType>> x) const override;

    explicit Cgls(const Factory* factory,
                  std::shared_ptr<const LinOp> system_matrix)
        : SolverBase<ValueType>(factory->get_executor(),
                                std::move(system_matrix),
                                factory->get_parameters().criteria),
          parameters_{factory->get_parameters()}
    {}
};


}  // namespace solver
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_SOLVER_CGLS_HPP_
