// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_SOLVER_SOLVER_BASE_HPP_
#define LND_PUBLIC_CORE_SOLVER_SOLVER_BASE_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/stop/criterion.hpp>
#include <linden/core/stop/stopping_status.hpp>


namespace lnd {
/**
 * @brief The Solver namespace.
 *
 * @ingroup solvers
 */
namespace solver {


/**
 * The outcome of a solve.
 *
 * Reaching the iteration limit is not an error: the solution computed so far
 * is returned, and `status` records that the solve stopped without
 * converging.
 *
 * @tparam ValueType  precision of the solution
 */
template <typename ValueType>
struct result {
    using value_type = ValueType;
    using absolute_type = remove_complex<ValueType>;

    /**
     * The computed solution. For a lazy right-hand side, this is a lazy
     * handle, nothing was realized except the scalars the stopping criteria
     * needed.
     */
    std::shared_ptr<const Vector<value_type>> solution;

    /**
     * The stopping status: converged or stopped, and the id of the
     * criterion which ended the solve.
     */
    stopping_status status;

    /**
     * The number of iterations performed.
     */
    size_type num_iterations{};

    /**
     * The norm of the final residual b - A x, a scalar handle which is lazy
     * if the solve was lazy.
     */
    std::shared_ptr<const Vector<absolute_type>> residual_norm;

    /**
     * Checks whether a convergence criterion ended the solve.
     */
    bool has_converged() const noexcept { return status.has_converged(); }
};


/**
 * The SolverBase is the base of the iterative solvers. A solver is a LinOp
 * approximating the (pseudo-)inverse of its system matrix A: if A is of size
 * M x N, the solver is of size N x M. Its forward map solves A x = b starting
 * from a zero initial guess, its adjoint map is not supported.
 *
 * solve() gives access to the whole outcome of the solve, including the
 * stopping status.
 *
 * @tparam ValueType  precision the solver computes in
 *
 * @ingroup solvers
 * @ingroup LinOp
 */
template <typename ValueType>
class SolverBase : public LinOp {
public:
    using value_type = ValueType;
    using absolute_type = remove_complex<ValueType>;
    using vector_type = Vector<ValueType>;

    /**
     * Returns the system matrix A.
     */
    std::shared_ptr<const LinOp> get_system_matrix() const noexcept
    {
        return system_matrix_;
    }

    /**
     * Returns the stopping criterion factory of the solver.
     */
    std::shared_ptr<const stop::CriterionFactory> get_stop_criterion_factory()
        const noexcept
    {
        return stop_criterion_factory_;
    }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override
    {
        return {system_matrix_};
    }

    /**
     * Solves A x = b.
     *
     * @param b  the right-hand side, of length M
     * @param x0  the initial guess, of length N, zero if it is null
     *
     * @return the outcome of the solve
     *
     * @throws DimensionMismatch  if b or x0 are of the wrong length
     * @throws DtypeMismatch  if b or x0 are complex and ValueType is real
     */
    result<ValueType> solve(ptr_param<const Array> b,
                            ptr_param<const Array> x0 = nullptr) const;

protected:
    /**
     * Creates the solver.
     *
     * @param exec  the executor of the solver
     * @param system_matrix  the system matrix A
     * @param criteria  the stopping criterion factories; they are combined
     *                  if there is more than one
     *
     * @throws NotSupported  if no stopping criterion is given
     */
    SolverBase(std::shared_ptr<const Executor> exec,
               std::shared_ptr<const LinOp> system_matrix,
               const std::vector<std::shared_ptr<const stop::CriterionFactory>>&
                   criteria);

    /**
     * Runs the iteration.
     *
     * @param b  the right-hand side
     * @param x  the initial guess, lazy if b is lazy
     */
    /**
     * Generates the stop criterion for one solve. The criterion reports to
     * the loggers of this solver.
     */
    std::unique_ptr<stop::Criterion> generate_stop_criterion(
        std::shared_ptr<const vector_type> b, const vector_type* x,
        const vector_type* initial_residual) const;

    virtual result<ValueType> solve_impl(
        std::shared_ptr<const vector_type> b,
        std::shared_ptr<const vector_type> x) const = 0;

    std::unique_ptr<Array> forward_impl(const Array* b) const override;

    /**
     * @throws NotImplemented  always
     */
    std::unique_ptr<Array> adjoint_impl(const Array* x) const override;

private:
    std::shared_ptr<const LinOp> system_matrix_;
    std::shared_ptr<const stop::CriterionFactory> stop_criterion_factory_;
};


}  // namespace solver
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_SOLVER_SOLVER_BASE_HPP_
