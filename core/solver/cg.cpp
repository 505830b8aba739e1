// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/solver/cg.hpp>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/log/logger.hpp>
#include <linden/core/stop/stopping_status.hpp>


#include "core/solver/solver_boilerplate.hpp"


namespace lnd {
namespace solver {


template <typename ValueType>
Cg<ValueType>::Cg(const Factory* factory,
                  std::shared_ptr<const LinOp> system_matrix)
    : SolverBase<ValueType>(factory->get_executor(), std::move(system_matrix),
                            factory->get_parameters().criteria),
      parameters_{factory->get_parameters()}
{
    LND_ASSERT_IS_SQUARE_MATRIX(this->get_system_matrix());
}


template <typename ValueType>
result<ValueType> Cg<ValueType>::solve_impl(
    std::shared_ptr<const Vector<ValueType>> b,
    std::shared_ptr<const Vector<ValueType>> x) const
{
    using detail::as_solver_vector;
    const auto exec = this->get_executor();
    const auto system_matrix = this->get_system_matrix();

    // r = b - A x
    std::shared_ptr<const Vector<ValueType>> r =
        b->sub(as_solver_vector<ValueType>(system_matrix->forward(x)).get());
    std::shared_ptr<const Vector<ValueType>> p =
        Vector<ValueType>::create_filled(exec, r->get_length(),
                                         zero<ValueType>());
    if (r->is_lazy()) {
        p = p->as_lazy();
    }
    std::shared_ptr<const Vector<ValueType>> prev_rho =
        detail::solver_scalar(exec, one<ValueType>());

    auto stop_criterion =
        this->generate_stop_criterion(b, x.get(), r.get());

    size_type iter = 0;
    stopping_status status;
    while (true) {
        std::shared_ptr<const Vector<ValueType>> rho =
            r->compute_conj_dot(r.get());
        bool one_changed{};
        const bool stopped = stop_criterion->update()
                                 .num_iterations(iter)
                                 .residual(r.get())
                                 .implicit_sq_residual_norm(rho.get())
                                 .solution(x.get())
                                 .check(1, true, &status, &one_changed);
        this->template log<log::Logger::iteration_complete>(
            this, iter, r.get(), x.get(), rho.get(), &status, stopped);
        if (stopped) {
            break;
        }

        // p = r + rho / prev_rho * p
        p = r->add_scaled(rho->divide(prev_rho.get()).get(), p.get());
        auto q = as_solver_vector<ValueType>(system_matrix->forward(p));
        // alpha = rho / p^H q
        auto alpha = rho->divide(p->compute_conj_dot(q.get()).get());
        x = x->add_scaled(alpha.get(), p.get());
        r = r->sub_scaled(alpha.get(), q.get());
        prev_rho = std::move(rho);
        ++iter;
    }

    return {std::move(x), status, iter, r->compute_norm2()};
}


#define LND_DECLARE_CG(_type) class Cg<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_CG);


}  // namespace solver
}  // namespace lnd
