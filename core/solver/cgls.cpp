// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/solver/cgls.hpp>


#include <linden/core/log/logger.hpp>
#include <linden/core/stop/stopping_status.hpp>


#include "core/solver/solver_boilerplate.hpp"


namespace lnd {
namespace solver {


template <typename ValueType>
result<ValueType> Cgls<ValueType>::solve_impl(
    std::shared_ptr<const Vector<ValueType>> b,
    std::shared_ptr<const Vector<ValueType>> x) const
{
    using detail::as_solver_vector;
    const auto system_matrix = this->get_system_matrix();
    const auto damping = parameters_.damping;
    const auto sq_damping = static_cast<ValueType>(damping * damping);
    const bool damped = damping != zero<absolute_type>();

    // s = b - A x
    std::shared_ptr<const Vector<ValueType>> s =
        b->sub(as_solver_vector<ValueType>(system_matrix->forward(x)).get());
    // r = A^H s - d^2 x
    auto normal_residual = [&](const Vector<ValueType>* data_residual,
                               const Vector<ValueType>* solution) {
        auto res = as_solver_vector<ValueType>(
            system_matrix->adjoint(data_residual));
        if (damped) {
            return std::shared_ptr<const Vector<ValueType>>(
                res->sub(solution->scale(sq_damping).get()));
        }
        return res;
    };
    auto r = normal_residual(s.get(), x.get());
    auto c = r;
    auto q = as_solver_vector<ValueType>(system_matrix->forward(c));
    std::shared_ptr<const Vector<ValueType>> kold =
        r->compute_conj_dot(r.get());

    auto stop_criterion =
        this->generate_stop_criterion(b, x.get(), s.get());

    size_type iter = 0;
    stopping_status status;
    while (true) {
        bool one_changed{};
        const bool stopped = stop_criterion->update()
                                 .num_iterations(iter)
                                 .residual(s.get())
                                 .implicit_sq_residual_norm(kold.get())
                                 .solution(x.get())
                                 .check(1, true, &status, &one_changed);
        this->template log<log::Logger::iteration_complete>(
            this, iter, s.get(), x.get(), kold.get(), &status, stopped);
        if (stopped) {
            break;
        }

        // alpha = kold / (q^H q + d^2 c^H c)
        std::shared_ptr<const Vector<ValueType>> denom =
            q->compute_conj_dot(q.get());
        if (damped) {
            denom = denom->add(
                c->compute_conj_dot(c.get())->scale(sq_damping).get());
        }
        auto alpha = kold->divide(denom.get());
        x = x->add_scaled(alpha.get(), c.get());
        s = s->sub_scaled(alpha.get(), q.get());
        r = normal_residual(s.get(), x.get());
        std::shared_ptr<const Vector<ValueType>> k =
            r->compute_conj_dot(r.get());
        auto beta = k->divide(kold.get());
        c = r->add_scaled(beta.get(), c.get());
        q = as_solver_vector<ValueType>(system_matrix->forward(c));
        kold = std::move(k);
        ++iter;
    }

    return {std::move(x), status, iter, s->compute_norm2()};
}


#define LND_DECLARE_CGLS(_type) class Cgls<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_CGLS);


}  // namespace solver
}  // namespace lnd
