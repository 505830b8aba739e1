// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/log/convergence.hpp>


#include <linden/core/base/vector.hpp>
#include <linden/core/stop/criterion.hpp>
#include <linden/core/stop/stopping_status.hpp>


#include "core/base/dispatch_helper.hpp"


namespace lnd {
namespace log {


void Convergence::on_criterion_check_completed(
    const stop::Criterion* criterion, const size_type& num_iterations,
    const Array* residual, const Array* residual_norm, const Array* solution,
    const uint8& stopping_id, const bool& set_finalized,
    const stopping_status* status, const bool& one_changed,
    const bool& stopped) const
{
    this->record(num_iterations, residual, residual_norm, nullptr, status,
                 stopped);
}


void Convergence::on_iteration_complete(const LinOp* solver,
                                        const size_type& num_iterations,
                                        const Array* residual,
                                        const Array* solution,
                                        const Array* implicit_sq_residual_norm,
                                        const stopping_status* status,
                                        const bool& stopped) const
{
    this->record(num_iterations, residual, nullptr, implicit_sq_residual_norm,
                 status, stopped);
}


void Convergence::record(const size_type& num_iterations,
                         const Array* residual, const Array* residual_norm,
                         const Array* implicit_sq_residual_norm,
                         const stopping_status* status, bool stopped) const
{
    if (!stopped) {
        return;
    }
    convergence_status_ = status != nullptr && status->has_converged();
    num_iterations_ = num_iterations;
    if (residual != nullptr) {
        residual_ = residual->clone();
    }
    if (implicit_sq_residual_norm != nullptr) {
        implicit_sq_resnorm_ = implicit_sq_residual_norm->clone();
    }
    if (residual_norm != nullptr) {
        residual_norm_ = residual_norm->clone();
    } else if (residual != nullptr) {
        residual_norm_ = vector_dispatch(
            residual, [](auto dense_r) -> std::unique_ptr<Array> {
                return dense_r->compute_norm2();
            });
    }
}


}  // namespace log
}  // namespace lnd
