// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/stop/residual_norm.hpp>


#include <type_traits>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


#include "core/base/dispatch_helper.hpp"


namespace lnd {
namespace stop {
namespace {


/**
 * Computes ||in|| and realizes it.
 */
template <typename AbsoluteType>
AbsoluteType realize_norm(const Array* in)
{
    return vector_dispatch(in, [](auto dense) -> AbsoluteType {
        return static_cast<AbsoluteType>(dense->compute_norm2()->value());
    });
}


/**
 * Computes ||b - A x|| and realizes it.
 */
template <typename AbsoluteType>
AbsoluteType realize_residual_norm(const LinOp* system_matrix, const Array* b,
                                   const Array* x)
{
    auto ax = system_matrix->forward(x);
    return vector_dispatch(b, [&](auto dense_b) -> AbsoluteType {
        using value_type =
            typename std::decay_t<decltype(*dense_b)>::value_type;
        auto dense_ax = make_temporary_conversion<value_type>(ax.get());
        return static_cast<AbsoluteType>(
            dense_b->sub(dense_ax.get())->compute_norm2()->value());
    });
}


}  // anonymous namespace


template <typename ValueType>
ResidualNormBase<ValueType>::ResidualNormBase(
    std::shared_ptr<const Executor> exec, const CriterionArgs& args,
    absolute_type reduction_factor, mode baseline)
    : Criterion(std::move(exec)),
      reduction_factor_{reduction_factor},
      baseline_{baseline},
      system_matrix_{args.system_matrix},
      b_{args.b}
{
    switch (baseline_) {
    case mode::initial_resnorm: {
        if (args.initial_residual == nullptr) {
            if (args.system_matrix == nullptr || args.b == nullptr ||
                args.x == nullptr) {
                LND_NOT_SUPPORTED(nullptr);
            } else {
                this->starting_tau_ = realize_residual_norm<absolute_type>(
                    args.system_matrix.get(), args.b.get(), args.x);
            }
        } else {
            this->starting_tau_ =
                realize_norm<absolute_type>(args.initial_residual);
        }
        break;
    }
    case mode::rhs_norm: {
        if (args.b == nullptr) {
            LND_NOT_SUPPORTED(nullptr);
        }
        this->starting_tau_ = realize_norm<absolute_type>(args.b.get());
        break;
    }
    case mode::absolute: {
        this->starting_tau_ = one<absolute_type>();
        break;
    }
    default:
        LND_NOT_SUPPORTED(nullptr);
    }
}


template <typename ValueType>
bool ResidualNormBase<ValueType>::check_impl(
    uint8 stopping_id, bool set_finalized, stopping_status* stop_status,
    bool* one_changed, const Criterion::Updater& updater)
{
    absolute_type tau{};
    if (updater.residual_norm_ != nullptr) {
        tau = vector_dispatch(
            updater.residual_norm_, [](auto dense_tau) -> absolute_type {
                return static_cast<absolute_type>(abs(dense_tau->value()));
            });
    } else if (updater.residual_ != nullptr) {
        tau = realize_norm<absolute_type>(updater.residual_);
    } else if (updater.solution_ != nullptr && system_matrix_ != nullptr &&
               b_ != nullptr) {
        tau = realize_residual_norm<absolute_type>(
            system_matrix_.get(), b_.get(), updater.solution_);
    } else {
        LND_NOT_SUPPORTED(nullptr);
    }
    return this->check_tau(tau, stopping_id, set_finalized, stop_status,
                           one_changed);
}


template <typename ValueType>
bool ResidualNormBase<ValueType>::check_tau(absolute_type tau,
                                            uint8 stopping_id,
                                            bool set_finalized,
                                            stopping_status* stop_status,
                                            bool* one_changed)
{
    last_tau_ = tau;
    if (tau <= reduction_factor_ * starting_tau_) {
        stop_status->converge(stopping_id, set_finalized);
        *one_changed = true;
        return true;
    }
    return false;
}


template <typename ValueType>
bool ImplicitResidualNorm<ValueType>::check_impl(
    uint8 stopping_id, bool set_finalized, stopping_status* stop_status,
    bool* one_changed, const Criterion::Updater& updater)
{
    using absolute_type = typename ResidualNormBase<ValueType>::absolute_type;
    if (updater.implicit_sq_residual_norm_ == nullptr) {
        LND_NOT_SUPPORTED(nullptr);
    }
    const auto tau = vector_dispatch(
        updater.implicit_sq_residual_norm_,
        [](auto dense_tau) -> absolute_type {
            return static_cast<absolute_type>(
                sqrt(abs(dense_tau->value())));
        });
    return this->check_tau(tau, stopping_id, set_finalized, stop_status,
                           one_changed);
}


#define LND_DECLARE_RESIDUAL_NORM(_type) class ResidualNormBase<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_RESIDUAL_NORM);


#define LND_DECLARE_IMPLICIT_RESIDUAL_NORM(_type) \
    class ImplicitResidualNorm<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_IMPLICIT_RESIDUAL_NORM);


}  // namespace stop
}  // namespace lnd
