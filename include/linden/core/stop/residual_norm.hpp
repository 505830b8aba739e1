// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_STOP_RESIDUAL_NORM_HPP_
#define LND_PUBLIC_CORE_STOP_RESIDUAL_NORM_HPP_


#include <memory>


#include <linden/core/base/math.hpp>
#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace stop {


/**
 * The mode for the residual norm criterion.
 *
 * - absolute:        Check for tolerance against residual norm.
 *                    $ || r || < \tau $
 *
 * - initial_resnorm: Check for tolerance relative to the initial residual norm.
 *                    $ \frac{|| r ||}{|| r_0||} < \tau $
 *
 * - rhs_norm:        Check for tolerance relative to the rhs norm.
 *                    $ \frac{|| r ||}{|| b ||} < \tau $
 *
 * @ingroup stop
 */
enum class mode { absolute, initial_resnorm, rhs_norm };


/**
 * The ResidualNormBase class provides a framework for stopping criteria
 * related to the residual norm. These criteria differ in the way they
 * initialize starting_tau_, so in the value they compare the
 * residual norm against.
 * The provided check_impl uses the actual residual to check for convergence.
 *
 * The baseline is computed, and realized, when the criterion is generated.
 * Every check realizes one scalar, the norm of the current residual.
 *
 * @ingroup stop
 */
template <typename ValueType>
class ResidualNormBase : public Criterion {
public:
    using absolute_type = remove_complex<ValueType>;

    /**
     * Returns the norm the residual norm is compared against, before the
     * reduction factor is applied.
     */
    absolute_type get_starting_tau() const noexcept { return starting_tau_; }

    /**
     * Returns the residual norm seen by the last check, or zero if the
     * criterion was not checked yet.
     */
    absolute_type get_last_tau() const noexcept { return last_tau_; }

protected:
    bool check_impl(uint8 stopping_id, bool set_finalized,
                    stopping_status* stop_status, bool* one_changed,
                    const Criterion::Updater& updater) override;

    /**
     * Marks the status as converged if tau reached the threshold.
     */
    bool check_tau(absolute_type tau, uint8 stopping_id, bool set_finalized,
                   stopping_status* stop_status, bool* one_changed);

    /**
     * @throws NotSupported  if the arguments needed by the baseline are
     *                       missing
     */
    explicit ResidualNormBase(std::shared_ptr<const Executor> exec,
                              const CriterionArgs& args,
                              absolute_type reduction_factor, mode baseline);

    absolute_type reduction_factor_{};
    absolute_type starting_tau_{};
    absolute_type last_tau_{};

private:
    mode baseline_{mode::rhs_norm};
    std::shared_ptr<const LinOp> system_matrix_{};
    std::shared_ptr<const Array> b_{};
};


/**
 * The ResidualNorm class is a stopping criterion which
 * stops the iteration process when the actual residual norm is below a
 * certain threshold relative to
 * 1. the norm of the right-hand side, norm(residual) <= reduction_factor *
 *    norm(right_hand_side).
 * 2. the initial residual, norm(residual) <= reduction_factor *
 *    norm(initial_residual).
 * 3. one,  norm(residual) <= reduction_factor.
 *
 * For better performance, the checks are run on the residual norm the solver
 * passes, else on the residual, and only if neither is available on the
 * residual computed from the solution.
 *
 * @note To use this stopping criterion there are some dependencies. The
 * constructor depends on either `b` or the `initial_residual` in order to
 * compute their norms. If this is not correctly provided, an exception
 * ::lnd::NotSupported() is thrown.
 *
 * @ingroup stop
 */
template <typename ValueType = default_precision>
class ResidualNorm : public ResidualNormBase<ValueType> {
public:
    using absolute_type = remove_complex<ValueType>;

    LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
    {
        /**
         * Residual norm reduction factor
         */
        absolute_type LND_FACTORY_PARAMETER(
            reduction_factor, static_cast<absolute_type>(1e-15));

        /**
         * The quantity the reduction is relative to. Choices include
         * "mode::rhs_norm", "mode::initial_resnorm" and "mode::absolute"
         */
        mode LND_FACTORY_PARAMETER(baseline, mode::rhs_norm);
    };
    LND_ENABLE_CRITERION_FACTORY(ResidualNorm<ValueType>, parameters, Factory);
    LND_ENABLE_BUILD_METHOD(Factory);

protected:
    explicit ResidualNorm(const Factory* factory, const CriterionArgs& args)
        : ResidualNormBase<ValueType>(
              factory->get_executor(), args,
              factory->get_parameters().reduction_factor,
              factory->get_parameters().baseline),
          parameters_{factory->get_parameters()}
    {}
};


/**
 * The ImplicitResidualNorm class is a stopping criterion which
 * stops the iteration process when the implicit residual norm is below a
 * certain threshold relative to
 * 1. the norm of the right-hand side, implicit_resnorm <= reduction_factor *
 *    norm(right_hand_side).
 * 2. the initial residual, implicit_resnorm <= reduction_factor *
 *    norm(initial_residual).
 * 3. one,  implicit_resnorm <= reduction_factor.
 *
 * The implicit residual norm is the square root of the squared residual
 * norm the solver tracks, e.g. ||A^H r - damp^2 x||^2 for Cgls, so checking
 * it needs no additional operator application.
 *
 * @note To use this stopping criterion, it is required to update the squared
 * residual norm, otherwise an exception ::lnd::NotSupported() is thrown.
 *
 * @ingroup stop
 */
template <typename ValueType = default_precision>
class ImplicitResidualNorm : public ResidualNormBase<ValueType> {
public:
    using absolute_type = remove_complex<ValueType>;

    LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
    {
        /**
         * Implicit Residual norm goal
         */
        absolute_type LND_FACTORY_PARAMETER(
            reduction_factor, static_cast<absolute_type>(1e-15));

        /**
         * The quantity the reduction is relative to. Choices include
         * "mode::rhs_norm", "mode::initial_resnorm" and "mode::absolute"
         */
        mode LND_FACTORY_PARAMETER(baseline, mode::rhs_norm);
    };
    LND_ENABLE_CRITERION_FACTORY(ImplicitResidualNorm<ValueType>, parameters,
                                 Factory);
    LND_ENABLE_BUILD_METHOD(Factory);

protected:
    // check_impl needs to be overwritten again since we focus on the implicit
    // residual here
    bool check_impl(uint8 stopping_id, bool set_finalized,
                    stopping_status* stop_status, bool* one_changed,
                    const Criterion::Updater& updater) override;

    explicit ImplicitResidualNorm(const Factory* factory,
                                  const CriterionArgs& args)
        : ResidualNormBase<ValueType>(
              factory->get_executor(), args,
              factory->get_parameters().reduction_factor,
              factory->get_parameters().baseline),
          parameters_{factory->get_parameters()}
    {}
};


/**
 * Creates the factory of a ResidualNorm criterion relative to the norm of
 * the right-hand side.
 */
template <typename ValueType = default_precision>
std::unique_ptr<typename ResidualNorm<ValueType>::Factory>
relative_residual_norm(std::shared_ptr<const Executor> exec,
                       remove_complex<ValueType> tolerance)
{
    return ResidualNorm<ValueType>::build()
        .with_reduction_factor(tolerance)
        .with_baseline(mode::rhs_norm)
        .on(std::move(exec));
}


/**
 * Creates the factory of a ResidualNorm criterion with an absolute
 * threshold.
 */
template <typename ValueType = default_precision>
std::unique_ptr<typename ResidualNorm<ValueType>::Factory>
absolute_residual_norm(std::shared_ptr<const Executor> exec,
                       remove_complex<ValueType> tolerance)
{
    return ResidualNorm<ValueType>::build()
        .with_reduction_factor(tolerance)
        .with_baseline(mode::absolute)
        .on(std::move(exec));
}


}  // namespace stop
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_STOP_RESIDUAL_NORM_HPP_
