// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_STOP_ITERATION_HPP_
#define LND_PUBLIC_CORE_STOP_ITERATION_HPP_


#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace stop {

/**
 * The Iteration class is a stopping criterion which stops the iteration
 * process after a preset number of iterations.
 *
 * @note to use this stopping criterion, it is required to update the number
 * of iterations.
 *
 * @ingroup stop
 */
class Iteration : public Criterion {
public:
    LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
    {
        /**
         * Maximum number of iterations
         */
        size_type LND_FACTORY_PARAMETER(max_iters, 0);
    };
    LND_ENABLE_CRITERION_FACTORY(Iteration, parameters, Factory);
    LND_ENABLE_BUILD_METHOD(Factory);

protected:
    bool check_impl(uint8 stopping_id, bool set_finalized,
                    stopping_status* stop_status, bool* one_changed,
                    const Updater& updater) override;

    explicit Iteration(std::shared_ptr<const Executor> exec)
        : Criterion(std::move(exec))
    {}

    explicit Iteration(const Factory* factory, const CriterionArgs& args)
        : Criterion(factory->get_executor()),
          parameters_{factory->get_parameters()}
    {}
};


/**
 * Creates the factory of an Iteration criterion with the given maximum
 * number of iterations.
 */
std::unique_ptr<Iteration::Factory> max_iters(
    std::shared_ptr<const Executor> exec, size_type count);


}  // namespace stop
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_STOP_ITERATION_HPP_
