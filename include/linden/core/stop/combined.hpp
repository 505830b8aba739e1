// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_STOP_COMBINED_HPP_
#define LND_PUBLIC_CORE_STOP_COMBINED_HPP_


#include <memory>
#include <vector>


#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace stop {


/**
 * The Combined class is used to combine multiple criterions together through an
 * OR operation. The typical use case is to stop the iteration process if any
 * of the criteria is fulfilled, e.g. a number of iterations, the relative
 * residual norm has reached a threshold, etc.
 *
 * The criteria are checked in order, the first one to stop the iteration
 * determines the stopping id (its position in the list, starting at 1).
 *
 * @ingroup stop
 */
class Combined : public Criterion {
public:
    LND_CREATE_FACTORY_PARAMETERS(parameters, Factory)
    {
        /**
         * Criterion factories to combine
         */
        std::vector<std::shared_ptr<const CriterionFactory>>
            LND_FACTORY_PARAMETER_VECTOR(criteria, nullptr);
    };
    LND_ENABLE_CRITERION_FACTORY(Combined, parameters, Factory);
    LND_ENABLE_BUILD_METHOD(Factory);

    /**
     * Returns the combined criteria.
     */
    const std::vector<std::unique_ptr<Criterion>>& get_criteria() const
        noexcept
    {
        return criteria_;
    }

protected:
    bool check_impl(uint8 stopping_id, bool set_finalized,
                    stopping_status* stop_status, bool* one_changed,
                    const Updater&) override;

    /**
     * @throws NotSupported  if no criterion factory (other than nullptr) is
     *                       given
     */
    explicit Combined(const Factory* factory, const CriterionArgs& args);

private:
    std::vector<std::unique_ptr<Criterion>> criteria_{};
};


/**
 * Combines the given criterion factories into a single factory.
 *
 * @param exec  the executor of the combined factory
 * @param criteria  the criterion factories
 */
std::shared_ptr<const CriterionFactory> combine(
    std::shared_ptr<const Executor> exec,
    std::vector<std::shared_ptr<const CriterionFactory>> criteria);


}  // namespace stop
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_STOP_COMBINED_HPP_
