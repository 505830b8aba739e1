// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/stop/combined.hpp>


#include <linden/core/base/exception_helpers.hpp>


namespace lnd {
namespace stop {


Combined::Combined(const Combined::Factory* factory, const CriterionArgs& args)
    : Criterion(factory->get_executor()), parameters_{factory->get_parameters()}
{
    for (const auto& f : parameters_.criteria) {
        // Ignore the nullptr from the list
        if (f != nullptr) {
            criteria_.push_back(f->generate(args));
        }
    }
    // If the list are empty or all nullptr, throw lnd::NotSupported
    if (criteria_.size() == 0) {
        LND_NOT_SUPPORTED(this);
    }
}


bool Combined::check_impl(uint8 stopping_id, bool set_finalized,
                          stopping_status* stop_status, bool* one_changed,
                          const Updater& updater)
{
    bool one_converged = false;
    uint8 ids{1};
    *one_changed = false;
    for (auto& c : criteria_) {
        bool local_one_changed = false;
        one_converged |= c->check(ids, set_finalized, stop_status,
                                  &local_one_changed, updater);
        *one_changed |= local_one_changed;
        if (one_converged) {
            break;
        }
        ids++;
    }
    return one_converged;
}


std::shared_ptr<const CriterionFactory> combine(
    std::shared_ptr<const Executor> exec,
    std::vector<std::shared_ptr<const CriterionFactory>> criteria)
{
    return Combined::build()
        .with_criteria(std::move(criteria))
        .on(std::move(exec));
}


}  // namespace stop
}  // namespace lnd
