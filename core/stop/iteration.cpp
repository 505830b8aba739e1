// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/stop/iteration.hpp>


namespace lnd {
namespace stop {


bool Iteration::check_impl(uint8 stopping_id, bool set_finalized,
                           stopping_status* stop_status, bool* one_changed,
                           const Updater& updater)
{
    bool result = updater.num_iterations_ >= parameters_.max_iters;
    if (result) {
        stop_status->stop(stopping_id, set_finalized);
        *one_changed = true;
    }
    return result;
}


std::unique_ptr<Iteration::Factory> max_iters(
    std::shared_ptr<const Executor> exec, size_type count)
{
    return Iteration::build().with_max_iters(count).on(std::move(exec));
}


}  // namespace stop
}  // namespace lnd
