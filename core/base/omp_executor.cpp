// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <omp.h>


#include <linden/core/base/executor.hpp>
#include <linden/core/lazy/node.hpp>


namespace lnd {


int OmpExecutor::get_num_threads() const noexcept
{
    return num_threads_ > 0 ? num_threads_ : omp_get_max_threads();
}


std::vector<std::exception_ptr> OmpExecutor::run(
    const std::vector<const lazy::Node*>& nodes) const
{
    std::vector<std::exception_ptr> errors(nodes.size());
    const auto num_nodes = static_cast<int64>(nodes.size());
#pragma omp parallel for num_threads(this->get_num_threads()) schedule(dynamic)
    for (int64 i = 0; i < num_nodes; ++i) {
        errors[i] = evaluate_node(nodes[i]);
    }
    return errors;
}


}  // namespace lnd
