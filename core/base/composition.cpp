// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/composition.hpp>


#include <linden/core/base/exception_helpers.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {
namespace {


dim<2> compute_size(const std::vector<std::shared_ptr<const LinOp>>& ops)
{
    detail::first_operator(ops);
    for (size_type i = 0; i + 1 < ops.size(); ++i) {
        const bool conformant =
            ops[i]->get_size()[1] == ops[i + 1]->get_size()[0];
        LND_ASSERT_SIZES_NAMED(conformant, ops[i], detail::operator_name(i),
                               ops[i + 1],
                               detail::operator_name(i + 1),
                               "expected matching inner dimensions");
    }
    return {ops.front()->get_size()[0], ops.back()->get_size()[1]};
}


eagerness compute_eagerness(
    const std::vector<std::shared_ptr<const LinOp>>& ops)
{
    const auto& first = detail::first_operator(ops)->get_eagerness();
    const auto& last = ops.back()->get_eagerness();
    return {last.realize_forward, first.realize_adjoint,
            last.defer_forward_input, first.defer_adjoint_input};
}


}  // anonymous namespace


Composition::Composition(std::vector<std::shared_ptr<const LinOp>> operators)
    : LinOp(detail::first_operator(operators)->get_executor(),
            compute_size(operators), detail::promote_dtypes(operators),
            compute_eagerness(operators)),
      operators_{std::move(operators)}
{}


std::unique_ptr<Array> Composition::forward_impl(const Array* x) const
{
    auto result = operators_.back()->forward(x);
    for (auto it = operators_.rbegin() + 1; it != operators_.rend(); ++it) {
        result = (*it)->forward(result);
    }
    return result;
}


std::unique_ptr<Array> Composition::adjoint_impl(const Array* y) const
{
    auto result = operators_.front()->adjoint(y);
    for (auto it = operators_.begin() + 1; it != operators_.end(); ++it) {
        result = (*it)->adjoint(result);
    }
    return result;
}


std::shared_ptr<const LinOp> chain(
    std::vector<std::shared_ptr<const LinOp>> operators)
{
    return Composition::create(std::move(operators));
}


}  // namespace lnd
