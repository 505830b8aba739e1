// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/sum.hpp>


#include <linden/core/base/exception_helpers.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {


Sum::Sum(std::vector<std::shared_ptr<const LinOp>> operators)
    : LinOp(detail::first_operator(operators)->get_executor(),
            detail::first_operator(operators)->get_size(),
            detail::promote_dtypes(operators),
            detail::first_operator(operators)->get_eagerness()),
      operators_{std::move(operators)}
{
    for (size_type i = 1; i < operators_.size(); ++i) {
        const auto& op = operators_[i];
        LND_ASSERT_SIZES_NAMED(op->get_size() == operators_[0]->get_size(),
                               operators_[0], detail::operator_name(0), op,
                               detail::operator_name(i),
                               "expected equal dimensions");
        LND_THROW_IF_INVALID(
            op->get_eagerness() == operators_[0]->get_eagerness(),
            "all operators of a sum need the same eagerness");
    }
}


std::unique_ptr<Array> Sum::forward_impl(const Array* x) const
{
    auto result = operators_[0]->forward(x);
    for (size_type i = 1; i < operators_.size(); ++i) {
        auto part = operators_[i]->forward(x);
        result = detail::add_arrays(result.get(), part.get());
    }
    return result;
}


std::unique_ptr<Array> Sum::adjoint_impl(const Array* y) const
{
    auto result = operators_[0]->adjoint(y);
    for (size_type i = 1; i < operators_.size(); ++i) {
        auto part = operators_[i]->adjoint(y);
        result = detail::add_arrays(result.get(), part.get());
    }
    return result;
}


std::shared_ptr<const LinOp> sum(
    std::vector<std::shared_ptr<const LinOp>> operators)
{
    return Sum::create(std::move(operators));
}


}  // namespace lnd
