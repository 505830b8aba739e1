// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/conjugate.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {


Conjugate::Conjugate(std::shared_ptr<const LinOp> op)
    : LinOp(detail::checked_operator(op).get_executor(),
            detail::checked_operator(op).get_size(),
            detail::checked_operator(op).get_dtype(),
            detail::checked_operator(op).get_eagerness()),
      op_{std::move(op)}
{}


std::unique_ptr<Array> Conjugate::forward_impl(const Array* x) const
{
    auto conj_x = detail::conj_array(x);
    auto result = op_->forward(conj_x);
    return detail::conj_array(result.get());
}


std::unique_ptr<Array> Conjugate::adjoint_impl(const Array* y) const
{
    auto conj_y = detail::conj_array(y);
    auto result = op_->adjoint(conj_y);
    return detail::conj_array(result.get());
}


std::shared_ptr<const LinOp> conjugate(std::shared_ptr<const LinOp> op)
{
    return Conjugate::create(std::move(op));
}


}  // namespace lnd
