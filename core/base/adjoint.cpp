// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/adjoint.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {


Adjoint::Adjoint(std::shared_ptr<const LinOp> op)
    : LinOp(detail::checked_operator(op).get_executor(),
            transpose(detail::checked_operator(op).get_size()),
            detail::checked_operator(op).get_dtype(),
            detail::checked_operator(op).get_eagerness().transpose()),
      op_{std::move(op)}
{}


std::unique_ptr<Array> Adjoint::forward_impl(const Array* x) const
{
    return op_->adjoint(x);
}


std::unique_ptr<Array> Adjoint::adjoint_impl(const Array* y) const
{
    return op_->forward(y);
}


std::shared_ptr<const LinOp> adjoint(std::shared_ptr<const LinOp> op)
{
    if (auto view = std::dynamic_pointer_cast<const Adjoint>(op)) {
        return view->get_operator();
    }
    return Adjoint::create(std::move(op));
}


}  // namespace lnd
