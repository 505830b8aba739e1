// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/power.hpp>


#include <linden/core/base/exception_helpers.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {


Power::Power(std::shared_ptr<const LinOp> op, size_type exponent)
    : LinOp(detail::checked_operator(op).get_executor(),
            detail::checked_operator(op).get_size(),
            detail::checked_operator(op).get_dtype(),
            detail::checked_operator(op).get_eagerness()),
      op_{std::move(op)},
      exponent_{exponent}
{
    LND_ASSERT_IS_SQUARE_MATRIX(op_);
}


std::unique_ptr<Array> Power::forward_impl(const Array* x) const
{
    auto result = x->clone();
    for (size_type i = 0; i < exponent_; ++i) {
        result = LinOp::forward_deferred(op_.get(), result.get());
    }
    return result;
}


std::unique_ptr<Array> Power::adjoint_impl(const Array* y) const
{
    auto result = y->clone();
    for (size_type i = 0; i < exponent_; ++i) {
        result = LinOp::adjoint_deferred(op_.get(), result.get());
    }
    return result;
}


std::shared_ptr<const LinOp> power(std::shared_ptr<const LinOp> op,
                                   size_type exponent)
{
    return Power::create(std::move(op), exponent);
}


}  // namespace lnd
