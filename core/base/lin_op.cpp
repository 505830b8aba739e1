// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/lin_op.hpp>


namespace lnd {


LinOp::LinOp(std::shared_ptr<const Executor> exec, const dim<2>& size,
             dtype type, const eagerness& flags)
    : exec_{std::move(exec)}, size_{size}, dtype_{type}, eagerness_{flags}
{}


std::unique_ptr<Array> LinOp::forward(ptr_param<const Array> x) const
{
    this->template log<log::Logger::linop_forward_started>(this, x.get());
    auto result = this->apply_forward(x.get(), eagerness_.realize_forward);
    this->template log<log::Logger::linop_forward_completed>(this, x.get(),
                                                             result.get());
    return result;
}


std::unique_ptr<Array> LinOp::adjoint(ptr_param<const Array> y) const
{
    this->template log<log::Logger::linop_adjoint_started>(this, y.get());
    auto result = this->apply_adjoint(y.get(), eagerness_.realize_adjoint);
    this->template log<log::Logger::linop_adjoint_completed>(this, y.get(),
                                                             result.get());
    return result;
}


std::unique_ptr<Array> LinOp::forward_deferred(const LinOp* op,
                                               const Array* x)
{
    op->template log<log::Logger::linop_forward_started>(op, x);
    auto result = op->apply_forward(x, false);
    op->template log<log::Logger::linop_forward_completed>(op, x,
                                                           result.get());
    return result;
}


std::unique_ptr<Array> LinOp::adjoint_deferred(const LinOp* op,
                                               const Array* y)
{
    op->template log<log::Logger::linop_adjoint_started>(op, y);
    auto result = op->apply_adjoint(y, false);
    op->template log<log::Logger::linop_adjoint_completed>(op, y,
                                                           result.get());
    return result;
}


std::unique_ptr<Array> LinOp::apply_forward(const Array* x, bool realize) const
{
    this->validate_forward_parameters(x);
    std::unique_ptr<Array> deferred_x;
    if (eagerness_.defer_forward_input && !x->is_lazy()) {
        deferred_x = x->as_lazy();
        x = deferred_x.get();
    }
    auto result = this->forward_impl(x);
    LND_ASSERT_EQUAL_ROWS(this, result);
    if (realize && result->is_lazy()) {
        result = result->realize();
    }
    return result;
}


std::unique_ptr<Array> LinOp::apply_adjoint(const Array* y, bool realize) const
{
    this->validate_adjoint_parameters(y);
    std::unique_ptr<Array> deferred_y;
    if (eagerness_.defer_adjoint_input && !y->is_lazy()) {
        deferred_y = y->as_lazy();
        y = deferred_y.get();
    }
    auto result = this->adjoint_impl(y);
    LND_ASSERT_EQUAL_ROWS(transpose(this->get_size()), result);
    if (realize && result->is_lazy()) {
        result = result->realize();
    }
    return result;
}


void LinOp::validate_forward_parameters(const Array* x) const
{
    LND_THROW_IF_INVALID(x != nullptr, "input vector must not be null");
    LND_ASSERT_CONFORMANT(this, x);
}


void LinOp::validate_adjoint_parameters(const Array* y) const
{
    LND_THROW_IF_INVALID(y != nullptr, "input vector must not be null");
    LND_ASSERT_EQUAL_ROWS(this, y);
}


}  // namespace lnd
