// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/scaled.hpp>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/vector.hpp>


#include "core/base/composite_helpers.hpp"
#include "core/base/dispatch_helper.hpp"


namespace lnd {


template <typename ValueType>
Scaled<ValueType>::Scaled(std::shared_ptr<const LinOp> op, value_type scale)
    : LinOp(detail::checked_operator(op).get_executor(),
            detail::checked_operator(op).get_size(),
            promote(detail::checked_operator(op).get_dtype(),
                    dtype_of<ValueType>()),
            detail::checked_operator(op).get_eagerness()),
      op_{std::move(op)},
      scale_{scale}
{
    LND_ASSERT_SAME_KIND(op_, dtype_of<ValueType>());
}


namespace {


// The constant is applied in the value type of the result, which the child
// computed in its own precision.
template <typename ValueType>
std::unique_ptr<Array> scale_array(const Array* a, ValueType scale)
{
    return vector_dispatch(a, [scale](auto dense_a) -> std::unique_ptr<Array> {
        using value_type =
            typename std::decay_t<decltype(*dense_a)>::value_type;
        return dense_a->scale(convert_value<value_type>(scale));
    });
}


}  // anonymous namespace


template <typename ValueType>
std::unique_ptr<Array> Scaled<ValueType>::forward_impl(const Array* x) const
{
    auto y = op_->forward(x);
    return scale_array(y.get(), scale_);
}


template <typename ValueType>
std::unique_ptr<Array> Scaled<ValueType>::adjoint_impl(const Array* y) const
{
    auto x = op_->adjoint(y);
    return scale_array(x.get(), lnd::conj(scale_));
}


#define LND_DECLARE_SCALED(_type) class Scaled<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_SCALED);


}  // namespace lnd
