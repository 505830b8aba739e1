// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/matrix/function.hpp>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace matrix {


template <typename ValueType>
Function<ValueType>::Function(std::shared_ptr<const Executor> exec,
                              const dim<2>& size, function_type forward_fn,
                              function_type adjoint_fn, const eagerness& flags,
                              std::string label)
    : LinOp(std::move(exec), size, dtype_of<ValueType>(), flags),
      forward_{std::move(forward_fn)},
      adjoint_{std::move(adjoint_fn)},
      label_{std::move(label)}
{
    LND_THROW_IF_INVALID(static_cast<bool>(forward_),
                         "a forward map is required");
}


template <typename ValueType>
std::unique_ptr<Array> Function<ValueType>::forward_impl(const Array* x) const
{
    return precision_dispatch<ValueType>(
        [this](const Vector<ValueType>* dense_x) {
            return dense_x->transform(label_ + "_forward",
                                      this->get_size()[0], forward_);
        },
        x);
}


template <typename ValueType>
std::unique_ptr<Array> Function<ValueType>::adjoint_impl(const Array* y) const
{
    if (!adjoint_) {
        LND_NOT_IMPLEMENTED;
    }
    return precision_dispatch<ValueType>(
        [this](const Vector<ValueType>* dense_y) {
            return dense_y->transform(label_ + "_adjoint",
                                      this->get_size()[1], adjoint_);
        },
        y);
}


#define LND_DECLARE_FUNCTION_OPERATOR(_type) class Function<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_FUNCTION_OPERATOR);


}  // namespace matrix
}  // namespace lnd
