// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/matrix/identity.hpp>


#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace matrix {


template <typename ValueType>
Identity<ValueType>::Identity(std::shared_ptr<const Executor> exec,
                              size_type size, const eagerness& flags)
    : LinOp(std::move(exec), dim<2>{size}, dtype_of<ValueType>(), flags)
{}


template <typename ValueType>
std::unique_ptr<Array> Identity<ValueType>::forward_impl(const Array* x) const
{
    return precision_dispatch<ValueType>(
        [](const Vector<ValueType>* dense_x) { return dense_x->clone(); }, x);
}


template <typename ValueType>
std::unique_ptr<Array> Identity<ValueType>::adjoint_impl(const Array* y) const
{
    return this->forward_impl(y);
}


#define LND_DECLARE_IDENTITY_MATRIX(_type) class Identity<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_IDENTITY_MATRIX);


}  // namespace matrix
}  // namespace lnd
