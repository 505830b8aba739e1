// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/matrix/zero.hpp>


#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace matrix {
namespace {


template <typename ValueType>
std::unique_ptr<Array> zeros_like(const Array* in, size_type size)
{
    return precision_dispatch<ValueType>(
        [size](const Vector<ValueType>* dense_in) {
            return dense_in->transform(
                "zero", size, [size](const std::vector<ValueType>&) {
                    return std::vector<ValueType>(size, zero<ValueType>());
                });
        },
        in);
}


}  // anonymous namespace


template <typename ValueType>
Zero<ValueType>::Zero(std::shared_ptr<const Executor> exec,
                      const dim<2>& size, const eagerness& flags)
    : LinOp(std::move(exec), size, dtype_of<ValueType>(), flags)
{}


template <typename ValueType>
std::unique_ptr<Array> Zero<ValueType>::forward_impl(const Array* x) const
{
    return zeros_like<ValueType>(x, this->get_size()[0]);
}


template <typename ValueType>
std::unique_ptr<Array> Zero<ValueType>::adjoint_impl(const Array* y) const
{
    return zeros_like<ValueType>(y, this->get_size()[1]);
}


#define LND_DECLARE_ZERO_MATRIX(_type) class Zero<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_ZERO_MATRIX);


}  // namespace matrix
}  // namespace lnd
