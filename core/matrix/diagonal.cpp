// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/matrix/diagonal.hpp>


#include <linden/core/base/precision_dispatch.hpp>


namespace lnd {
namespace matrix {


template <typename ValueType>
Diagonal<ValueType>::Diagonal(std::shared_ptr<const Executor> exec,
                              std::vector<value_type> diag,
                              const eagerness& flags)
    : LinOp(exec, dim<2>{diag.size()}, dtype_of<ValueType>(), flags),
      diag_{Vector<value_type>::create(exec, std::move(diag))},
      conj_diag_{diag_->conj()}
{}


template <typename ValueType>
std::unique_ptr<Array> Diagonal<ValueType>::forward_impl(const Array* x) const
{
    return precision_dispatch<ValueType>(
        [this](const Vector<ValueType>* dense_x) {
            return dense_x->multiply(diag_.get());
        },
        x);
}


template <typename ValueType>
std::unique_ptr<Array> Diagonal<ValueType>::adjoint_impl(const Array* y) const
{
    return precision_dispatch<ValueType>(
        [this](const Vector<ValueType>* dense_y) {
            return dense_y->multiply(conj_diag_.get());
        },
        y);
}


#define LND_DECLARE_DIAGONAL_MATRIX(_type) class Diagonal<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_DIAGONAL_MATRIX);


}  // namespace matrix
}  // namespace lnd
