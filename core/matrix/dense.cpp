// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/matrix/dense.hpp>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/math.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/base/vector.hpp>


namespace lnd {
namespace matrix {


template <typename ValueType>
Dense<ValueType>::Dense(std::shared_ptr<const Executor> exec,
                        const dim<2>& size, std::vector<value_type> values,
                        const eagerness& flags)
    : LinOp(std::move(exec), size, dtype_of<ValueType>(), flags),
      values_{std::make_shared<const std::vector<value_type>>(
          std::move(values))}
{
    LND_ASSERT_EQ(values_->size(), size[0] * size[1]);
}


template <typename ValueType>
ValueType Dense<ValueType>::at(size_type row, size_type col) const
{
    LND_ENSURE_IN_BOUNDS(row, this->get_size()[0]);
    LND_ENSURE_IN_BOUNDS(col, this->get_size()[1]);
    return (*values_)[row * this->get_size()[1] + col];
}


template <typename ValueType>
std::unique_ptr<Array> Dense<ValueType>::forward_impl(const Array* x) const
{
    const auto num_rows = this->get_size()[0];
    const auto num_cols = this->get_size()[1];
    return precision_dispatch<ValueType>(
        [&](const Vector<ValueType>* dense_x) {
            return dense_x->transform(
                "dense_forward", num_rows,
                [values = values_, num_rows,
                 num_cols](const std::vector<ValueType>& in) {
                    std::vector<ValueType> out(num_rows, zero<ValueType>());
                    for (size_type row = 0; row < num_rows; ++row) {
                        for (size_type col = 0; col < num_cols; ++col) {
                            out[row] += (*values)[row * num_cols + col] *
                                        in[col];
                        }
                    }
                    return out;
                });
        },
        x);
}


template <typename ValueType>
std::unique_ptr<Array> Dense<ValueType>::adjoint_impl(const Array* y) const
{
    const auto num_rows = this->get_size()[0];
    const auto num_cols = this->get_size()[1];
    return precision_dispatch<ValueType>(
        [&](const Vector<ValueType>* dense_y) {
            return dense_y->transform(
                "dense_adjoint", num_cols,
                [values = values_, num_rows,
                 num_cols](const std::vector<ValueType>& in) {
                    std::vector<ValueType> out(num_cols, zero<ValueType>());
                    for (size_type row = 0; row < num_rows; ++row) {
                        for (size_type col = 0; col < num_cols; ++col) {
                            out[col] +=
                                lnd::conj((*values)[row * num_cols + col]) *
                                in[row];
                        }
                    }
                    return out;
                });
        },
        y);
}


#define LND_DECLARE_DENSE_MATRIX(_type) class Dense<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_DENSE_MATRIX);


}  // namespace matrix
}  // namespace lnd
