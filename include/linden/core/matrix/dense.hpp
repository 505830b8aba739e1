// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_MATRIX_DENSE_HPP_
#define LND_PUBLIC_CORE_MATRIX_DENSE_HPP_


#include <initializer_list>
#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {
namespace matrix {


/**
 * Dense is a matrix format which explicitly stores all values of the matrix,
 * in row-major order.
 *
 * The forward map computes y_i = sum_j a_ij x_j, the adjoint map
 * x_j = sum_i conj(a_ij) y_i.
 *
 * @tparam ValueType  precision of matrix elements
 *
 * @ingroup dense
 * @ingroup mat_formats
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Dense : public LinOp, public EnableCreateMethod<Dense<ValueType>> {
    friend class EnableCreateMethod<Dense>;

public:
    using value_type = ValueType;

    /**
     * Returns the values of the matrix in row-major order.
     */
    const std::vector<value_type>& get_values() const noexcept
    {
        return *values_;
    }

    /**
     * Returns a single element of the matrix.
     *
     * @param row  the row of the requested element
     * @param col  the column of the requested element
     */
    value_type at(size_type row, size_type col) const;

protected:
    /**
     * Creates a Dense matrix from its values.
     *
     * @param exec  Executor associated to the matrix
     * @param size  size of the matrix
     * @param values  the values in row-major order
     * @param flags  eagerness of the matrix
     *
     * @throws ValueMismatch  if the number of values does not match the size
     */
    Dense(std::shared_ptr<const Executor> exec, const dim<2>& size,
          std::vector<value_type> values, const eagerness& flags = {});

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::shared_ptr<const std::vector<value_type>> values_;
};


}  // namespace matrix


/**
 * Creates and initializes a dense matrix from its rows.
 *
 * ```cpp
 * auto A = lnd::initialize<lnd::matrix::Dense<double>>(
 *     {{1.0, 2.0}, {3.0, 4.0}}, exec);
 * ```
 *
 * @tparam MatrixType  the matrix type
 *
 * @param vals  the rows of the matrix
 * @param exec  the executor of the matrix
 * @param flags  the eagerness of the matrix
 */
template <typename MatrixType>
std::unique_ptr<MatrixType> initialize(
    std::initializer_list<std::initializer_list<typename MatrixType::value_type>>
        vals,
    std::shared_ptr<const Executor> exec, const eagerness& flags = {})
{
    const size_type num_rows = vals.size();
    const size_type num_cols = num_rows > 0 ? vals.begin()->size() : 0;
    std::vector<typename MatrixType::value_type> values;
    for (const auto& row : vals) {
        LND_ASSERT_EQ(row.size(), num_cols);
        values.insert(values.end(), row.begin(), row.end());
    }
    return MatrixType::create(std::move(exec), dim<2>{num_rows, num_cols},
                              std::move(values), flags);
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_MATRIX_DENSE_HPP_
