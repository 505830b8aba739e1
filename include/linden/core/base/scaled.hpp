// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_SCALED_HPP_
#define LND_PUBLIC_CORE_BASE_SCALED_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>
#include <linden/core/base/math.hpp>


namespace lnd {


/**
 * The Scaled operator is the product of a linear operator A and a constant c:
 *
 * c A x,    and for the adjoint    conj(c) A^H y.
 *
 * A is applied in its own precision and the constant is converted to the
 * value type of A's result. ValueType has to be of the same kind (real or
 * complex) as A. Use lnd::scale() to scale a complex operator by a real
 * constant.
 *
 * @tparam ValueType  type of the scaling constant
 *
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Scaled : public LinOp, public EnableCreateMethod<Scaled<ValueType>> {
    friend class EnableCreateMethod<Scaled>;

public:
    using value_type = ValueType;

    /**
     * Returns the scaled operator.
     */
    std::shared_ptr<const LinOp> get_operator() const noexcept { return op_; }

    /**
     * Returns the scaling constant.
     */
    value_type get_scale() const noexcept { return scale_; }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override
    {
        return {op_};
    }

protected:
    /**
     * Creates the operator c A.
     *
     * @param op  the operator A
     * @param scale  the constant c
     *
     * @throws DtypeMismatch  if ValueType is complex and A is real, or the
     *                        other way round
     */
    Scaled(std::shared_ptr<const LinOp> op, value_type scale);

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::shared_ptr<const LinOp> op_;
    value_type scale_;
};


/**
 * Creates the operator c A.
 *
 * A real constant is promoted to complex if A is complex.
 *
 * @param op  the operator A
 * @param c  the constant
 *
 * @throws DtypeMismatch  if c is complex and A is real
 */
template <typename ScalarType>
std::shared_ptr<const LinOp> scale(std::shared_ptr<const LinOp> op,
                                   ScalarType c)
{
    LND_THROW_IF_INVALID(op != nullptr, "operator must not be null");
    if constexpr (!is_complex<ScalarType>()) {
        if (is_complex(op->get_dtype())) {
            return Scaled<to_complex<ScalarType>>::create(
                std::move(op), to_complex<ScalarType>(c));
        }
    }
    return Scaled<ScalarType>::create(std::move(op), c);
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_SCALED_HPP_
