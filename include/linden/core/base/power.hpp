// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_POWER_HPP_
#define LND_PUBLIC_CORE_BASE_POWER_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {


/**
 * The Power operator applies a square operator A a fixed number of times:
 * A^p x. A^0 is the identity.
 *
 * Intermediate results are never realized, only the final one if the
 * eagerness of A asks for it.
 *
 * @ingroup LinOp
 */
class Power : public LinOp, public EnableCreateMethod<Power> {
    friend class EnableCreateMethod<Power>;

public:
    /**
     * Returns the operator A.
     */
    std::shared_ptr<const LinOp> get_operator() const noexcept { return op_; }

    /**
     * Returns the exponent p.
     */
    size_type get_exponent() const noexcept { return exponent_; }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override
    {
        return {op_};
    }

protected:
    /**
     * Creates the operator A^p.
     *
     * @throws BadDimension  if A is not square
     */
    Power(std::shared_ptr<const LinOp> op, size_type exponent);

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::shared_ptr<const LinOp> op_;
    size_type exponent_;
};


/**
 * Creates the operator A^p.
 *
 * @see Power
 */
std::shared_ptr<const LinOp> power(std::shared_ptr<const LinOp> op,
                                   size_type exponent);


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_POWER_HPP_
