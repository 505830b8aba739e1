// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_ADJOINT_HPP_
#define LND_PUBLIC_CORE_BASE_ADJOINT_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {


/**
 * The Adjoint operator is a view of A^H: its forward map is the adjoint map
 * of A and vice versa. The view shares A and has the transposed size and
 * eagerness of A.
 *
 * @ingroup LinOp
 */
class Adjoint : public LinOp, public EnableCreateMethod<Adjoint> {
    friend class EnableCreateMethod<Adjoint>;

public:
    /**
     * Returns the operator A this is the adjoint of.
     */
    std::shared_ptr<const LinOp> get_operator() const noexcept { return op_; }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override
    {
        return {op_};
    }

protected:
    explicit Adjoint(std::shared_ptr<const LinOp> op);

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::shared_ptr<const LinOp> op_;
};


/**
 * Returns the adjoint A^H of an operator. The adjoint of an Adjoint view is
 * the operator it views, so adjoint(adjoint(A)) is A itself.
 *
 * @param op  the operator A
 */
std::shared_ptr<const LinOp> adjoint(std::shared_ptr<const LinOp> op);


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_ADJOINT_HPP_
