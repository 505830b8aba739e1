// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_CONJUGATE_HPP_
#define LND_PUBLIC_CORE_BASE_CONJUGATE_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {


/**
 * The Conjugate operator is the elementwise complex conjugate of an operator
 * A, i.e. conj(A) x = conj(A conj(x)). For a real operator, it behaves like A.
 *
 * @ingroup LinOp
 */
class Conjugate : public LinOp, public EnableCreateMethod<Conjugate> {
    friend class EnableCreateMethod<Conjugate>;

public:
    std::shared_ptr<const LinOp> get_operator() const noexcept { return op_; }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override
    {
        return {op_};
    }

protected:
    explicit Conjugate(std::shared_ptr<const LinOp> op);

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::shared_ptr<const LinOp> op_;
};


/**
 * Creates the complex conjugate of an operator.
 *
 * @see Conjugate
 */
std::shared_ptr<const LinOp> conjugate(std::shared_ptr<const LinOp> op);


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_CONJUGATE_HPP_
