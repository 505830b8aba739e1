// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_COMPOSITION_HPP_
#define LND_PUBLIC_CORE_BASE_COMPOSITION_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {


/**
 * The Composition class can be used to compose linear operators `op1, op2,
 * ..., opn` and obtain the operator `op1 * op2 * ... * opn`.
 *
 * The forward map applies opn first and op1 last; the adjoint map applies
 * op1^H first and opn^H last. Adjacent operators need matching inner
 * dimensions.
 *
 * The forward flags of the eagerness are taken from the operator applied
 * first in the forward direction (opn), the adjoint flags from the operator
 * applied first in the adjoint direction (op1).
 *
 * @ingroup LinOp
 */
class Composition : public LinOp, public EnableCreateMethod<Composition> {
    friend class EnableCreateMethod<Composition>;

public:
    /**
     * Returns a list of operators of the composition.
     *
     * @return a list of operators
     */
    const std::vector<std::shared_ptr<const LinOp>>& get_operators()
        const noexcept
    {
        return operators_;
    }

    std::vector<std::shared_ptr<const LinOp>> get_children() const override
    {
        return operators_;
    }

protected:
    /**
     * Creates a composition of operators.
     *
     * @param operators  the operators, at least one
     *
     * @throws DimensionMismatch  if adjacent operators are not conformant
     * @throws DtypeMismatch  if real and complex operators are mixed
     * @throws InvalidStateError  if the list is empty
     */
    explicit Composition(std::vector<std::shared_ptr<const LinOp>> operators);

    /**
     * Creates a composition of operators.
     *
     * @param oper  the first operator
     * @param rest  remaining operators
     */
    template <typename... Rest>
    explicit Composition(std::shared_ptr<const LinOp> oper, Rest&&... rest)
        : Composition(std::vector<std::shared_ptr<const LinOp>>{
              std::move(oper), std::forward<Rest>(rest)...})
    {}

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::vector<std::shared_ptr<const LinOp>> operators_;
};


/**
 * Creates the composition op1 * op2 * ... * opn of a list of operators.
 *
 * @see Composition
 */
std::shared_ptr<const LinOp> chain(
    std::vector<std::shared_ptr<const LinOp>> operators);


/**
 * Creates the composition of operators.
 *
 * ```cpp
 * auto normal = lnd::chain(lnd::adjoint(A), A);
 * ```
 *
 * @see Composition
 */
template <typename... Rest>
std::shared_ptr<const LinOp> chain(std::shared_ptr<const LinOp> oper,
                                   Rest&&... rest)
{
    return chain(std::vector<std::shared_ptr<const LinOp>>{
        std::move(oper), std::forward<Rest>(rest)...});
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_COMPOSITION_HPP_
