// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_BASE_SUM_HPP_
#define LND_PUBLIC_CORE_BASE_SUM_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {


/**
 * The Sum class can be used to construct a linear operator
 * A = A_1 + A_2 + ... + A_k of operators of the same size.
 *
 * Its forward and adjoint maps sum up the maps of the operators. All operators
 * have to share their eagerness, which the sum inherits.
 *
 * @ingroup LinOp
 */
class Sum : public LinOp, public EnableCreateMethod<Sum> {
    friend class EnableCreateMethod<Sum>;

public:
    /**
     * Returns a list of operators of the sum.
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
     * Creates a sum of operators.
     *
     * @param operators  the operators, at least one
     *
     * @throws DimensionMismatch  if the operators differ in size
     * @throws DtypeMismatch  if real and complex operators are mixed
     * @throws InvalidStateError  if the list is empty or the eagerness of the
     *                            operators differs
     */
    explicit Sum(std::vector<std::shared_ptr<const LinOp>> operators);

    /**
     * Creates a sum of operators.
     *
     * @param oper  the first operator
     * @param rest  remaining operators
     */
    template <typename... Rest>
    explicit Sum(std::shared_ptr<const LinOp> oper, Rest&&... rest)
        : Sum(std::vector<std::shared_ptr<const LinOp>>{
              std::move(oper), std::forward<Rest>(rest)...})
    {}

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    std::vector<std::shared_ptr<const LinOp>> operators_;
};


/**
 * Creates the sum of a list of operators.
 *
 * @see Sum
 */
std::shared_ptr<const LinOp> sum(
    std::vector<std::shared_ptr<const LinOp>> operators);


/**
 * Creates the sum of operators.
 *
 * ```cpp
 * auto B = lnd::sum(lnd::scale(A, 2.0), Z);
 * ```
 *
 * @see Sum
 */
template <typename... Rest>
std::shared_ptr<const LinOp> sum(std::shared_ptr<const LinOp> oper,
                                 Rest&&... rest)
{
    return sum(std::vector<std::shared_ptr<const LinOp>>{
        std::move(oper), std::forward<Rest>(rest)...});
}


}  // namespace lnd


#endif  // LND_PUBLIC_CORE_BASE_SUM_HPP_
