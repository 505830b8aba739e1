// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_MATRIX_FUNCTION_HPP_
#define LND_PUBLIC_CORE_MATRIX_FUNCTION_HPP_


#include <functional>
#include <memory>
#include <string>
#include <vector>


#include <linden/core/base/lin_op.hpp>


namespace lnd {
namespace matrix {


/**
 * A Function is a matrix-free operator defined by user supplied callables
 * for its forward and adjoint maps.
 *
 * The callables receive the values of the input and have to return exactly
 * M (forward) or N (adjoint) values. For a lazy input, they run when the
 * result is realized, and errors they throw are reported as
 * BackendExecutionError.
 *
 * ```cpp
 * auto twice = lnd::matrix::Function<double>::create(
 *     exec, lnd::dim<2>{3},
 *     [](const std::vector<double>& x) { ... },
 *     [](const std::vector<double>& y) { ... });
 * ```
 *
 * @tparam ValueType  precision of the values passed to the callables
 *
 * @ingroup LinOp
 */
template <typename ValueType = default_precision>
class Function : public LinOp, public EnableCreateMethod<Function<ValueType>> {
    friend class EnableCreateMethod<Function>;

public:
    using value_type = ValueType;
    using function_type =
        std::function<std::vector<value_type>(const std::vector<value_type>&)>;

    /**
     * Returns the label of the graph nodes created by the operator.
     */
    const std::string& get_label() const noexcept { return label_; }

    /**
     * Checks whether the operator has an adjoint map.
     */
    bool has_adjoint() const noexcept { return static_cast<bool>(adjoint_); }

protected:
    /**
     * Creates a Function operator.
     *
     * @param exec  Executor associated to the operator
     * @param size  size of the operator
     * @param forward_fn  the forward map
     * @param adjoint_fn  the adjoint map, can be empty if it is never used
     * @param flags  eagerness of the operator
     * @param label  label of the graph nodes created by the operator
     */
    Function(std::shared_ptr<const Executor> exec, const dim<2>& size,
             function_type forward_fn, function_type adjoint_fn = {},
             const eagerness& flags = {}, std::string label = "function");

    std::unique_ptr<Array> forward_impl(const Array* x) const override;

    /**
     * @throws NotImplemented  if the operator has no adjoint map
     */
    std::unique_ptr<Array> adjoint_impl(const Array* y) const override;

private:
    function_type forward_;
    function_type adjoint_;
    std::string label_;
};


}  // namespace matrix
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_MATRIX_FUNCTION_HPP_
