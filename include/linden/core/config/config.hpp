// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#ifndef LND_PUBLIC_CORE_CONFIG_CONFIG_HPP_
#define LND_PUBLIC_CORE_CONFIG_CONFIG_HPP_


#include <memory>
#include <vector>


#include <linden/core/base/executor.hpp>
#include <linden/core/base/lin_op.hpp>
#include <linden/core/config/property_tree.hpp>
#include <linden/core/config/type_descriptor.hpp>
#include <linden/core/stop/criterion.hpp>


namespace lnd {
namespace config {


/**
 * parse is the main entry point to create a solver factory from a property
 * tree. The `type` entry selects the solver:
 *
 * ```
 * type: solver::Cgls
 * value_type: float64
 * damping: 0.1
 * criteria:
 *   iteration: 50
 *   relative_residual_norm: 1e-8
 * ```
 *
 * The known types are `solver::Cg` and `solver::Cgls`. All solvers accept
 * `criteria`, either a single criterion map, an array of criterion maps, or
 * the minimal form shown above, which maps `iteration`,
 * `relative_residual_norm`, `initial_residual_norm`, `absolute_residual_norm`
 * and their `implicit` counterparts to the corresponding criteria. A
 * criterion map has a `type` out of `Iteration`, `ResidualNorm`,
 * `ImplicitResidualNorm` and `Combined`.
 *
 * Unknown keys are rejected.
 *
 * @param config  the property tree
 * @param exec  the executor of the factory
 * @param td  the default value type, overridden by `value_type` entries
 *
 * @return the solver factory
 *
 * @throws InvalidStateError  if the property tree is not a valid
 *                            description of a solver
 */
std::shared_ptr<LinOpFactory> parse(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td = make_type_descriptor<>());


/**
 * Creates the stopping criterion factories described by a property tree, as
 * the `criteria` entry of parse().
 *
 * @copydetails parse()
 */
std::vector<std::shared_ptr<const stop::CriterionFactory>> parse_criteria(
    const pnode& config, std::shared_ptr<const Executor> exec,
    const type_descriptor& td = make_type_descriptor<>());


/**
 * Creates the executor described by a property tree: either a string naming
 * the executor (`reference` or `omp`) or a map with the `type` and, for the
 * OpenMP executor, `num_threads`.
 */
std::shared_ptr<Executor> parse_executor(const pnode& config);


/**
 * Reads an eagerness from a map with the optional boolean entries
 * `realize_forward`, `realize_adjoint`, `defer_forward_input` and
 * `defer_adjoint_input`. An empty node gives the default eagerness.
 */
eagerness parse_eagerness(const pnode& config);


}  // namespace config
}  // namespace lnd


#endif  // LND_PUBLIC_CORE_CONFIG_CONFIG_HPP_
