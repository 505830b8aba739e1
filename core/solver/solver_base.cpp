// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/solver/solver_base.hpp>


#include <linden/core/base/exception_helpers.hpp>
#include <linden/core/base/precision_dispatch.hpp>
#include <linden/core/stop/combined.hpp>


#include "core/base/composite_helpers.hpp"


namespace lnd {
namespace solver {
namespace {


std::shared_ptr<const stop::CriterionFactory> combine_criteria(
    std::shared_ptr<const Executor> exec,
    const std::vector<std::shared_ptr<const stop::CriterionFactory>>& criteria)
{
    std::vector<std::shared_ptr<const stop::CriterionFactory>> valid;
    for (const auto& factory : criteria) {
        if (factory != nullptr) {
            valid.push_back(factory);
        }
    }
    if (valid.size() == 1) {
        return valid.front();
    }
    // Combined throws NotSupported if the list is empty
    return stop::combine(std::move(exec), std::move(valid));
}


}  // anonymous namespace


template <typename ValueType>
SolverBase<ValueType>::SolverBase(
    std::shared_ptr<const Executor> exec,
    std::shared_ptr<const LinOp> system_matrix,
    const std::vector<std::shared_ptr<const stop::CriterionFactory>>& criteria)
    : LinOp(exec,
            transpose(::lnd::detail::checked_operator(system_matrix)
                          .get_size()),
            dtype_of<ValueType>()),
      system_matrix_{std::move(system_matrix)},
      stop_criterion_factory_{combine_criteria(exec, criteria)}
{
    LND_ASSERT_SAME_KIND(system_matrix_, dtype_of<ValueType>());
}


template <typename ValueType>
result<ValueType> SolverBase<ValueType>::solve(
    ptr_param<const Array> b, ptr_param<const Array> x0) const
{
    this->validate_forward_parameters(b.get());
    auto dense_b = make_temporary_conversion<ValueType>(b.get());
    std::shared_ptr<const vector_type> dense_x;
    if (x0) {
        LND_ASSERT_EQUAL_ROWS(this, x0.get());
        dense_x = make_temporary_conversion<ValueType>(x0.get())->clone();
        if (dense_b->is_lazy() && !dense_x->is_lazy()) {
            dense_x = dense_x->as_lazy();
        }
    } else {
        auto zeros = vector_type::create_filled(
            this->get_executor(), this->get_size()[0], zero<ValueType>());
        dense_x = dense_b->is_lazy() ? share(zeros->as_lazy())
                                     : share(std::move(zeros));
    }
    return this->solve_impl(std::move(dense_b), std::move(dense_x));
}


template <typename ValueType>
std::unique_ptr<stop::Criterion>
SolverBase<ValueType>::generate_stop_criterion(
    std::shared_ptr<const vector_type> b, const vector_type* x,
    const vector_type* initial_residual) const
{
    auto criterion = stop_criterion_factory_->generate(
        system_matrix_, std::shared_ptr<const Array>(std::move(b)), x,
        initial_residual);
    for (const auto& logger : this->get_loggers()) {
        criterion->add_logger(logger);
    }
    return criterion;
}


template <typename ValueType>
std::unique_ptr<Array> SolverBase<ValueType>::forward_impl(
    const Array* b) const
{
    auto res = this->solve(b);
    return convert_to_input_precision<ValueType>(res.solution->clone(),
                                                 b->get_dtype());
}


template <typename ValueType>
std::unique_ptr<Array> SolverBase<ValueType>::adjoint_impl(
    const Array* x) const LND_NOT_IMPLEMENTED;


#define LND_DECLARE_SOLVER_BASE(_type) class SolverBase<_type>
LND_INSTANTIATE_FOR_EACH_VALUE_TYPE(LND_DECLARE_SOLVER_BASE);


}  // namespace solver
}  // namespace lnd
