// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/log/convergence.hpp>


#include <memory>


#include <gtest/gtest.h>


#include <linden/core/base/vector.hpp>
#include <linden/core/matrix/dense.hpp>
#include <linden/core/solver/cgls.hpp>
#include <linden/core/stop/iteration.hpp>
#include <linden/core/stop/residual_norm.hpp>


#include "core/test/utils.hpp"


namespace {


using Vec = lnd::Vector<double>;
using Mtx = lnd::matrix::Dense<double>;


class Convergence : public ::testing::Test {
protected:
    Convergence()
        : exec(lnd::ReferenceExecutor::create()),
          logger(lnd::share(lnd::log::Convergence::create())),
          mtx(lnd::share(
              lnd::initialize<Mtx>({{2.0, 0.0}, {0.0, 4.0}}, exec))),
          b(lnd::initialize<Vec>({2.0, 8.0}, exec))
    {}

    std::unique_ptr<lnd::solver::Cgls<double>> solver_with(
        std::shared_ptr<const lnd::stop::CriterionFactory> criterion) const
    {
        auto solver = lnd::solver::Cgls<double>::build()
                          .with_criteria(std::move(criterion))
                          .on(exec)
                          ->generate(mtx);
        solver->add_logger(logger);
        return solver;
    }

    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::shared_ptr<lnd::log::Convergence> logger;
    std::shared_ptr<const Mtx> mtx;
    std::unique_ptr<Vec> b;
};


TEST_F(Convergence, StartsEmpty)
{
    ASSERT_FALSE(logger->has_converged());
    ASSERT_EQ(logger->get_num_iterations(), 0);
    ASSERT_EQ(logger->get_residual(), nullptr);
    ASSERT_EQ(logger->get_residual_norm(), nullptr);
    ASSERT_EQ(logger->get_implicit_sq_resnorm(), nullptr);
}


TEST_F(Convergence, RecordsConvergedSolve)
{
    auto solver = solver_with(
        lnd::stop::absolute_residual_norm<double>(exec, 1e-12));

    auto res = solver->solve(b);

    ASSERT_TRUE(logger->has_converged());
    ASSERT_EQ(logger->get_num_iterations(), res.num_iterations);
    ASSERT_NE(logger->get_residual(), nullptr);
    ASSERT_NE(logger->get_implicit_sq_resnorm(), nullptr);
    ASSERT_LE(lnd::as<Vec>(logger->get_residual_norm())->value(), 1e-12);
}


TEST_F(Convergence, RecordsStoppedSolve)
{
    auto solver = solver_with(lnd::stop::max_iters(exec, 1));

    solver->solve(b);

    ASSERT_FALSE(logger->has_converged());
    ASSERT_EQ(logger->get_num_iterations(), 1);
    ASSERT_GT(lnd::as<Vec>(logger->get_residual_norm())->value(), 0.0);
}


TEST_F(Convergence, KeepsLazyResidualLazy)
{
    auto counter = lnd::test::RealizeCounter::create();
    exec->add_logger(counter);
    auto solver = solver_with(lnd::stop::max_iters(exec, 3));

    solver->solve(b->as_lazy());

    ASSERT_EQ(counter->realize_count(), 0);
    ASSERT_TRUE(logger->get_residual()->is_lazy());
    LND_ASSERT_VECTOR_NEAR(logger->get_residual(), l({0.0, 0.0}), 1e-12);
}


TEST_F(Convergence, RecordsFromCriterionEventsAlone)
{
    auto criterion_only = lnd::share(lnd::log::Convergence::create(
        lnd::log::Logger::criterion_events_mask));
    auto solver = solver_with(lnd::stop::max_iters(exec, 2));
    solver->remove_logger(logger.get());
    solver->add_logger(criterion_only);

    solver->solve(b);

    ASSERT_EQ(solver->get_loggers().size(), 1);
    ASSERT_EQ(logger->get_num_iterations(), 0);
    ASSERT_EQ(criterion_only->get_num_iterations(), 2);
    ASSERT_NE(criterion_only->get_residual(), nullptr);
    ASSERT_EQ(criterion_only->get_implicit_sq_resnorm(), nullptr);
}


}  // namespace
