// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/log/stream.hpp>


#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/matrix/dense.hpp>
#include <linden/core/solver/cg.hpp>
#include <linden/core/stop/iteration.hpp>


namespace {


using Vec = lnd::Vector<double>;
using Mtx = lnd::matrix::Dense<double>;


class Stream : public ::testing::Test {
protected:
    Stream()
        : exec(lnd::ReferenceExecutor::create()),
          mtx(lnd::initialize<Mtx>({{1.0, 2.0}, {3.0, 4.0}}, exec)),
          x(lnd::initialize<Vec>({1.0, -1.0}, exec))
    {}

    bool contains(const std::string& text) const
    {
        return out.str().find(text) != std::string::npos;
    }

    std::ostringstream out;
    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::unique_ptr<Mtx> mtx;
    std::unique_ptr<Vec> x;
};


TEST_F(Stream, LogsForwardStarted)
{
    mtx->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::linop_forward_started_mask, out)));

    mtx->forward(x);

    ASSERT_TRUE(contains("[LOG] >>> forward started on A LinOp["));
    ASSERT_TRUE(contains("with x Array["));
    ASSERT_FALSE(contains("forward completed"));
}


TEST_F(Stream, LogsForwardCompleted)
{
    mtx->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::linop_forward_completed_mask, out)));

    mtx->forward(x);

    ASSERT_TRUE(contains("[LOG] >>> forward completed on A LinOp["));
    ASSERT_TRUE(contains(" and y Array["));
}


TEST_F(Stream, LogsAdjointEvents)
{
    mtx->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::linop_events_mask, out)));

    mtx->adjoint(x);

    ASSERT_TRUE(contains("adjoint started on A LinOp["));
    ASSERT_TRUE(contains("adjoint completed on A LinOp["));
    ASSERT_FALSE(contains("forward"));
}


TEST_F(Stream, PrintsValuesIfVerbose)
{
    mtx->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::linop_forward_completed_mask, out, true)));

    mtx->forward(x);

    ASSERT_TRUE(contains("\t-1\n"));
    ASSERT_TRUE(contains("\t1\n"));
}


TEST_F(Stream, PrintsPlaceholderForLazyValues)
{
    mtx->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::linop_forward_completed_mask, out, true)));

    mtx->forward(x->as_lazy());

    ASSERT_TRUE(contains("<lazy>"));
}


TEST_F(Stream, LogsRealize)
{
    exec->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::executor_events_mask, out)));
    auto y = mtx->forward(x->as_lazy());

    lnd::as<Vec>(y.get())->realize();

    ASSERT_TRUE(contains("[LOG] >>> realize started for Node["));
    ASSERT_TRUE(contains("with 1 pending nodes"));
    ASSERT_TRUE(contains("completed on Executor["));
    ASSERT_TRUE(contains("after evaluating 1 nodes"));
}


TEST_F(Stream, LogsFailedEvaluation)
{
    exec->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::node_evaluation_failed_mask, out)));
    auto failing =
        x->as_lazy()->transform("failing", 2, [](const std::vector<double>&) {
            throw std::runtime_error("broken kernel");
            return std::vector<double>{};
        });

    ASSERT_THROW(failing->realize(), lnd::BackendExecutionError);
    ASSERT_TRUE(contains("Node[failing#"));
    ASSERT_TRUE(contains(": broken kernel"));
}


TEST_F(Stream, LogsSolverIterations)
{
    auto solver = lnd::solver::Cg<double>::build()
                      .with_criteria(lnd::stop::max_iters(exec, 2))
                      .on(exec)
                      ->generate(lnd::initialize<Mtx>(
                          {{2.0, 0.0}, {0.0, 1.0}}, exec));
    solver->add_logger(lnd::share(lnd::log::Stream::create(
        lnd::log::Logger::iteration_complete_mask, out)));

    solver->solve(x);

    ASSERT_TRUE(contains("iteration 0 completed with solver LinOp["));
    ASSERT_TRUE(contains("iteration 2 completed"));
    ASSERT_TRUE(contains("Stopped the iteration process true"));
}


}  // namespace
