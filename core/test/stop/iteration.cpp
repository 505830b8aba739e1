// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/stop/iteration.hpp>


#include <memory>


#include <gtest/gtest.h>


#include <linden/core/base/executor.hpp>


namespace {


constexpr lnd::size_type test_iterations = 10;


class Iteration : public ::testing::Test {
protected:
    Iteration()
        : exec{lnd::ReferenceExecutor::create()},
          factory{lnd::stop::Iteration::build()
                      .with_max_iters(test_iterations)
                      .on(exec)}
    {}

    std::shared_ptr<const lnd::Executor> exec;
    std::unique_ptr<lnd::stop::Iteration::Factory> factory;
};


TEST_F(Iteration, CanCreateFactory)
{
    ASSERT_NE(factory, nullptr);
    ASSERT_EQ(factory->get_parameters().max_iters, test_iterations);
    ASSERT_EQ(factory->get_executor(), exec);
}


TEST_F(Iteration, CanCreateCriterion)
{
    auto criterion = factory->generate(nullptr, nullptr, nullptr);

    ASSERT_NE(criterion, nullptr);
    ASSERT_EQ(criterion->get_parameters().max_iters, test_iterations);
}


TEST_F(Iteration, CanCreateFactoryWithShortcut)
{
    auto shortcut = lnd::stop::max_iters(exec, 5);

    ASSERT_EQ(shortcut->get_parameters().max_iters, 5);
}


TEST_F(Iteration, WaitsForIterationCount)
{
    bool one_changed{};
    lnd::stopping_status status;
    auto criterion = factory->generate(nullptr, nullptr, nullptr);

    ASSERT_FALSE(criterion->update()
                     .num_iterations(test_iterations - 1)
                     .check(1, true, &status, &one_changed));
    ASSERT_FALSE(status.has_stopped());
    ASSERT_FALSE(one_changed);
}


TEST_F(Iteration, StopsAtIterationCount)
{
    bool one_changed{};
    lnd::stopping_status status;
    auto criterion = factory->generate(nullptr, nullptr, nullptr);

    ASSERT_TRUE(criterion->update()
                    .num_iterations(test_iterations)
                    .check(1, true, &status, &one_changed));
    ASSERT_TRUE(status.has_stopped());
    ASSERT_FALSE(status.has_converged());
    ASSERT_TRUE(status.is_finalized());
    ASSERT_EQ(status.get_id(), 1);
    ASSERT_TRUE(one_changed);
}


}  // namespace
