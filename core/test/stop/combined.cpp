// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/stop/combined.hpp>


#include <memory>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/stop/iteration.hpp>
#include <linden/core/stop/residual_norm.hpp>


namespace {


using Vec = lnd::Vector<double>;


class Combined : public ::testing::Test {
protected:
    Combined()
        : exec{lnd::ReferenceExecutor::create()},
          b{lnd::initialize<Vec>({3.0, 4.0}, exec)},
          factory{lnd::stop::Combined::build()
                      .with_criteria(lnd::stop::max_iters(exec, 10),
                                     lnd::stop::absolute_residual_norm<double>(
                                         exec, 1e-2))
                      .on(exec)}
    {}

    std::shared_ptr<const lnd::Executor> exec;
    std::shared_ptr<const Vec> b;
    std::unique_ptr<lnd::stop::Combined::Factory> factory;
};


TEST_F(Combined, CanCreateFactory)
{
    ASSERT_EQ(factory->get_parameters().criteria.size(), 2);
    ASSERT_EQ(factory->get_executor(), exec);
}


TEST_F(Combined, GeneratesAllCriteria)
{
    auto criterion = factory->generate(nullptr, b, nullptr);

    ASSERT_EQ(criterion->get_criteria().size(), 2);
}


TEST_F(Combined, StopsWithFirstCriterion)
{
    bool one_changed{};
    lnd::stopping_status status;
    auto criterion = factory->generate(nullptr, b, nullptr);
    auto residual = lnd::initialize<Vec>({1.0, 0.0}, exec);

    ASSERT_TRUE(criterion->update()
                    .num_iterations(10)
                    .residual(residual.get())
                    .check(1, true, &status, &one_changed));
    ASSERT_TRUE(one_changed);
    ASSERT_FALSE(status.has_converged());
    ASSERT_EQ(status.get_id(), 1);
}


TEST_F(Combined, ConvergesWithSecondCriterion)
{
    bool one_changed{};
    lnd::stopping_status status;
    auto criterion = factory->generate(nullptr, b, nullptr);
    auto residual = lnd::initialize<Vec>({1e-3, 0.0}, exec);

    ASSERT_TRUE(criterion->update()
                    .num_iterations(1)
                    .residual(residual.get())
                    .check(1, true, &status, &one_changed));
    ASSERT_TRUE(status.has_converged());
    ASSERT_EQ(status.get_id(), 2);
}


TEST_F(Combined, ContinuesIfNoCriterionIsMet)
{
    bool one_changed{};
    lnd::stopping_status status;
    auto criterion = factory->generate(nullptr, b, nullptr);
    auto residual = lnd::initialize<Vec>({1.0, 0.0}, exec);

    ASSERT_FALSE(criterion->update()
                     .num_iterations(1)
                     .residual(residual.get())
                     .check(1, true, &status, &one_changed));
    ASSERT_FALSE(one_changed);
    ASSERT_FALSE(status.has_stopped());
}


TEST_F(Combined, IgnoresNullCriteria)
{
    auto with_null = lnd::stop::Combined::build()
                         .with_criteria(nullptr, lnd::stop::max_iters(exec, 3))
                         .on(exec);

    auto criterion = with_null->generate(nullptr, b, nullptr);

    ASSERT_EQ(criterion->get_criteria().size(), 1);
}


TEST_F(Combined, FailsWithoutCriteria)
{
    using factory_list =
        std::vector<std::shared_ptr<const lnd::stop::CriterionFactory>>;
    auto empty = lnd::stop::combine(exec, factory_list{});

    ASSERT_THROW(empty->generate(nullptr, b, nullptr), lnd::NotSupported);
}


}  // namespace
