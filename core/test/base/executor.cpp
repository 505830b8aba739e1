// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/executor.hpp>


#include <exception>
#include <memory>
#include <stdexcept>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/lazy/node.hpp>


#include "core/test/utils.hpp"


namespace {


using Vec = lnd::Vector<double>;


class ReferenceExecutor : public ::testing::Test {
protected:
    ReferenceExecutor()
        : exec(lnd::ReferenceExecutor::create()),
          counter(lnd::test::RealizeCounter::create())
    {
        exec->add_logger(counter);
    }

    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::shared_ptr<lnd::test::RealizeCounter> counter;
};


TEST_F(ReferenceExecutor, KnowsItsName)
{
    ASSERT_EQ(exec->get_name(), "reference");
}


TEST_F(ReferenceExecutor, RealizesGraph)
{
    auto x = Vec::create_lazy(exec, {1.0, 2.0, 3.0});
    auto y = x->scale(2.0)->add(x.get());

    auto res = y->realize();

    ASSERT_EQ(counter->realize_count(), 1);
    ASSERT_EQ(counter->last_pending(), 2);
    ASSERT_EQ(counter->evaluated_nodes(), 2);
    LND_ASSERT_VECTOR_NEAR(res, l({3.0, 6.0, 9.0}), 0.0);
}


TEST_F(ReferenceExecutor, EvaluatesSharedNodesOnce)
{
    int calls = 0;
    auto x = Vec::create_lazy(exec, {1.0, 2.0});
    auto shared = x->transform("counted", 2,
                               [&calls](const std::vector<double>& in) {
                                   ++calls;
                                   return in;
                               });
    auto y = shared->add(shared.get())->sub(shared.get());

    auto res = y->realize();

    ASSERT_EQ(calls, 1);
    ASSERT_EQ(counter->evaluated_nodes(), 3);
    LND_ASSERT_VECTOR_NEAR(res, l({1.0, 2.0}), 0.0);
}


TEST_F(ReferenceExecutor, RealizeTwiceDoesNotRecompute)
{
    int calls = 0;
    auto x = Vec::create_lazy(exec, {1.0, 2.0});
    auto y = x->transform("counted", 2,
                          [&calls](const std::vector<double>& in) {
                              ++calls;
                              return std::vector<double>{in[0] / 3.0,
                                                         in[1] / 7.0};
                          });

    auto first = y->realize();
    auto second = y->realize();

    ASSERT_EQ(calls, 1);
    ASSERT_EQ(counter->realize_count(), 2);
    ASSERT_EQ(counter->last_pending(), 0);
    ASSERT_EQ(counter->evaluated_nodes(), 1);
    ASSERT_TRUE(y->is_lazy());
    ASSERT_EQ(first->get_data(), second->get_data());
}


TEST_F(ReferenceExecutor, RealizesOnlyMissingPartOfSharedGraph)
{
    auto x = Vec::create_lazy(exec, {1.0, 2.0});
    auto upstream = x->scale(3.0);
    auto first = upstream->add(x.get());
    auto second = upstream->sub(x.get());

    first->realize();
    auto res = second->realize();

    ASSERT_EQ(counter->last_pending(), 1);
    ASSERT_EQ(counter->evaluated_nodes(), 3);
    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 4.0}), 0.0);
}


TEST_F(ReferenceExecutor, ReleasesIntermediateNodesOfDeepGraph)
{
    auto x = Vec::create_lazy(exec, {1.0});
    std::unique_ptr<Vec> y = x->scale(2.0);
    std::weak_ptr<const lnd::lazy::Node> first = y->get_node();
    for (int i = 0; i < 300000; ++i) {
        y = y->scale(1.0);
    }

    auto res = y->realize();

    ASSERT_TRUE(first.expired());
    ASSERT_TRUE(y->get_node()->get_inputs().empty());
    LND_ASSERT_VECTOR_NEAR(res, l({2.0}), 0.0);
}


TEST_F(ReferenceExecutor, DestroysDeepPendingGraph)
{
    auto x = Vec::create_lazy(exec, {1.0});
    std::unique_ptr<Vec> y = x->scale(2.0);
    for (int i = 0; i < 300000; ++i) {
        y = y->scale(1.0);
    }
    std::weak_ptr<const lnd::lazy::Node> last = y->get_node();

    y.reset();

    ASSERT_TRUE(last.expired());
    ASSERT_EQ(counter->realize_count(), 0);
}


TEST_F(ReferenceExecutor, WrapsKernelFailure)
{
    auto x = Vec::create_lazy(exec, {1.0, 2.0});
    auto y = x->transform("failing", 2, [](const std::vector<double>&) {
        throw std::runtime_error("out of memory");
        return std::vector<double>{};
    });
    const auto node_id = y->get_node()->get_id();

    try {
        y->realize();
        FAIL() << "realize() did not throw";
    } catch (const lnd::BackendExecutionError& err) {
        ASSERT_EQ(err.get_node_id(), node_id);
        ASSERT_EQ(err.get_node_label(), "failing");
        ASSERT_NE(std::string(err.what()).find("out of memory"),
                  std::string::npos);
        ASSERT_THROW(std::rethrow_if_nested(err), std::runtime_error);
    }
}


TEST_F(ReferenceExecutor, FailureInUpstreamNodeNamesThatNode)
{
    auto x = Vec::create_lazy(exec, {1.0, 2.0});
    auto failing = x->transform("upstream", 2, [](const std::vector<double>&) {
        throw std::runtime_error("disk full");
        return std::vector<double>{};
    });
    auto y = failing->scale(2.0);

    try {
        y->realize();
        FAIL() << "realize() did not throw";
    } catch (const lnd::BackendExecutionError& err) {
        ASSERT_EQ(err.get_node_label(), "upstream");
    }
    ASSERT_FALSE(y->get_node()->is_evaluated());
}


TEST_F(ReferenceExecutor, ReportsKernelOfWrongLength)
{
    auto x = Vec::create_lazy(exec, {1.0, 2.0});
    auto y = x->transform("short", 2, [](const std::vector<double>& in) {
        return std::vector<double>{in[0]};
    });

    try {
        y->realize();
        FAIL() << "realize() did not throw";
    } catch (const lnd::BackendExecutionError& err) {
        ASSERT_EQ(err.get_node_label(), "short");
        ASSERT_THROW(std::rethrow_if_nested(err), lnd::DimensionMismatch);
    }
}


TEST_F(ReferenceExecutor, RemovesLogger)
{
    exec->remove_logger(counter.get());
    auto x = Vec::create_lazy(exec, {1.0, 2.0});

    x->scale(2.0)->realize();

    ASSERT_EQ(counter->realize_count(), 0);
}


TEST(OmpExecutor, KnowsItsName)
{
    auto exec = lnd::OmpExecutor::create();

    ASSERT_EQ(exec->get_name(), "omp");
}


TEST(OmpExecutor, KnowsItsNumberOfThreads)
{
    auto exec = lnd::OmpExecutor::create(2);

    ASSERT_EQ(exec->get_num_threads(), 2);
}


TEST(OmpExecutor, DefaultsToAvailableThreads)
{
    auto exec = lnd::OmpExecutor::create();

    ASSERT_GT(exec->get_num_threads(), 0);
}


TEST(OmpExecutor, RealizesIndependentBranches)
{
    auto exec = lnd::OmpExecutor::create(4);
    auto counter = lnd::test::RealizeCounter::create();
    exec->add_logger(counter);
    auto x = Vec::create_lazy(exec, {1.0, 2.0, 3.0});
    std::vector<std::unique_ptr<Vec>> branches;
    for (int i = 1; i <= 8; ++i) {
        branches.push_back(x->scale(static_cast<double>(i)));
    }
    std::vector<const Vec*> parts;
    for (const auto& branch : branches) {
        parts.push_back(branch.get());
    }
    auto joined = Vec::concatenate(exec, parts);

    auto res = joined->realize();

    ASSERT_EQ(counter->evaluated_nodes(), 9);
    for (int i = 0; i < 8; ++i) {
        for (int j = 0; j < 3; ++j) {
            ASSERT_EQ(res->at(3 * i + j), (i + 1) * (j + 1.0));
        }
    }
}


TEST(OmpExecutor, WrapsKernelFailure)
{
    auto exec = lnd::OmpExecutor::create(2);
    auto x = Vec::create_lazy(exec, {1.0});
    auto ok = x->scale(2.0);
    auto failing = x->transform("failing", 1, [](const std::vector<double>&) {
        throw std::runtime_error("lost worker");
        return std::vector<double>{};
    });
    auto y = ok->add(failing.get());

    ASSERT_THROW(y->realize(), lnd::BackendExecutionError);
    ASSERT_TRUE(ok->get_node()->is_evaluated());
}


}  // namespace
