// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/adjoint.hpp>


#include <complex>
#include <memory>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/utils.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/matrix/dense.hpp>


#include "core/test/utils.hpp"


namespace {


template <typename T>
class Adjoint : public ::testing::Test {
protected:
    using value_type = T;
    using Vec = lnd::Vector<value_type>;
    using Mtx = lnd::matrix::Dense<value_type>;

    Adjoint()
        : exec(lnd::ReferenceExecutor::create()),
          mtx(lnd::initialize<Mtx>({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}},
                                   exec, lnd::eagerness{true, false, false,
                                                        true})),
          x(lnd::initialize<Vec>({1.0, -1.0}, exec)),
          y(lnd::initialize<Vec>({1.0, 2.0, 3.0}, exec))
    {}

    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::shared_ptr<const lnd::LinOp> mtx;
    std::unique_ptr<Vec> x;
    std::unique_ptr<Vec> y;
};

TYPED_TEST_SUITE(Adjoint, lnd::test::ValueTypes, TypenameNameGenerator);


TYPED_TEST(Adjoint, HasTransposedSize)
{
    auto op = lnd::adjoint(this->mtx);

    ASSERT_EQ(op->get_size(), lnd::dim<2>(2, 3));
    ASSERT_EQ(op->get_dtype(), this->mtx->get_dtype());
}


TYPED_TEST(Adjoint, HasTransposedEagerness)
{
    auto op = lnd::adjoint(this->mtx);

    ASSERT_EQ(op->get_eagerness(),
              (lnd::eagerness{false, true, true, false}));
}


TYPED_TEST(Adjoint, ForwardAppliesAdjointOfOperator)
{
    using value_type = typename TestFixture::value_type;
    auto op = lnd::adjoint(this->mtx);

    auto res = op->forward(this->y);

    LND_ASSERT_VECTOR_NEAR(res, l({22.0, 28.0}), r<value_type>::value);
}


TYPED_TEST(Adjoint, AdjointAppliesOperator)
{
    using value_type = typename TestFixture::value_type;
    auto op = lnd::adjoint(this->mtx);

    auto res = op->adjoint(this->x);

    LND_ASSERT_VECTOR_NEAR(res, l({-1.0, -1.0, -1.0}), r<value_type>::value);
}


TYPED_TEST(Adjoint, AdjointOfAdjointIsOperator)
{
    auto op = lnd::adjoint(lnd::adjoint(this->mtx));

    ASSERT_EQ(op, this->mtx);
}


TYPED_TEST(Adjoint, SatisfiesInnerProductIdentity)
{
    using Vec = typename TestFixture::Vec;
    using value_type = typename TestFixture::value_type;
    auto ax = this->mtx->forward(this->x);
    auto ahy = this->mtx->adjoint(this->y);

    auto lhs = lnd::as<Vec>(ax.get())->compute_conj_dot(this->y.get());
    auto rhs = this->x->compute_conj_dot(lnd::as<Vec>(ahy.get()));

    LND_ASSERT_VECTOR_NEAR(lhs, rhs, r<value_type>::value);
}


TYPED_TEST(Adjoint, FailsWithNull)
{
    ASSERT_THROW(lnd::adjoint(nullptr), lnd::InvalidStateError);
}


TEST(ComplexAdjoint, SatisfiesInnerProductIdentity)
{
    using value_type = std::complex<double>;
    using Vec = lnd::Vector<value_type>;
    auto exec = lnd::ReferenceExecutor::create();
    std::shared_ptr<const lnd::LinOp> mtx =
        lnd::initialize<lnd::matrix::Dense<value_type>>(
            {{value_type{1.0, 1.0}, value_type{0.0, 2.0}},
             {value_type{3.0, -1.0}, value_type{2.0, 0.5}}},
            exec);
    auto x = lnd::initialize<Vec>(
        {value_type{1.0, -2.0}, value_type{0.5, 1.0}}, exec);
    auto y = lnd::initialize<Vec>(
        {value_type{2.0, 1.0}, value_type{-1.0, 3.0}}, exec);

    auto ax = mtx->forward(x);
    auto ahy = lnd::adjoint(mtx)->forward(y);
    auto lhs = lnd::as<Vec>(ax.get())->compute_conj_dot(y.get());
    auto rhs = x->compute_conj_dot(lnd::as<Vec>(ahy.get()));

    LND_ASSERT_VECTOR_NEAR(lhs, rhs, 1e-14);
}


TEST(ComplexAdjoint, ConjugatesEntries)
{
    using value_type = std::complex<double>;
    using Vec = lnd::Vector<value_type>;
    auto exec = lnd::ReferenceExecutor::create();
    std::shared_ptr<const lnd::LinOp> mtx =
        lnd::matrix::Dense<value_type>::create(
            exec, lnd::dim<2>{1, 1},
            std::vector<value_type>{value_type{0.0, 1.0}});
    auto y = lnd::initialize<Vec>({value_type{1.0, 0.0}}, exec);

    auto res = lnd::adjoint(mtx)->forward(y);

    LND_ASSERT_VECTOR_NEAR(res, l({value_type{0.0, -1.0}}), 0.0);
}


}  // namespace
