// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/sum.hpp>


#include <complex>
#include <memory>
#include <string>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/scaled.hpp>
#include <linden/core/base/vector.hpp>
#include <linden/core/matrix/dense.hpp>
#include <linden/core/matrix/identity.hpp>
#include <linden/core/matrix/zero.hpp>


#include "core/test/utils.hpp"


namespace {


template <typename T>
class Sum : public ::testing::Test {
protected:
    using value_type = T;
    using Vec = lnd::Vector<value_type>;
    using Id = lnd::matrix::Identity<value_type>;
    using Zero = lnd::matrix::Zero<value_type>;
    using Mtx = lnd::matrix::Dense<value_type>;

    Sum()
        : exec(lnd::ReferenceExecutor::create()),
          identity(Id::create(exec, 4)),
          zero(Zero::create(exec, lnd::dim<2>{4, 4})),
          x(lnd::initialize<Vec>({1.0, 2.0, 3.0, 4.0}, exec))
    {}

    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::shared_ptr<const lnd::LinOp> identity;
    std::shared_ptr<const lnd::LinOp> zero;
    std::unique_ptr<Vec> x;
};

TYPED_TEST_SUITE(Sum, lnd::test::ValueTypes, TypenameNameGenerator);


TYPED_TEST(Sum, KnowsItsOperators)
{
    auto sum = lnd::Sum::create(this->identity, this->zero);

    ASSERT_EQ(sum->get_size(), lnd::dim<2>(4, 4));
    ASSERT_EQ(sum->get_operators().size(), 2);
    ASSERT_EQ(sum->get_operators()[0], this->identity);
    ASSERT_EQ(sum->get_operators()[1], this->zero);
    ASSERT_EQ(sum->get_children().size(), 2);
}


TYPED_TEST(Sum, SumsScaledIdentityAndZero)
{
    using value_type = typename TestFixture::value_type;
    auto op = lnd::sum(lnd::scale(this->identity, value_type{2.0}),
                       this->zero);

    auto res = op->forward(this->x);

    ASSERT_FALSE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 4.0, 6.0, 8.0}), 0.0);
}


TYPED_TEST(Sum, ScalesByRealConstant)
{
    auto op = lnd::sum(lnd::scale(this->identity, 2.0), this->zero);

    auto res = op->forward(this->x);

    ASSERT_TRUE(lnd::is_double_precision(op->get_dtype()));
    ASSERT_EQ(res->get_dtype(), this->x->get_dtype());
    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 4.0, 6.0, 8.0}), r<TypeParam>::value);
}


TYPED_TEST(Sum, AppliesAdjoint)
{
    using value_type = typename TestFixture::value_type;
    using Mtx = typename TestFixture::Mtx;
    using Vec = typename TestFixture::Vec;
    std::shared_ptr<const lnd::LinOp> a =
        lnd::initialize<Mtx>({I<value_type>{1.0, 2.0}, I<value_type>{3.0, 4.0}}, this->exec);
    std::shared_ptr<const lnd::LinOp> b =
        lnd::initialize<Mtx>({I<value_type>{1.0, 0.0}, I<value_type>{0.0, 1.0}}, this->exec);
    auto y = lnd::initialize<Vec>({1.0, 1.0}, this->exec);

    auto res = lnd::sum(a, b)->adjoint(y);

    LND_ASSERT_VECTOR_NEAR(res, l({5.0, 7.0}), r<value_type>::value);
}


TYPED_TEST(Sum, KeepsLazyInputLazy)
{
    using value_type = typename TestFixture::value_type;
    auto op = lnd::sum(lnd::scale(this->identity, value_type{2.0}),
                       this->zero);
    auto lazy_x = this->x->as_lazy();

    auto res = op->forward(lazy_x);

    ASSERT_TRUE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 4.0, 6.0, 8.0}), 0.0);
}


TYPED_TEST(Sum, FailsWithDifferentSizes)
{
    using Zero = typename TestFixture::Zero;
    std::shared_ptr<const lnd::LinOp> wide =
        Zero::create(this->exec, lnd::dim<2>{4, 5});

    ASSERT_THROW(lnd::sum(this->identity, wide), lnd::DimensionMismatch);
}


TYPED_TEST(Sum, NamesOperatorsOfDifferentSizes)
{
    using Zero = typename TestFixture::Zero;
    std::shared_ptr<const lnd::LinOp> wide =
        Zero::create(this->exec, lnd::dim<2>{4, 5});

    try {
        lnd::sum(this->identity, this->zero, wide);
        FAIL() << "sum() did not throw";
    } catch (const lnd::DimensionMismatch& err) {
        ASSERT_NE(std::string(err.what()).find(
                      "operator 0 [4 x 4] and operator 2 [4 x 5]"),
                  std::string::npos);
    }
}


TYPED_TEST(Sum, FailsWithDifferentEagerness)
{
    using Id = typename TestFixture::Id;
    std::shared_ptr<const lnd::LinOp> eager_identity =
        Id::create(this->exec, 4, lnd::eagerness{true, true, false, false});

    ASSERT_THROW(lnd::sum(this->identity, eager_identity),
                 lnd::InvalidStateError);
}


TYPED_TEST(Sum, InheritsEagernessOfOperators)
{
    using Id = typename TestFixture::Id;
    const lnd::eagerness flags{true, false, false, true};
    std::shared_ptr<const lnd::LinOp> a = Id::create(this->exec, 4, flags);
    std::shared_ptr<const lnd::LinOp> b = Id::create(this->exec, 4, flags);

    auto op = lnd::sum(a, b);

    ASSERT_EQ(op->get_eagerness(), flags);
}


TYPED_TEST(Sum, FailsWithoutOperators)
{
    ASSERT_THROW(lnd::sum(std::vector<std::shared_ptr<const lnd::LinOp>>{}),
                 lnd::InvalidStateError);
}


TEST(MixedSum, FailsWhenMixingRealAndComplex)
{
    auto exec = lnd::ReferenceExecutor::create();
    std::shared_ptr<const lnd::LinOp> real_op =
        lnd::matrix::Identity<double>::create(exec, 3);
    std::shared_ptr<const lnd::LinOp> complex_op =
        lnd::matrix::Identity<std::complex<double>>::create(exec, 3);

    ASSERT_THROW(lnd::sum(real_op, complex_op), lnd::DtypeMismatch);
}


TEST(MixedSum, PromotesPrecision)
{
    auto exec = lnd::ReferenceExecutor::create();
    std::shared_ptr<const lnd::LinOp> single_op =
        lnd::matrix::Identity<float>::create(exec, 2);
    std::shared_ptr<const lnd::LinOp> double_op =
        lnd::matrix::Identity<double>::create(exec, 2);
    auto x = lnd::initialize<lnd::Vector<double>>({1.0, 2.0}, exec);

    auto op = lnd::sum(single_op, double_op);
    auto res = op->forward(x);

    ASSERT_EQ(op->get_dtype(), lnd::dtype::float64);
    ASSERT_EQ(res->get_dtype(), lnd::dtype::float64);
    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 4.0}), 0.0);
}


}  // namespace
