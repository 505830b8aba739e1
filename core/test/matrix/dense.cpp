// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/matrix/dense.hpp>


#include <complex>
#include <memory>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/vector.hpp>


#include "core/test/utils.hpp"


namespace {


template <typename T>
class Dense : public ::testing::Test {
protected:
    using value_type = T;
    using Vec = lnd::Vector<value_type>;
    using Mtx = lnd::matrix::Dense<value_type>;

    Dense()
        : exec(lnd::ReferenceExecutor::create()),
          mtx(lnd::initialize<Mtx>({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}}, exec))
    {}

    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::unique_ptr<Mtx> mtx;
};

TYPED_TEST_SUITE(Dense, lnd::test::ValueTypes, TypenameNameGenerator);


TYPED_TEST(Dense, KnowsItsProperties)
{
    using value_type = typename TestFixture::value_type;

    ASSERT_EQ(this->mtx->get_size(), lnd::dim<2>(2, 3));
    ASSERT_EQ(this->mtx->get_dtype(), lnd::dtype_of<value_type>());
    ASSERT_EQ(this->mtx->get_values().size(), 6);
}


TYPED_TEST(Dense, StoresValuesInRowMajorOrder)
{
    using value_type = typename TestFixture::value_type;

    ASSERT_EQ(this->mtx->at(0, 2), value_type{3.0});
    ASSERT_EQ(this->mtx->at(1, 0), value_type{4.0});
}


TYPED_TEST(Dense, ThrowsOnOutOfBoundsAccess)
{
    ASSERT_THROW(this->mtx->at(2, 0), lnd::OutOfBoundsError);
    ASSERT_THROW(this->mtx->at(0, 3), lnd::OutOfBoundsError);
}


TYPED_TEST(Dense, FailsWithWrongNumberOfValues)
{
    using Mtx = typename TestFixture::Mtx;
    using value_type = typename TestFixture::value_type;

    ASSERT_THROW(Mtx::create(this->exec, lnd::dim<2>{2, 2},
                             std::vector<value_type>(3)),
                 lnd::ValueMismatch);
}


TYPED_TEST(Dense, AppliesForward)
{
    using Vec = typename TestFixture::Vec;
    using value_type = typename TestFixture::value_type;
    auto x = lnd::initialize<Vec>({1.0, 0.0, -1.0}, this->exec);

    auto res = this->mtx->forward(x);

    LND_ASSERT_VECTOR_NEAR(res, l({-2.0, -2.0}), r<value_type>::value);
}


TYPED_TEST(Dense, AppliesAdjoint)
{
    using Vec = typename TestFixture::Vec;
    using value_type = typename TestFixture::value_type;
    auto y = lnd::initialize<Vec>({1.0, 1.0}, this->exec);

    auto res = this->mtx->adjoint(y);

    LND_ASSERT_VECTOR_NEAR(res, l({5.0, 7.0, 9.0}), r<value_type>::value);
}


TYPED_TEST(Dense, AppliesForwardToLazyInput)
{
    using Vec = typename TestFixture::Vec;
    using value_type = typename TestFixture::value_type;
    auto x = Vec::create_lazy(this->exec, {1.0, 0.0, -1.0});

    auto res = this->mtx->forward(x);

    ASSERT_TRUE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({-2.0, -2.0}), r<value_type>::value);
}


TYPED_TEST(Dense, FailsWithWrongInputLength)
{
    using Vec = typename TestFixture::Vec;
    auto x = lnd::initialize<Vec>({1.0, 0.0}, this->exec);

    ASSERT_THROW(this->mtx->forward(x), lnd::DimensionMismatch);
    ASSERT_THROW(this->mtx->adjoint(lnd::initialize<Vec>({1.0, 2.0, 3.0},
                                                         this->exec)),
                 lnd::DimensionMismatch);
}


TYPED_TEST(Dense, KeepsPrecisionOfInput)
{
    using value_type = typename TestFixture::value_type;
    using other_type = lnd::next_precision<value_type>;
    auto x = lnd::initialize<lnd::Vector<other_type>>({1.0, 0.0, -1.0},
                                                      this->exec);

    auto res = this->mtx->forward(x);

    ASSERT_EQ(res->get_dtype(), lnd::dtype_of<other_type>());
    LND_ASSERT_VECTOR_NEAR(res, l({-2.0, -2.0}), r<value_type>::value);
}


TEST(RealDense, RejectsComplexInput)
{
    auto exec = lnd::ReferenceExecutor::create();
    auto mtx = lnd::initialize<lnd::matrix::Dense<double>>(
        {{1.0, 2.0}, {3.0, 4.0}}, exec);
    auto x = lnd::initialize<lnd::Vector<std::complex<double>>>(
        {std::complex<double>{1.0, 1.0}, std::complex<double>{0.0, 1.0}},
        exec);

    ASSERT_THROW(mtx->forward(x), lnd::DtypeMismatch);
}


TEST(ComplexDense, PromotesRealInput)
{
    using value_type = std::complex<double>;
    auto exec = lnd::ReferenceExecutor::create();
    auto mtx = lnd::initialize<lnd::matrix::Dense<value_type>>(
        {{value_type{0.0, 1.0}, value_type{1.0, 0.0}}}, exec);
    auto x = lnd::initialize<lnd::Vector<double>>({2.0, 3.0}, exec);

    auto res = mtx->forward(x);

    ASSERT_EQ(res->get_dtype(), lnd::dtype::complex128);
    LND_ASSERT_VECTOR_NEAR(res, l({value_type{3.0, 2.0}}), 0.0);
}


TEST(ComplexDense, ConjugatesInAdjoint)
{
    using value_type = std::complex<double>;
    auto exec = lnd::ReferenceExecutor::create();
    auto mtx = lnd::initialize<lnd::matrix::Dense<value_type>>(
        {{value_type{0.0, 1.0}, value_type{1.0, 0.0}}}, exec);
    auto y = lnd::initialize<lnd::Vector<value_type>>({value_type{1.0, 0.0}},
                                                      exec);

    auto res = mtx->adjoint(y);

    LND_ASSERT_VECTOR_NEAR(res,
                           l({value_type{0.0, -1.0}, value_type{1.0, 0.0}}),
                           0.0);
}


}  // namespace
