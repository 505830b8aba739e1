// SPDX-FileCopyrightText: 2017 - 2024 The Ginkgo authors
//
// SPDX-License-Identifier: BSD-3-Clause

#include <linden/core/base/vector.hpp>


#include <complex>
#include <memory>
#include <vector>


#include <gtest/gtest.h>


#include <linden/core/base/exception.hpp>
#include <linden/core/base/executor.hpp>


#include "core/test/utils.hpp"


namespace {


template <typename T>
class Vector : public ::testing::Test {
protected:
    using value_type = T;
    using Vec = lnd::Vector<value_type>;

    Vector()
        : exec(lnd::ReferenceExecutor::create()),
          x(lnd::initialize<Vec>({1.0, 2.0, 3.0}, exec)),
          y(lnd::initialize<Vec>({4.0, 5.0, 6.0}, exec))
    {}

    std::shared_ptr<lnd::ReferenceExecutor> exec;
    std::unique_ptr<Vec> x;
    std::unique_ptr<Vec> y;
};

TYPED_TEST_SUITE(Vector, lnd::test::ValueTypes, TypenameNameGenerator);


TYPED_TEST(Vector, KnowsItsSizeAndDtype)
{
    using value_type = typename TestFixture::value_type;

    ASSERT_EQ(this->x->get_length(), 3);
    ASSERT_EQ(this->x->get_size(), lnd::dim<2>(3, 1));
    ASSERT_EQ(this->x->get_dtype(), lnd::dtype_of<value_type>());
    ASSERT_EQ(this->x->get_executor(), this->exec);
}


TYPED_TEST(Vector, CreatesEagerVector)
{
    ASSERT_FALSE(this->x->is_lazy());
    LND_ASSERT_VECTOR_NEAR(this->x, l({1.0, 2.0, 3.0}), 0.0);
}


TYPED_TEST(Vector, CreatesFilledVector)
{
    using Vec = typename TestFixture::Vec;
    using value_type = typename TestFixture::value_type;

    auto filled = Vec::create_filled(this->exec, 4, value_type{2.0});

    LND_ASSERT_VECTOR_NEAR(filled, l({2.0, 2.0, 2.0, 2.0}), 0.0);
}


TYPED_TEST(Vector, SharesStorageOfCopies)
{
    auto copy = this->x->clone();

    ASSERT_EQ(copy->get_const_values(), this->x->get_const_values());
}


TYPED_TEST(Vector, CreatesLazyVectorWithoutValues)
{
    using Vec = typename TestFixture::Vec;

    auto lazy = Vec::create_lazy(this->exec, {1.0, 2.0});

    ASSERT_TRUE(lazy->is_lazy());
    ASSERT_EQ(lazy->get_length(), 2);
    ASSERT_THROW(lazy->get_data(), lnd::InvalidStateError);
    ASSERT_THROW(lazy->at(0), lnd::InvalidStateError);
}


TYPED_TEST(Vector, RealizesLazyVector)
{
    auto lazy = this->x->as_lazy();

    auto eager = lazy->realize();

    ASSERT_FALSE(eager->is_lazy());
    ASSERT_TRUE(lazy->is_lazy());
    LND_ASSERT_VECTOR_NEAR(eager, l({1.0, 2.0, 3.0}), 0.0);
}


TYPED_TEST(Vector, AsLazyKeepsEagerVector)
{
    auto lazy = this->x->as_lazy();

    ASSERT_TRUE(lazy->is_lazy());
    ASSERT_FALSE(this->x->is_lazy());
}


TYPED_TEST(Vector, RealizeOfEagerVectorIsCopy)
{
    auto eager = this->x->realize();

    ASSERT_FALSE(eager->is_lazy());
    ASSERT_EQ(eager->get_const_values(), this->x->get_const_values());
}


TYPED_TEST(Vector, RealizeThroughArrayInterface)
{
    std::unique_ptr<lnd::Array> lazy = this->x->as_lazy();

    auto eager = lazy->realize();

    ASSERT_FALSE(eager->is_lazy());
    LND_ASSERT_VECTOR_NEAR(eager, this->x, 0.0);
}


TYPED_TEST(Vector, AddsEagerVectors)
{
    auto res = this->x->add(this->y.get());

    ASSERT_FALSE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({5.0, 7.0, 9.0}), 0.0);
}


TYPED_TEST(Vector, AddsLazyVectors)
{
    auto lazy_x = this->x->as_lazy();

    auto res = lazy_x->add(this->y.get());

    ASSERT_TRUE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({5.0, 7.0, 9.0}), 0.0);
}


TYPED_TEST(Vector, SubtractsVectors)
{
    auto res = this->y->sub(this->x.get());

    LND_ASSERT_VECTOR_NEAR(res, l({3.0, 3.0, 3.0}), 0.0);
}


TYPED_TEST(Vector, MultipliesElementwise)
{
    auto res = this->x->multiply(this->y.get());

    LND_ASSERT_VECTOR_NEAR(res, l({4.0, 10.0, 18.0}), 0.0);
}


TYPED_TEST(Vector, ScalesByConstant)
{
    using value_type = typename TestFixture::value_type;

    auto res = this->x->scale(value_type{2.0});

    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 4.0, 6.0}), 0.0);
}


TYPED_TEST(Vector, ScalesByLazyScalar)
{
    using Vec = typename TestFixture::Vec;
    auto alpha = Vec::create_lazy(this->exec, {-1.0});

    auto res = this->x->scale(alpha.get());

    ASSERT_TRUE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({-1.0, -2.0, -3.0}), 0.0);
}


TYPED_TEST(Vector, AddsScaled)
{
    auto alpha = lnd::initialize<typename TestFixture::Vec>({2.0}, this->exec);

    auto res = this->x->add_scaled(alpha.get(), this->y.get());

    LND_ASSERT_VECTOR_NEAR(res, l({9.0, 12.0, 15.0}), 0.0);
}


TYPED_TEST(Vector, SubtractsScaled)
{
    auto alpha = lnd::initialize<typename TestFixture::Vec>({2.0}, this->exec);

    auto res = this->x->sub_scaled(alpha.get(), this->y.get());

    LND_ASSERT_VECTOR_NEAR(res, l({-7.0, -8.0, -9.0}), 0.0);
}


TYPED_TEST(Vector, ScaleRequiresScalar)
{
    ASSERT_THROW(this->x->scale(this->y.get()), lnd::DimensionMismatch);
}


TYPED_TEST(Vector, DividesScalars)
{
    using Vec = typename TestFixture::Vec;
    auto a = lnd::initialize<Vec>({3.0}, this->exec);
    auto b = lnd::initialize<Vec>({2.0}, this->exec);

    auto res = a->divide(b.get());

    LND_ASSERT_VECTOR_NEAR(res, l({1.5}), 0.0);
}


TYPED_TEST(Vector, DivisionByZeroYieldsZero)
{
    using Vec = typename TestFixture::Vec;
    auto a = lnd::initialize<Vec>({3.0}, this->exec);
    auto b = lnd::initialize<Vec>({0.0}, this->exec);

    auto res = a->divide(b.get());

    LND_ASSERT_VECTOR_NEAR(res, l({0.0}), 0.0);
}


TYPED_TEST(Vector, ComputesDot)
{
    using value_type = typename TestFixture::value_type;

    auto res = this->x->compute_conj_dot(this->y.get());

    ASSERT_EQ(res->get_length(), 1);
    ASSERT_EQ(res->value(), value_type{32.0});
}


TYPED_TEST(Vector, ComputesNorm)
{
    using Vec = typename TestFixture::Vec;
    auto v = lnd::initialize<Vec>({3.0, 4.0}, this->exec);

    auto sq_norm = v->compute_squared_norm2();
    auto norm = v->compute_norm2();

    ASSERT_NEAR(sq_norm->value(), 25.0, r<TypeParam>::value);
    ASSERT_NEAR(norm->value(), 5.0, r<TypeParam>::value);
}


TYPED_TEST(Vector, ComputesLazyNorm)
{
    auto lazy = this->x->as_lazy();

    auto norm = lazy->compute_norm2();

    ASSERT_TRUE(norm->is_lazy());
    ASSERT_NEAR(norm->value(), std::sqrt(14.0), r<TypeParam>::value);
}


TYPED_TEST(Vector, ValueRequiresScalar)
{
    ASSERT_THROW(this->x->value(), lnd::DimensionMismatch);
}


TYPED_TEST(Vector, AtChecksBounds)
{
    ASSERT_THROW(this->x->at(3), lnd::OutOfBoundsError);
}


TYPED_TEST(Vector, Slices)
{
    auto res = this->x->slice(1, 3);

    LND_ASSERT_VECTOR_NEAR(res, l({2.0, 3.0}), 0.0);
}


TYPED_TEST(Vector, SliceChecksBounds)
{
    ASSERT_THROW(this->x->slice(1, 4), lnd::OutOfBoundsError);
}


TYPED_TEST(Vector, Splits)
{
    auto parts = this->x->split({0, 1, 3});

    ASSERT_EQ(parts.size(), 2);
    LND_ASSERT_VECTOR_NEAR(parts[0], l({1.0}), 0.0);
    LND_ASSERT_VECTOR_NEAR(parts[1], l({2.0, 3.0}), 0.0);
}


TYPED_TEST(Vector, SplitNeedsFullLength)
{
    ASSERT_THROW(this->x->split({0, 1, 2}), lnd::ValueMismatch);
}


TYPED_TEST(Vector, ConcatenatesEagerVectors)
{
    using Vec = typename TestFixture::Vec;

    auto res = Vec::concatenate(this->exec, {this->x.get(), this->y.get()});

    ASSERT_FALSE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}), 0.0);
}


TYPED_TEST(Vector, ConcatenationWithLazyPartIsLazy)
{
    using Vec = typename TestFixture::Vec;
    auto lazy_y = this->y->as_lazy();

    auto res = Vec::concatenate(this->exec, {this->x.get(), lazy_y.get()});

    ASSERT_TRUE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}), 0.0);
}


TYPED_TEST(Vector, ThrowsOnLengthMismatch)
{
    using Vec = typename TestFixture::Vec;
    auto z = lnd::initialize<Vec>({1.0, 2.0}, this->exec);

    ASSERT_THROW(this->x->add(z.get()), lnd::DimensionMismatch);
    ASSERT_THROW(this->x->compute_conj_dot(z.get()), lnd::DimensionMismatch);
}


TYPED_TEST(Vector, TransformsEagerVector)
{
    using value_type = typename TestFixture::value_type;

    auto res = this->x->transform(
        "reverse", 3, [](const std::vector<value_type>& in) {
            return std::vector<value_type>(in.rbegin(), in.rend());
        });

    ASSERT_FALSE(res->is_lazy());
    LND_ASSERT_VECTOR_NEAR(res, l({3.0, 2.0, 1.0}), 0.0);
}


TYPED_TEST(Vector, TransformOfLazyVectorIsDeferred)
{
    using value_type = typename TestFixture::value_type;
    int calls = 0;
    auto lazy = this->x->as_lazy();

    auto res = lazy->transform(
        "reverse", 3, [&calls](const std::vector<value_type>& in) {
            ++calls;
            return std::vector<value_type>(in.rbegin(), in.rend());
        });

    ASSERT_TRUE(res->is_lazy());
    ASSERT_EQ(calls, 0);
    LND_ASSERT_VECTOR_NEAR(res, l({3.0, 2.0, 1.0}), 0.0);
    ASSERT_EQ(calls, 1);
}


TYPED_TEST(Vector, TransformChecksResultLength)
{
    using value_type = typename TestFixture::value_type;

    ASSERT_THROW(this->x->transform("short", 3,
                                    [](const std::vector<value_type>& in) {
                                        return std::vector<value_type>(2);
                                    }),
                 lnd::DimensionMismatch);
}


TYPED_TEST(Vector, ConvertsToNextPrecision)
{
    using next_type = lnd::next_precision<typename TestFixture::value_type>;

    auto res = this->x->convert_to_next_precision();

    ASSERT_EQ(res->get_dtype(), lnd::dtype_of<next_type>());
    LND_ASSERT_VECTOR_NEAR(res, l({1.0, 2.0, 3.0}), 0.0);
}


TYPED_TEST(Vector, MakesComplex)
{
    using complex_type = lnd::to_complex<typename TestFixture::value_type>;

    auto res = this->x->make_complex();

    ASSERT_EQ(res->get_dtype(), lnd::dtype_of<complex_type>());
    LND_ASSERT_VECTOR_NEAR(res, l({1.0, 2.0, 3.0}), 0.0);
}


TEST(ComplexVector, ComputesConjugatedDot)
{
    using value_type = std::complex<double>;
    auto exec = lnd::ReferenceExecutor::create();
    auto x = lnd::initialize<lnd::Vector<value_type>>({value_type{1.0, 2.0}},
                                                      exec);
    auto y = lnd::initialize<lnd::Vector<value_type>>({value_type{3.0, 1.0}},
                                                      exec);

    auto res = x->compute_conj_dot(y.get());

    // (1 - 2i) * (3 + i)
    ASSERT_EQ(res->value(), value_type(5.0, -5.0));
}


TEST(ComplexVector, Conjugates)
{
    using value_type = std::complex<float>;
    auto exec = lnd::ReferenceExecutor::create();
    auto x = lnd::initialize<lnd::Vector<value_type>>(
        {value_type{1.0, 2.0}, value_type{-3.0, -1.0}}, exec);

    auto res = x->conj();

    ASSERT_EQ(res->at(0), value_type(1.0, -2.0));
    ASSERT_EQ(res->at(1), value_type(-3.0, 1.0));
}


}  // namespace
