/**
 * @file test_transform.cpp
 * @brief Construction, conversion, precision and application of transforms
 */

#include "test_utils.hpp"

#include <affine2d/transform.hpp>

#include <limits>
#include <type_traits>

using namespace affine2d;
using namespace affine2d::test;

// =============================================================================
// Construction
// =============================================================================

TEST_F(TransformTest, DefaultIsIdentity) {
    EXPECT_EQ(I, identity());
    EXPECT_EQ(I.xx(), 1.0);
    EXPECT_EQ(I.xy(), 0.0);
    EXPECT_EQ(I.x(), 0.0);
    EXPECT_EQ(I.yx(), 0.0);
    EXPECT_EQ(I.yy(), 1.0);
    EXPECT_EQ(I.y(), 0.0);
}

TEST_F(TransformTest, CoefficientOrder) {
    auto const & c = C.coefficients();
    EXPECT_EQ(c[0], 2.3);
    EXPECT_EQ(c[1], -0.9);
    EXPECT_EQ(c[2], -6.1);
    EXPECT_EQ(c[3], 0.7);
    EXPECT_EQ(c[4], -3.1);
    EXPECT_EQ(c[5], -5.2);
}

TEST(Construction, DefaultPrecisionIsDouble) {
    EXPECT_TRUE((std::is_same_v<transform<>::value_type, double>));
    EXPECT_TRUE((std::is_same_v<decltype(identity()), transform<double>>));
    EXPECT_EQ(precision_of(identity()), precision::float64);
}

TEST(Construction, CoefficientsCoercedToPrecision) {
    auto const t = transform<float>(1, 2, 3, 4, 5, 0.1);
    EXPECT_TRUE((std::is_same_v<decltype(t.x()), float>));
    EXPECT_EQ(t.yy(), 5.0f);
    EXPECT_EQ(t.y(), 0.1f);
}

TEST(Construction, IdentityOfEachPrecision) {
    EXPECT_EQ(identity<float>(), transform<float>(1, 0, 0, 0, 1, 0));
    EXPECT_EQ(identity<long double>(),
              transform<long double>(1, 0, 0, 0, 1, 0));
}

// =============================================================================
// Precision and conversion
// =============================================================================

TEST(Precision, Tags) {
    EXPECT_EQ(precision_of_v<float>, precision::float32);
    EXPECT_EQ(precision_of_v<double>, precision::float64);

    if constexpr(std::numeric_limits<long double>::digits == 64)
    {
        EXPECT_EQ(precision_of_v<long double>, precision::float80);
    }
    else if constexpr(std::numeric_limits<long double>::digits == 113)
    {
        EXPECT_EQ(precision_of_v<long double>, precision::float128);
    }
}

TEST(Precision, PromotionTable) {
    EXPECT_TRUE((std::is_same_v<promoted_t<float, float>, float>));
    EXPECT_TRUE((std::is_same_v<promoted_t<float, double>, double>));
    EXPECT_TRUE((std::is_same_v<promoted_t<double, float>, double>));
    EXPECT_TRUE((std::is_same_v<promoted_t<double, double>, double>));
    EXPECT_TRUE((std::is_same_v<promoted_t<float, long double>, long double>));
    EXPECT_TRUE((std::is_same_v<promoted_t<long double, double>, long double>));
    EXPECT_TRUE(
        (std::is_same_v<promoted_t<long double, long double>, long double>));
}

TEST_F(TransformTest, ConvertToSamePrecisionIsNoOp) {
    for(auto const & g: {I, A, B, C})
    {
        auto const h = convert<double>(g);
        EXPECT_TRUE((std::is_same_v<decltype(h), transform<double> const>));
        EXPECT_EQ(h, g);
        EXPECT_EQ(precision_of(h), precision_of(g));
    }
}

TEST_F(TransformTest, ConvertChangesPrecision) {
    for(auto const & g: {I, A, B})
    {
        auto const f = convert<float>(g);
        auto const l = convert<long double>(g);
        EXPECT_EQ(precision_of(f), precision::float32);
        EXPECT_EQ(precision_of(l), precision_of_v<long double>);

        for(auto i = 0u; i < 6; ++i)
        {
            EXPECT_EQ(f.coefficients()[i],
                      static_cast<float>(g.coefficients()[i]));
            EXPECT_EQ(l.coefficients()[i],
                      static_cast<long double>(g.coefficients()[i]));
        }
    }
}

TEST_F(TransformTest, ExplicitConvertingConstructor) {
    auto const f = transform<float>{B};
    EXPECT_EQ(f, convert<float>(B));
    EXPECT_EQ(transform<double>{f}, convert<double>(f));
}

// =============================================================================
// Application
// =============================================================================

TEST_F(TransformTest, IdentityLeavesPointsUnchanged) {
    for(auto const & v: vectors)
    {
        EXPECT_EQ(I(v), v);
        EXPECT_EQ(apply(I, v), v);
    }
}

TEST_F(TransformTest, ApplyForms) {
    for(auto const & g: {I, A, B})
    {
        for(auto const & v: vectors)
        {
            auto const p = g(v.x, v.y);
            EXPECT_EQ(g(v), p);
            EXPECT_EQ(apply(g, v), p);
            EXPECT_EQ(apply(g, v.x, v.y), p);
            EXPECT_EQ(g * v, p);
            EXPECT_EQ(g.apply(v.x, v.y), p);
        }
    }
}

TEST_F(TransformTest, ApplyFormula) {
    auto const p = C(0.5, -2.0);
    EXPECT_DOUBLE_EQ(p.x, 2.3*0.5 + -0.9*-2.0 + -6.1);
    EXPECT_DOUBLE_EQ(p.y, 0.7*0.5 + -3.1*-2.0 + -5.2);
}

TEST_F(TransformTest, ApplyMapsOriginToTranslation) {
    auto const p = A(0.0, 0.0);
    EXPECT_EQ(p.x, -3.0);
    EXPECT_EQ(p.y, 2.0);
}

TEST(Apply, ArgumentsCoercedToPrecision) {
    auto const t = transform<float>(2, 0, 1, 0, 2, -1);
    auto const p = t(0.1, 0.2);
    EXPECT_TRUE((std::is_same_v<decltype(p), point<float> const>));
    EXPECT_EQ(p.x, 2.0f*0.1f + 1.0f);
    EXPECT_EQ(p.y, 2.0f*0.2f - 1.0f);

    auto const q = t(point<int>{3, 4});
    EXPECT_EQ(q, (point<float>{7.0f, 7.0f}));
}

TEST(Apply, SpecialValuesPropagate) {
    auto const t = transform<>(1, 0, 0, 0, 1, 0);
    auto const inf = std::numeric_limits<double>::infinity();
    auto const nan = std::numeric_limits<double>::quiet_NaN();

    // 0*inf is NaN
    auto const p = t(inf, 1.0);
    EXPECT_EQ(p.x, inf);
    EXPECT_TRUE(std::isnan(p.y));

    auto const q = t(nan, 1.0);
    EXPECT_TRUE(std::isnan(q.x));
    EXPECT_TRUE(std::isnan(q.y));
}

TEST_F(TransformTest, CoordinatesOfDifferentRealTypes) {
    auto const expected = A(1.0, 0.5);
    EXPECT_EQ(A(1, 0.5), expected);
    EXPECT_EQ(A(1.0, 0.5f), expected);
    EXPECT_EQ(apply(A, 1, 0.5), expected);
    EXPECT_EQ(apply(A, 1.0f, 0.5), expected);

    auto const f = convert<float>(B);
    EXPECT_EQ(f(2, 0.25), f(2.0f, 0.25f));
    EXPECT_TRUE((std::is_same_v<decltype(f(2, 0.25L)), point<float>>));
}
