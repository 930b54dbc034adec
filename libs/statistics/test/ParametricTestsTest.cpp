// ParametricTestsTest.cpp
//
// Welch and pooled two-sample t-tests and one-way ANOVA.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <vector>
#include "ParametricTests.h"
#include "HypothesisTestException.h"

using Catch::Approx;
using hypotest::tTest;
using hypotest::anova;
using hypotest::Sample;
using hypotest::StatisticalTestResult;
using hypotest::TestType;
using hypotest::InsufficientDataException;
using hypotest::InvalidParameterException;

namespace
{
  const Sample kGoldenA = {10.0, 12.0, 9.0, 11.0};
  const Sample kGoldenB = {15.0, 14.0, 16.0, 13.0};

  const Sample kUnequalA = {19.1, 21.4, 18.7, 22.0, 20.5};
  const Sample kUnequalB = {25.3, 30.1, 27.8, 22.9, 29.4, 31.0, 26.2};
}

TEST_CASE("tTest: Welch golden regression", "[ParametricTests][tTest][golden]")
{
    const StatisticalTestResult r = tTest(kGoldenA, kGoldenB);

    REQUIRE(r.getTestName() == "Welch's t-test");
    REQUIRE(r.getTestType() == TestType::TTest);
    REQUIRE(r.getTestVariant() == "Unequal Variance");
    REQUIRE(r.getStatistic() == Approx(-4.381780460041329).epsilon(1e-12));
    REQUIRE(r.getDegreesOfFreedom().size() == 1);
    REQUIRE(r.getDegreesOfFreedom()[0] == Approx(6.0).epsilon(1e-12));
    REQUIRE(r.getPValue() == Approx(0.004659214943993942).epsilon(1e-8));
    REQUIRE(r.getAlpha() == 0.05);
    REQUIRE(r.isSignificant());

    REQUIRE(*r.getParameter("Mean1") == Approx(10.5));
    REQUIRE(*r.getParameter("Mean2") == Approx(14.5));
    REQUIRE(*r.getParameter("Variance1") == Approx(5.0 / 3.0));
    REQUIRE(*r.getParameter("SampleSize2") == 4.0);
    REQUIRE_FALSE(r.getParameter("PooledVariance").has_value());
}

TEST_CASE("tTest: Welch-Satterthwaite degrees of freedom are fractional", "[ParametricTests][tTest]")
{
    const StatisticalTestResult r = tTest(kUnequalA, kUnequalB);

    REQUIRE(r.getStatistic() == Approx(-5.671619681702281).epsilon(1e-10));
    REQUIRE(r.getDegreesOfFreedom()[0] == Approx(9.175052560793631).epsilon(1e-10));
    REQUIRE(r.getPValue() == Approx(0.00028411946806337283).epsilon(1e-7));
}

TEST_CASE("tTest: pooled variance", "[ParametricTests][tTest][pooled]")
{
    const StatisticalTestResult r = tTest(kUnequalA, kUnequalB, true);

    REQUIRE(r.getTestName() == "Student's t-test");
    REQUIRE(r.getTestVariant() == "Equal Variance");
    REQUIRE(r.getStatistic() == Approx(-5.074701598123926).epsilon(1e-10));
    REQUIRE(r.getDegreesOfFreedom()[0] == 10.0);
    REQUIRE(r.getPValue() == Approx(0.0004815035626005054).epsilon(1e-7));
    REQUIRE(r.getParameter("PooledVariance").has_value());
}

TEST_CASE("tTest: swapping the samples negates t and keeps p", "[ParametricTests][tTest][symmetry]")
{
    for (bool equalVariance : {false, true})
        {
            const StatisticalTestResult ab = tTest(kUnequalA, kUnequalB, equalVariance);
            const StatisticalTestResult ba = tTest(kUnequalB, kUnequalA, equalVariance);

            REQUIRE(ab.getStatistic() == -ba.getStatistic());
            REQUIRE(ab.getPValue() == ba.getPValue());
        }
}

TEST_CASE("tTest: alpha controls significance", "[ParametricTests][tTest][alpha]")
{
    const StatisticalTestResult strict = tTest(kGoldenA, kGoldenB, false, 0.001);
    REQUIRE(strict.getAlpha() == 0.001);
    REQUIRE_FALSE(strict.isSignificant());
}

TEST_CASE("tTest: preconditions", "[ParametricTests][tTest][errors]")
{
    SECTION("fewer than two observations")
    {
        REQUIRE_THROWS_AS(tTest({1.0}, {2.0, 3.0}), InsufficientDataException);
        REQUIRE_THROWS_AS(tTest({1.0, 2.0}, {}), InsufficientDataException);
    }

    SECTION("non-finite values")
    {
        REQUIRE_THROWS_AS(tTest({1.0, std::numeric_limits<double>::quiet_NaN()}, {2.0, 3.0}),
                          InvalidParameterException);
    }

    SECTION("alpha outside (0, 1)")
    {
        REQUIRE_THROWS_AS(tTest(kGoldenA, kGoldenB, false, 0.0), InvalidParameterException);
        REQUIRE_THROWS_AS(tTest(kGoldenA, kGoldenB, false, 1.5), InvalidParameterException);
    }

    SECTION("both samples constant")
    {
        REQUIRE_THROWS_AS(tTest({2.0, 2.0, 2.0}, {5.0, 5.0}), InvalidParameterException);
    }
}

TEST_CASE("anova: three separated groups", "[ParametricTests][anova]")
{
    const StatisticalTestResult r = anova({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, {7.0, 8.0, 9.0}});

    REQUIRE(r.getTestName() == "One-Way ANOVA");
    REQUIRE(r.getTestType() == TestType::ANOVA);
    REQUIRE(r.getStatistic() == Approx(27.0).epsilon(1e-12));
    REQUIRE(r.getDegreesOfFreedom() == std::vector<double>{2.0, 6.0});
    REQUIRE(r.getPValue() == Approx(0.001).epsilon(1e-9));
    REQUIRE(r.isSignificant());

    REQUIRE(*r.getParameter("SSB") == Approx(54.0));
    REQUIRE(*r.getParameter("SSW") == Approx(6.0));
    REQUIRE(*r.getParameter("MSW") == Approx(1.0));
    REQUIRE(*r.getParameter("EtaSquared") == Approx(0.9));
}

TEST_CASE("anova: two groups reproduce the pooled t-test", "[ParametricTests][anova][tTest]")
{
    const StatisticalTestResult f = anova({kUnequalA, kUnequalB});
    const StatisticalTestResult t = tTest(kUnequalA, kUnequalB, true);

    const double t2 = t.getStatistic() * t.getStatistic();
    REQUIRE(f.getStatistic() == Approx(t2).epsilon(1e-6));
    REQUIRE(f.getPValue() == Approx(t.getPValue()).epsilon(1e-6));
}

TEST_CASE("anova: identical group means give F = 0", "[ParametricTests][anova]")
{
    const StatisticalTestResult r = anova({{1.0, 3.0}, {0.0, 4.0}, {2.0, 2.5, 1.5}});
    REQUIRE(r.getStatistic() == Approx(0.0).margin(1e-12));
    REQUIRE(r.getPValue() == Approx(1.0).margin(1e-12));
    REQUIRE_FALSE(r.isSignificant());
}

TEST_CASE("anova: preconditions", "[ParametricTests][anova][errors]")
{
    REQUIRE_THROWS_AS(anova({{1.0, 2.0, 3.0}}), InsufficientDataException);
    REQUIRE_THROWS_AS(anova({{1.0, 2.0}, {3.0}}), InsufficientDataException);
    REQUIRE_THROWS_AS(anova({{1.0, 1.0}, {3.0, 3.0}}), InvalidParameterException);
    REQUIRE_THROWS_AS(anova({{1.0, 2.0}, {3.0, 4.0}}, -0.1), InvalidParameterException);
}
