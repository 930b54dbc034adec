// RankUtilsTest.cpp
//
// Average ranks with ties and the pooled-sample tie correction used by the
// Mann-Whitney variance.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "RankUtils.h"

using Catch::Approx;
using hypotest::averageRanks;
using hypotest::rankCombined;
using hypotest::CombinedRanks;

TEST_CASE("averageRanks: distinct values", "[RankUtils]")
{
    const std::vector<double> values = {3.2, -1.0, 7.5, 0.0};
    double ties = -1.0;
    const std::vector<double> ranks = averageRanks(values, &ties);

    REQUIRE(ranks == std::vector<double>{3.0, 1.0, 4.0, 2.0});
    REQUIRE(ties == 0.0);
}

TEST_CASE("averageRanks: tied values share the mean rank", "[RankUtils][ties]")
{
    SECTION("one pair")
    {
        const std::vector<double> ranks = averageRanks({1.0, 2.0, 2.0, 3.0});
        REQUIRE(ranks == std::vector<double>{1.0, 2.5, 2.5, 4.0});
    }

    SECTION("a triple and a pair")
    {
        double ties = 0.0;
        const std::vector<double> ranks = averageRanks({5.0, 5.0, 1.0, 5.0, 9.0, 9.0}, &ties);

        REQUIRE(ranks == std::vector<double>{3.0, 3.0, 1.0, 3.0, 5.5, 5.5});
        // (27 - 3) + (8 - 2)
        REQUIRE(ties == Approx(30.0));
    }

    SECTION("all values tied")
    {
        double ties = 0.0;
        const std::vector<double> ranks = averageRanks({4.0, 4.0, 4.0, 4.0}, &ties);

        REQUIRE(ranks == std::vector<double>(4, 2.5));
        REQUIRE(ties == Approx(60.0));
    }

    SECTION("ranks always sum to n(n+1)/2")
    {
        const std::vector<double> values = {2.0, 8.0, 2.0, 2.0, -4.0, 8.0, 0.5};
        const std::vector<double> ranks = averageRanks(values);
        double sum = 0.0;
        for (double r : ranks)
            sum += r;
        REQUIRE(sum == Approx(28.0));
    }
}

TEST_CASE("averageRanks: empty input", "[RankUtils]")
{
    double ties = 5.0;
    REQUIRE(averageRanks({}, &ties).empty());
    REQUIRE(ties == 0.0);
}

TEST_CASE("rankCombined: pooled ranks keep sample order", "[RankUtils][combined]")
{
    const std::vector<double> sample1 = {1.0, 2.0, 2.0, 3.0};
    const std::vector<double> sample2 = {2.0, 3.0, 4.0, 5.0};
    const std::vector<double> sample1Copy = sample1;

    const CombinedRanks ranks = rankCombined(sample1, sample2);

    REQUIRE(ranks.size1 == 4);
    REQUIRE(ranks.size2 == 4);
    REQUIRE(ranks.ranks == std::vector<double>{1.0, 3.0, 3.0, 5.5, 3.0, 5.5, 7.0, 8.0});
    REQUIRE(ranks.rankSumFirst() == Approx(12.5));
    REQUIRE(ranks.rankSumSecond() == Approx(23.5));
    REQUIRE(ranks.tieCorrection == Approx(30.0));
    REQUIRE(ranks.hasTies());

    // inputs are left alone
    REQUIRE(sample1 == sample1Copy);
}

TEST_CASE("rankCombined: complete separation", "[RankUtils][combined]")
{
    const CombinedRanks ranks = rankCombined({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0});

    REQUIRE(ranks.rankSumFirst() == Approx(6.0));
    REQUIRE(ranks.rankSumSecond() == Approx(15.0));
    REQUIRE_FALSE(ranks.hasTies());
}
