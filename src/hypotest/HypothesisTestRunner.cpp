#include "HypothesisTestRunner.h"
#include <algorithm>
#include <cctype>
#include "HypothesisTestException.h"
#include "InputParsing.h"
#include "NonparametricTests.h"
#include "ParametricTests.h"
#include "SampleSplitting.h"

namespace hypotest {

TestType parseTestType(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "t-test")
        return TestType::TTest;
    if (lower == "anova")
        return TestType::ANOVA;
    if (lower == "chi-square")
        return TestType::ChiSquare;
    if (lower == "mann-whitney")
        return TestType::MannWhitney;

    throw InvalidParameterException("Unknown test type '" + name +
                                    "' (expected t-test, anova, chi-square or mann-whitney)");
}

HypothesisTestRunner::HypothesisTestRunner(const EngineConfiguration& config)
    : config_(config) {
}

StatisticalTestResult HypothesisTestRunner::run(const std::string& testType,
                                                const std::string& data,
                                                const std::string& nullHypothesis,
                                                const std::string& alternativeHypothesis,
                                                std::optional<double> alpha) const {
    const TestType type = parseTestType(testType);

    auto runDecoded = [&]() -> StatisticalTestResult {
        switch (type) {
            case TestType::TTest: {
                const auto samples = parseTwoSamples(data);
                return runTTest(samples.first, samples.second, true, alpha);
            }
            case TestType::MannWhitney: {
                const auto samples = parseTwoSamples(data);
                return runMannWhitney(samples.first, samples.second, alpha);
            }
            case TestType::ANOVA:
                return runAnova(parseGroups(data), alpha);
            case TestType::ChiSquare:
                return runChiSquare(parseContingencyTable(data), alpha);
            default:
                throw InvalidParameterException("Unsupported test type '" + testType + "'");
        }
    };

    const StatisticalTestResult result = runDecoded();
    if (nullHypothesis.empty() && alternativeHypothesis.empty())
        return result;

    return result.withHypotheses(nullHypothesis, alternativeHypothesis);
}

StatisticalTestResult HypothesisTestRunner::runTTest(const Sample& sample1,
                                                     const Sample& sample2,
                                                     bool equalVariance,
                                                     std::optional<double> alpha) const {
    return tTest(sample1, sample2, equalVariance, resolveAlpha(alpha));
}

StatisticalTestResult HypothesisTestRunner::runMannWhitney(const Sample& sample1,
                                                           const Sample& sample2,
                                                           std::optional<double> alpha) const {
    return mannWhitneyTest(sample1, sample2, resolveAlpha(alpha), config_.getMannWhitneyOptions());
}

StatisticalTestResult HypothesisTestRunner::runAnova(const std::vector<Sample>& groups,
                                                     std::optional<double> alpha) const {
    return anova(groups, resolveAlpha(alpha));
}

StatisticalTestResult HypothesisTestRunner::runChiSquare(const ContingencyTable& table,
                                                         std::optional<double> alpha) const {
    return chiSquareTest(table, resolveAlpha(alpha), config_.getChiSquareOptions());
}

StatisticalTestResult HypothesisTestRunner::runOnSeries(const std::string& testType,
                                                        const Sample& series,
                                                        std::optional<double> alpha) const {
    switch (parseTestType(testType)) {
        case TestType::TTest: {
            const auto halves = splitHalves(series);
            return runTTest(halves.first, halves.second, true, alpha);
        }
        case TestType::MannWhitney: {
            const auto halves = splitHalves(series);
            return runMannWhitney(halves.first, halves.second, alpha);
        }
        case TestType::ANOVA:
            return runAnova(splitQuartileGroups(series), alpha);
        default:
            throw InvalidParameterException("Test type '" + testType +
                                            "' cannot be run on a single series");
    }
}

PowerAnalysisResult HypothesisTestRunner::runPower(double effectSize,
                                                   std::size_t sampleSizePerGroup,
                                                   std::optional<double> alpha) const {
    return powerAnalysis(effectSize, sampleSizePerGroup, resolveAlpha(alpha));
}

PowerAnalysisResult HypothesisTestRunner::runSampleSize(double effectSize,
                                                        double targetPower,
                                                        std::optional<double> alpha) const {
    return powerAnalysisForTarget(effectSize, targetPower, resolveAlpha(alpha),
                                  config_.getMaxSampleSize());
}

StatisticalTestResult runHypothesisTest(const std::string& testType,
                                        const std::string& data,
                                        const std::string& nullHypothesis,
                                        const std::string& alternativeHypothesis,
                                        double alpha) {
    HypothesisTestRunner runner(EngineConfiguration::createDefault());
    return runner.run(testType, data, nullHypothesis, alternativeHypothesis, alpha);
}

} // namespace hypotest
