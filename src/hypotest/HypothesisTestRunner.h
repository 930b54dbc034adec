#pragma once

#include <optional>
#include <string>
#include "EngineConfiguration.h"
#include "PowerAnalysis.h"
#include "SampleStatistics.h"
#include "StatisticalTestResult.h"

namespace hypotest {

/**
 * @brief Parse "t-test", "anova", "chi-square" or "mann-whitney" (case-insensitive)
 *
 * @throws InvalidParameterException for any other name, including "power",
 *         which is not a hypothesis test.
 */
TestType parseTestType(const std::string& name);

/**
 * @brief Runs the statistics library from text encoded inputs using the
 * options of an EngineConfiguration.
 *
 * Data encodings: "a,b,c|d,e,f" for the t-test and Mann-Whitney, JSON nested
 * arrays for ANOVA groups and chi-square tables.
 */
class HypothesisTestRunner {
public:
    explicit HypothesisTestRunner(const EngineConfiguration& config);

    /**
     * @brief Decode data and run the named test.
     *
     * The t-test runs the pooled (equal variance) form. Non-empty hypothesis
     * labels replace the defaults and regenerate the interpretation. When
     * alpha is not given the configured alpha is used.
     */
    StatisticalTestResult run(const std::string& testType,
                              const std::string& data,
                              const std::string& nullHypothesis = "",
                              const std::string& alternativeHypothesis = "",
                              std::optional<double> alpha = std::nullopt) const;

    StatisticalTestResult runTTest(const Sample& sample1,
                                   const Sample& sample2,
                                   bool equalVariance,
                                   std::optional<double> alpha = std::nullopt) const;

    StatisticalTestResult runMannWhitney(const Sample& sample1,
                                         const Sample& sample2,
                                         std::optional<double> alpha = std::nullopt) const;

    StatisticalTestResult runAnova(const std::vector<Sample>& groups,
                                   std::optional<double> alpha = std::nullopt) const;

    StatisticalTestResult runChiSquare(const ContingencyTable& table,
                                       std::optional<double> alpha = std::nullopt) const;

    /**
     * @brief Test a single series against itself.
     *
     * t-test (pooled) and Mann-Whitney compare the first half of the series
     * with the rest; ANOVA compares the four quartile groups of the sorted
     * series. Chi-square has no single series form.
     */
    StatisticalTestResult runOnSeries(const std::string& testType,
                                      const Sample& series,
                                      std::optional<double> alpha = std::nullopt) const;

    PowerAnalysisResult runPower(double effectSize,
                                 std::size_t sampleSizePerGroup,
                                 std::optional<double> alpha = std::nullopt) const;

    // Sample size search bounded by the configured max_sample_size
    PowerAnalysisResult runSampleSize(double effectSize,
                                      double targetPower,
                                      std::optional<double> alpha = std::nullopt) const;

    const EngineConfiguration& getConfiguration() const { return config_; }

private:
    double resolveAlpha(const std::optional<double>& alpha) const {
        return alpha ? *alpha : config_.getAlpha();
    }

    EngineConfiguration config_;
};

/**
 * @brief Run one test with the default engine configuration
 */
StatisticalTestResult runHypothesisTest(const std::string& testType,
                                        const std::string& data,
                                        const std::string& nullHypothesis,
                                        const std::string& alternativeHypothesis,
                                        double alpha);

} // namespace hypotest
