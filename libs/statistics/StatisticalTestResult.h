// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace hypotest
{
  enum class TestType
    {
      TTest,
      ANOVA,
      ChiSquare,
      MannWhitney,
      PowerAnalysis
    };

  std::string testTypeToString(TestType type);

  // Named diagnostics attached to a result, kept in insertion order
  using ParameterList = std::vector<std::pair<std::string, double>>;

  /**
   * @brief Outcome of a single hypothesis test.
   *
   * Instances are immutable: the interpretation is generated once from the
   * p-value, alpha and hypothesis labels at construction. withHypotheses()
   * returns a relabelled copy with a regenerated interpretation.
   *
   * Degrees of freedom: one value for the t-test and for Mann-Whitney
   * (n1 + n2 - 2, informational only since its reference distribution is the
   * standard normal or the exact U distribution), two for ANOVA (between,
   * within) and chi-square (rows - 1, columns - 1).
   */
  class StatisticalTestResult
  {
  public:
    StatisticalTestResult(const std::string& testName,
                          TestType testType,
                          const std::string& testVariant,
                          double statistic,
                          const std::vector<double>& degreesOfFreedom,
                          double pValue,
                          double alpha,
                          const std::string& nullHypothesis,
                          const std::string& alternativeHypothesis,
                          const ParameterList& parameters,
                          const std::vector<std::string>& warnings = {},
                          bool lowExpectedFrequency = false);

    const std::string& getTestName() const { return mTestName; }
    TestType getTestType() const { return mTestType; }

    // "Equal Variance", "Unequal Variance", "ANOVA", "Chi-Square", "Non-parametric"
    const std::string& getTestVariant() const { return mTestVariant; }

    double getStatistic() const { return mStatistic; }
    const std::vector<double>& getDegreesOfFreedom() const { return mDegreesOfFreedom; }
    double getPValue() const { return mPValue; }
    double getAlpha() const { return mAlpha; }
    bool isSignificant() const { return mPValue < mAlpha; }

    const std::string& getNullHypothesis() const { return mNullHypothesis; }
    const std::string& getAlternativeHypothesis() const { return mAlternativeHypothesis; }
    const std::string& getInterpretation() const { return mInterpretation; }

    const ParameterList& getParameters() const { return mParameters; }
    std::optional<double> getParameter(const std::string& name) const;

    const std::vector<std::string>& getWarnings() const { return mWarnings; }
    bool hasWarnings() const { return !mWarnings.empty(); }

    // Set by the chi-square test when some expected cell frequency is below threshold
    bool hasLowExpectedFrequencyWarning() const { return mLowExpectedFrequency; }

    const boost::posix_time::ptime& getExecutedAt() const { return mExecutedAt; }

    /**
     * @brief Copy of this result with caller supplied hypothesis labels.
     *
     * Empty labels keep the current ones.
     */
    StatisticalTestResult withHypotheses(const std::string& nullHypothesis,
                                         const std::string& alternativeHypothesis) const;

  private:
    std::string mTestName;
    TestType mTestType;
    std::string mTestVariant;
    double mStatistic;
    std::vector<double> mDegreesOfFreedom;
    double mPValue;
    double mAlpha;
    std::string mNullHypothesis;
    std::string mAlternativeHypothesis;
    std::string mInterpretation;
    ParameterList mParameters;
    std::vector<std::string> mWarnings;
    bool mLowExpectedFrequency;
    boost::posix_time::ptime mExecutedAt;
  };

} // namespace hypotest
