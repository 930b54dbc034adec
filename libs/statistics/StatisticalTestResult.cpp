// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "StatisticalTestResult.h"
#include <algorithm>
#include "TestInterpretation.h"

namespace hypotest
{
  std::string testTypeToString(TestType type)
  {
    switch (type)
      {
      case TestType::TTest:
        return "TTest";
      case TestType::ANOVA:
        return "ANOVA";
      case TestType::ChiSquare:
        return "ChiSquare";
      case TestType::MannWhitney:
        return "MannWhitney";
      case TestType::PowerAnalysis:
        return "PowerAnalysis";
      }
    return "Unknown";
  }

  StatisticalTestResult::StatisticalTestResult(const std::string& testName,
                                               TestType testType,
                                               const std::string& testVariant,
                                               double statistic,
                                               const std::vector<double>& degreesOfFreedom,
                                               double pValue,
                                               double alpha,
                                               const std::string& nullHypothesis,
                                               const std::string& alternativeHypothesis,
                                               const ParameterList& parameters,
                                               const std::vector<std::string>& warnings,
                                               bool lowExpectedFrequency)
    : mTestName(testName),
      mTestType(testType),
      mTestVariant(testVariant),
      mStatistic(statistic),
      mDegreesOfFreedom(degreesOfFreedom),
      mPValue(pValue),
      mAlpha(alpha),
      mNullHypothesis(nullHypothesis),
      mAlternativeHypothesis(alternativeHypothesis),
      mInterpretation(formatInterpretation(pValue, alpha, nullHypothesis, alternativeHypothesis)),
      mParameters(parameters),
      mWarnings(warnings),
      mLowExpectedFrequency(lowExpectedFrequency),
      mExecutedAt(boost::posix_time::microsec_clock::universal_time())
  {}

  std::optional<double> StatisticalTestResult::getParameter(const std::string& name) const
  {
    auto it = std::find_if(mParameters.begin(), mParameters.end(),
                           [&name](const ParameterList::value_type& entry) {
                             return entry.first == name;
                           });
    if (it == mParameters.end())
      return std::nullopt;

    return it->second;
  }

  StatisticalTestResult
  StatisticalTestResult::withHypotheses(const std::string& nullHypothesis,
                                        const std::string& alternativeHypothesis) const
  {
    StatisticalTestResult copy(*this);
    if (!nullHypothesis.empty())
      copy.mNullHypothesis = nullHypothesis;
    if (!alternativeHypothesis.empty())
      copy.mAlternativeHypothesis = alternativeHypothesis;

    copy.mInterpretation = formatInterpretation(copy.mPValue, copy.mAlpha,
                                                copy.mNullHypothesis,
                                                copy.mAlternativeHypothesis);
    return copy;
  }

} // namespace hypotest
