// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ParametricTests.h"
#include <cmath>
#include "FDistribution.h"
#include "HypothesisTestException.h"
#include "StudentTDistribution.h"

namespace hypotest
{
  namespace
  {
    const char* const kTTestNull = "μ₁ = μ₂ (means are equal)";
    const char* const kTTestAlternative = "μ₁ ≠ μ₂ (means are different)";
    const char* const kAnovaNull = "All group means are equal";
    const char* const kAnovaAlternative = "At least one group mean is different";
  }

  StatisticalTestResult tTest(const Sample& sample1,
                              const Sample& sample2,
                              bool equalVariance,
                              double alpha)
  {
    const std::string where("tTest");
    SampleStatistics::validateSample(sample1, 2, where);
    SampleStatistics::validateSample(sample2, 2, where);
    SampleStatistics::validateAlpha(alpha, where);

    const double n1 = static_cast<double>(sample1.size());
    const double n2 = static_cast<double>(sample2.size());

    const auto [mean1, var1] = SampleStatistics::computeMeanAndVariance(sample1);
    const auto [mean2, var2] = SampleStatistics::computeMeanAndVariance(sample2);

    const double pooledVariance = ((n1 - 1.0) * var1 + (n2 - 1.0) * var2) / (n1 + n2 - 2.0);
    if (pooledVariance <= 0.0)
      throw InvalidParameterException(where + ": both samples have zero variance, t is undefined");

    double standardError;
    double df;
    if (equalVariance)
      {
        standardError = std::sqrt(pooledVariance * (1.0 / n1 + 1.0 / n2));
        df = n1 + n2 - 2.0;
      }
    else
      {
        const double a = var1 / n1;
        const double b = var2 / n2;
        standardError = std::sqrt(a + b);
        df = ((a + b) * (a + b)) / ((a * a) / (n1 - 1.0) + (b * b) / (n2 - 1.0));
      }

    const double t = (mean1 - mean2) / standardError;
    const double pValue = StudentTDistribution::twoTailedPValue(t, df);
    const double cohensD = (mean1 - mean2) / std::sqrt(pooledVariance);

    ParameterList parameters = {
      {"Mean1", mean1},
      {"Mean2", mean2},
      {"Variance1", var1},
      {"Variance2", var2},
      {"SampleSize1", n1},
      {"SampleSize2", n2},
      {"DegreesOfFreedom", df},
      {"StandardError", standardError}
    };
    if (equalVariance)
      parameters.emplace_back("PooledVariance", pooledVariance);
    parameters.emplace_back("CohensD", cohensD);

    return StatisticalTestResult(equalVariance ? "Student's t-test" : "Welch's t-test",
                                 TestType::TTest,
                                 equalVariance ? "Equal Variance" : "Unequal Variance",
                                 t,
                                 {df},
                                 pValue,
                                 alpha,
                                 kTTestNull,
                                 kTTestAlternative,
                                 parameters);
  }

  StatisticalTestResult anova(const std::vector<Sample>& groups, double alpha)
  {
    const std::string where("anova");
    if (groups.size() < 2)
      throw InsufficientDataException(where + ": at least 2 groups are required, got " +
                                      std::to_string(groups.size()));

    for (const auto& group : groups)
      SampleStatistics::validateSample(group, 2, where);
    SampleStatistics::validateAlpha(alpha, where);

    std::size_t totalN = 0;
    double grandSum = 0.0;
    for (const auto& group : groups)
      {
        totalN += group.size();
        for (double x : group)
          grandSum += x;
      }
    const double grandMean = grandSum / static_cast<double>(totalN);

    double ssb = 0.0;
    double ssw = 0.0;
    for (const auto& group : groups)
      {
        const double groupMean = SampleStatistics::computeMean(group);
        const double diff = groupMean - grandMean;
        ssb += static_cast<double>(group.size()) * diff * diff;
        ssw += SampleStatistics::computeSumOfSquaredDeviations(group, groupMean);
      }

    if (ssw <= 0.0)
      throw InvalidParameterException(where + ": zero within-group variation, F is undefined");

    const double k = static_cast<double>(groups.size());
    const double dfb = k - 1.0;
    const double dfw = static_cast<double>(totalN) - k;
    const double msb = ssb / dfb;
    const double msw = ssw / dfw;
    const double f = msb / msw;
    const double pValue = FDistribution::survival(f, dfb, dfw);

    ParameterList parameters = {
      {"SSB", ssb},
      {"SSW", ssw},
      {"DFB", dfb},
      {"DFW", dfw},
      {"MSB", msb},
      {"MSW", msw},
      {"TotalN", static_cast<double>(totalN)},
      {"Groups", k},
      {"EtaSquared", ssb / (ssb + ssw)}
    };

    return StatisticalTestResult("One-Way ANOVA",
                                 TestType::ANOVA,
                                 "ANOVA",
                                 f,
                                 {dfb, dfw},
                                 pValue,
                                 alpha,
                                 kAnovaNull,
                                 kAnovaAlternative,
                                 parameters);
  }

} // namespace hypotest
