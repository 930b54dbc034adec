// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PowerAnalysis.h"
#include <algorithm>
#include <cmath>
#include "HypothesisTestException.h"
#include "NoncentralTDistribution.h"
#include "SampleStatistics.h"
#include "StudentTDistribution.h"

namespace hypotest
{
  namespace
  {
    struct PowerComputation
    {
      double power;
      double nonCentrality;
      double criticalValue;
      double degreesOfFreedom;
    };

    PowerComputation computePower(double effectSize, std::size_t n, double alpha)
    {
      const double size = static_cast<double>(n);
      const double df = 2.0 * size - 2.0;
      const double ncp = std::fabs(effectSize) * std::sqrt(size / 2.0);
      const double tCrit = StudentTDistribution::inverseCdf(1.0 - alpha / 2.0, df);

      const double power = NoncentralTDistribution::survival(tCrit, df, ncp)
        + NoncentralTDistribution::cdf(-tCrit, df, ncp);

      return {std::min(1.0, std::max(0.0, power)), ncp, tCrit, df};
    }

    void validateEffectSize(double effectSize, const std::string& where)
    {
      if (!std::isfinite(effectSize))
        throw InvalidParameterException(where + ": effect size must be finite");
    }

    PowerAnalysisResult makeResult(double effectSize,
                                   std::size_t n,
                                   double alpha,
                                   std::optional<std::size_t> required,
                                   std::optional<double> target)
    {
      const PowerComputation pc = computePower(effectSize, n, alpha);
      ParameterList parameters = {
        {"NonCentrality", pc.nonCentrality},
        {"CriticalValue", pc.criticalValue},
        {"DegreesOfFreedom", pc.degreesOfFreedom}
      };

      return PowerAnalysisResult(effectSize, n, pc.power, alpha, parameters, required, target);
    }
  }

  PowerAnalysisResult powerAnalysis(double effectSize,
                                    std::size_t sampleSizePerGroup,
                                    double alpha)
  {
    const std::string where("powerAnalysis");
    validateEffectSize(effectSize, where);
    SampleStatistics::validateAlpha(alpha, where);
    if (sampleSizePerGroup < 2)
      throw InsufficientDataException(where + ": sample size per group must be at least 2, got " +
                                      std::to_string(sampleSizePerGroup));

    return makeResult(effectSize, sampleSizePerGroup, alpha, std::nullopt, std::nullopt);
  }

  std::size_t requiredSampleSize(double effectSize,
                                 double targetPower,
                                 double alpha,
                                 std::size_t maxSampleSize)
  {
    const std::string where("requiredSampleSize");
    validateEffectSize(effectSize, where);
    SampleStatistics::validateAlpha(alpha, where);

    if (effectSize == 0.0)
      throw InvalidParameterException(where + ": effect size 0 never exceeds power alpha");
    if (!(targetPower > 0.0 && targetPower < 1.0))
      throw InvalidParameterException(where + ": target power must be in (0, 1)");
    if (maxSampleSize < 2)
      throw InvalidParameterException(where + ": maximum sample size must be at least 2");

    auto reaches = [&](std::size_t n) {
      return computePower(effectSize, n, alpha).power >= targetPower;
    };

    if (reaches(2))
      return 2;

    // Invariant: power(lo) < target <= power(hi)
    std::size_t lo = 2;
    std::size_t hi = 4;
    while (true)
      {
        if (hi >= maxSampleSize)
          {
            if (!reaches(maxSampleSize))
              throw ConvergenceFailureException(where + ": target power not reached within " +
                                                std::to_string(maxSampleSize) +
                                                " observations per group");
            hi = maxSampleSize;
            break;
          }

        if (reaches(hi))
          break;

        lo = hi;
        hi *= 2;
      }

    while (hi - lo > 1)
      {
        const std::size_t mid = lo + (hi - lo) / 2;
        if (reaches(mid))
          hi = mid;
        else
          lo = mid;
      }

    return hi;
  }

  PowerAnalysisResult powerAnalysisForTarget(double effectSize,
                                             double targetPower,
                                             double alpha,
                                             std::size_t maxSampleSize)
  {
    const std::size_t n = requiredSampleSize(effectSize, targetPower, alpha, maxSampleSize);
    return makeResult(effectSize, n, alpha, n, targetPower);
  }

} // namespace hypotest
