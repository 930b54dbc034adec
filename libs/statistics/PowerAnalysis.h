// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "ParametricTests.h"
#include "StatisticalTestResult.h"

namespace hypotest
{
  constexpr std::size_t kDefaultMaxSampleSize = 10000000;

  /**
   * @brief Power of a two-sided, two-sample t-test with equal group sizes.
   *
   * When the result was produced by a sample size search, getRequiredSampleSize()
   * and getTargetPower() are populated and getSampleSizePerGroup() equals the
   * required size.
   */
  class PowerAnalysisResult
  {
  public:
    PowerAnalysisResult(double effectSize,
                        std::size_t sampleSizePerGroup,
                        double power,
                        double significanceLevel,
                        const ParameterList& parameters,
                        std::optional<std::size_t> requiredSampleSize = std::nullopt,
                        std::optional<double> targetPower = std::nullopt)
      : mEffectSize(effectSize),
        mSampleSizePerGroup(sampleSizePerGroup),
        mPower(power),
        mSignificanceLevel(significanceLevel),
        mParameters(parameters),
        mRequiredSampleSize(requiredSampleSize),
        mTargetPower(targetPower),
        mCalculatedAt(boost::posix_time::microsec_clock::universal_time())
    {}

    double getEffectSize() const { return mEffectSize; }
    std::size_t getSampleSizePerGroup() const { return mSampleSizePerGroup; }
    double getPower() const { return mPower; }
    double getSignificanceLevel() const { return mSignificanceLevel; }
    const std::optional<std::size_t>& getRequiredSampleSize() const { return mRequiredSampleSize; }
    const std::optional<double>& getTargetPower() const { return mTargetPower; }

    // Always "two-sample"
    std::string getTestType() const { return "two-sample"; }

    // NonCentrality, CriticalValue, DegreesOfFreedom
    const ParameterList& getParameters() const { return mParameters; }

    const boost::posix_time::ptime& getCalculatedAt() const { return mCalculatedAt; }

  private:
    double mEffectSize;
    std::size_t mSampleSizePerGroup;
    double mPower;
    double mSignificanceLevel;
    ParameterList mParameters;
    std::optional<std::size_t> mRequiredSampleSize;
    std::optional<double> mTargetPower;
    boost::posix_time::ptime mCalculatedAt;
  };

  /**
   * @brief Power of the pooled two-sample t-test for Cohen's d and n per group.
   *
   *   df = 2n - 2,  δ = d sqrt(n / 2),  t* = T⁻¹_df(1 - α/2)
   *   power = 1 - NCT(t*; df, δ) + NCT(-t*; df, δ)
   *
   * The sign of d does not matter. At d = 0 the power equals alpha.
   *
   * @throws InsufficientDataException if sampleSizePerGroup < 2.
   * @throws InvalidParameterException for a non-finite effect size or alpha outside (0, 1).
   */
  PowerAnalysisResult powerAnalysis(double effectSize,
                                    std::size_t sampleSizePerGroup,
                                    double alpha = kDefaultAlpha);

  /**
   * @brief Smallest n per group (>= 2) whose power reaches targetPower.
   *
   * Doubles n until the target is met, then bisects the last interval.
   *
   * @throws InvalidParameterException for effect size 0 or non-finite, target
   *         power or alpha outside (0, 1).
   * @throws ConvergenceFailureException if no n <= maxSampleSize reaches the target.
   */
  std::size_t requiredSampleSize(double effectSize,
                                 double targetPower,
                                 double alpha = kDefaultAlpha,
                                 std::size_t maxSampleSize = kDefaultMaxSampleSize);

  // requiredSampleSize() packaged as a result evaluated at the size found
  PowerAnalysisResult powerAnalysisForTarget(double effectSize,
                                             double targetPower,
                                             double alpha = kDefaultAlpha,
                                             std::size_t maxSampleSize = kDefaultMaxSampleSize);

} // namespace hypotest
