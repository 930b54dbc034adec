// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
// Standard normal distribution: CDF, upper tail and quantile.

#pragma once

#include <cmath>
#include <string>
#include "NormalQuantile.h"
#include "HypothesisTestException.h"

namespace hypotest
{
  /**
   * @struct NormalDistribution
   * @brief Utility functions for the standard normal distribution N(0,1).
   *
   * Unlike the noexcept helpers in NormalQuantile.h these entry points validate
   * their arguments: NaN or infinite x, and probabilities outside (0, 1), raise
   * InvalidParameterException rather than being clamped.
   */
  struct NormalDistribution
  {
    /**
     * @brief Φ(x) = P(Z ≤ x).
     * @throws InvalidParameterException if x is NaN or infinite.
     */
    static double cdf(double x)
    {
      requireFinite(x, "NormalDistribution::cdf");
      return detail::compute_normal_cdf(x);
    }

    /**
     * @brief 1 - Φ(x), evaluated without cancellation.
     */
    static double survival(double x)
    {
      requireFinite(x, "NormalDistribution::survival");
      return detail::compute_normal_survival(x);
    }

    /**
     * @brief Φ⁻¹(p), the probit function.
     * @throws InvalidParameterException if p is not in (0, 1).
     */
    static double inverseCdf(double p)
    {
      return detail::compute_normal_quantile(p);
    }

    /**
     * @brief Two-tailed critical value z with P(|Z| > z) = alpha.
     *
     * @example
     * double z = NormalDistribution::criticalValue(0.05);  // ~1.96
     */
    static double criticalValue(double alpha)
    {
      return detail::compute_normal_critical_value(alpha);
    }

  private:
    static void requireFinite(double x, const char* where)
    {
      if (!std::isfinite(x))
        throw InvalidParameterException(std::string(where) + ": argument must be finite");
    }
  };

} // namespace hypotest
