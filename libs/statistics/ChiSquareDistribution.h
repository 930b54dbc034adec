// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

namespace hypotest
{
  /**
   * @struct ChiSquareDistribution
   * @brief Chi-square distribution with df > 0 (fractional df allowed).
   *
   * CDF(x) = P(df/2, x/2), the regularized lower incomplete gamma function,
   * evaluated by boost::math::chi_squared. Negative x is inside the domain of
   * the function and maps to probability 0.
   */
  struct ChiSquareDistribution
  {
    static double cdf(double x, double df);

    // P(X > x), the complement Q(df/2, x/2), without forming 1 - cdf
    static double survival(double x, double df);

    static double inverseCdf(double p, double df);
  };

} // namespace hypotest
