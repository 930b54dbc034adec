// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

namespace hypotest
{
  /**
   * @struct StudentTDistribution
   * @brief Central Student's t distribution with (possibly fractional) df > 0.
   *
   * Evaluated with boost::math::students_t, which works through the
   * regularized incomplete beta function:
   *
   *   P(|T| > |t|) = I_{df/(df+t²)}(df/2, 1/2)
   *
   * Upper tails use the complement directly, so both tails stay accurate from
   * df = 1 up to df in the hundreds of thousands.
   *
   * All functions throw InvalidParameterException for non-positive df and for
   * NaN or infinite arguments.
   */
  struct StudentTDistribution
  {
    static double cdf(double t, double df);

    // P(T > t)
    static double survival(double t, double df);

    // P(|T| >= |t|)
    static double twoTailedPValue(double t, double df);

    /**
     * @brief Quantile function.
     * @throws InvalidParameterException if p is not in (0, 1).
     * @throws ConvergenceFailureException if the root finder does not converge.
     */
    static double inverseCdf(double p, double df);
  };

} // namespace hypotest
