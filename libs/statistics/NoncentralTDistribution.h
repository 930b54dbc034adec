// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

namespace hypotest
{
  /**
   * @struct NoncentralTDistribution
   * @brief Noncentral t distribution with df > 0 and noncentrality ncp.
   *
   * Backed by boost::math::non_central_t, which stays accurate for large
   * |ncp| where a Poisson-weighted beta series underflows. With ncp = 0 it
   * reduces to the central t distribution.
   *
   * @throws InvalidParameterException for df <= 0 or a NaN/infinite argument.
   * @throws ConvergenceFailureException if the underlying series does not converge.
   */
  struct NoncentralTDistribution
  {
    static double cdf(double t, double df, double ncp);

    // P(T > t), without forming 1 - cdf
    static double survival(double t, double df, double ncp);
  };

} // namespace hypotest
