// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

namespace hypotest
{
  /**
   * @struct FDistribution
   * @brief Fisher-Snedecor F distribution with numerator df1 and denominator df2.
   *
   * F = (X1/df1) / (X2/df2) for independent chi-square X1, X2, so
   *
   *   CDF(x) = I_{df1·x/(df1·x + df2)}(df1/2, df2/2)
   *
   * Evaluated by boost::math::fisher_f.
   */
  struct FDistribution
  {
    static double cdf(double x, double df1, double df2);

    // P(F > x) = I_{df2/(df2 + df1·x)}(df2/2, df1/2)
    static double survival(double x, double df1, double df2);

    static double inverseCdf(double p, double df1, double df2);
  };

} // namespace hypotest
