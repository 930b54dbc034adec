// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ChiSquareDistribution.h"
#include <boost/math/distributions/chi_squared.hpp>
#include "DistributionSupport.h"

namespace hypotest
{
  namespace
  {
    using ChiSquared = boost::math::chi_squared_distribution<double, detail::DistributionPolicy>;

    void validate(double x, double df, const char* where)
    {
      detail::requirePositiveDegreesOfFreedom(df, where);
      detail::requireFiniteArgument(x, where, "x");
    }
  }

  double ChiSquareDistribution::cdf(double x, double df)
  {
    const char* where = "ChiSquareDistribution::cdf";
    validate(x, df, where);

    if (x <= 0.0)
      return 0.0;

    return detail::evaluateDistribution([x, df]() {
        return boost::math::cdf(ChiSquared(df), x);
      }, where);
  }

  double ChiSquareDistribution::survival(double x, double df)
  {
    const char* where = "ChiSquareDistribution::survival";
    validate(x, df, where);

    if (x <= 0.0)
      return 1.0;

    return detail::evaluateDistribution([x, df]() {
        return boost::math::cdf(boost::math::complement(ChiSquared(df), x));
      }, where);
  }

  double ChiSquareDistribution::inverseCdf(double p, double df)
  {
    const char* where = "ChiSquareDistribution::inverseCdf";
    detail::requirePositiveDegreesOfFreedom(df, where);
    detail::requireOpenUnitProbability(p, where);

    // Upper-tail probabilities go through the complement to keep their precision
    if (p <= 0.5)
      return detail::evaluateDistribution([p, df]() {
          return boost::math::quantile(ChiSquared(df), p);
        }, where);

    return detail::evaluateDistribution([p, df]() {
        return boost::math::quantile(boost::math::complement(ChiSquared(df), 1.0 - p));
      }, where);
  }

} // namespace hypotest
