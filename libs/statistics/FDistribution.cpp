// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "FDistribution.h"
#include <boost/math/distributions/fisher_f.hpp>
#include "DistributionSupport.h"

namespace hypotest
{
  namespace
  {
    using FisherF = boost::math::fisher_f_distribution<double, detail::DistributionPolicy>;

    void validate(double x, double df1, double df2, const char* where)
    {
      detail::requirePositiveDegreesOfFreedom(df1, where);
      detail::requirePositiveDegreesOfFreedom(df2, where);
      detail::requireFiniteArgument(x, where, "x");
    }
  }

  double FDistribution::cdf(double x, double df1, double df2)
  {
    const char* where = "FDistribution::cdf";
    validate(x, df1, df2, where);

    if (x <= 0.0)
      return 0.0;

    return detail::evaluateDistribution([x, df1, df2]() {
        return boost::math::cdf(FisherF(df1, df2), x);
      }, where);
  }

  double FDistribution::survival(double x, double df1, double df2)
  {
    const char* where = "FDistribution::survival";
    validate(x, df1, df2, where);

    if (x <= 0.0)
      return 1.0;

    return detail::evaluateDistribution([x, df1, df2]() {
        return boost::math::cdf(boost::math::complement(FisherF(df1, df2), x));
      }, where);
  }

  double FDistribution::inverseCdf(double p, double df1, double df2)
  {
    const char* where = "FDistribution::inverseCdf";
    detail::requirePositiveDegreesOfFreedom(df1, where);
    detail::requirePositiveDegreesOfFreedom(df2, where);
    detail::requireOpenUnitProbability(p, where);

    if (p <= 0.5)
      return detail::evaluateDistribution([p, df1, df2]() {
          return boost::math::quantile(FisherF(df1, df2), p);
        }, where);

    return detail::evaluateDistribution([p, df1, df2]() {
        return boost::math::quantile(boost::math::complement(FisherF(df1, df2), 1.0 - p));
      }, where);
  }

} // namespace hypotest
