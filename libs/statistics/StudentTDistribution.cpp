// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "StudentTDistribution.h"
#include <cmath>
#include <boost/math/distributions/students_t.hpp>
#include "DistributionSupport.h"

namespace hypotest
{
  namespace
  {
    using TDistribution = boost::math::students_t_distribution<double, detail::DistributionPolicy>;

    void validate(double t, double df, const char* where)
    {
      detail::requirePositiveDegreesOfFreedom(df, where);
      detail::requireFiniteArgument(t, where, "t");
    }
  }

  double StudentTDistribution::cdf(double t, double df)
  {
    const char* where = "StudentTDistribution::cdf";
    validate(t, df, where);

    return detail::evaluateDistribution([t, df]() {
        return boost::math::cdf(TDistribution(df), t);
      }, where);
  }

  double StudentTDistribution::survival(double t, double df)
  {
    const char* where = "StudentTDistribution::survival";
    validate(t, df, where);

    return detail::evaluateDistribution([t, df]() {
        return boost::math::cdf(boost::math::complement(TDistribution(df), t));
      }, where);
  }

  double StudentTDistribution::twoTailedPValue(double t, double df)
  {
    const char* where = "StudentTDistribution::twoTailedPValue";
    validate(t, df, where);

    const double p = 2.0 * detail::evaluateDistribution([t, df]() {
        return boost::math::cdf(boost::math::complement(TDistribution(df), std::fabs(t)));
      }, where);
    return (p > 1.0) ? 1.0 : p;
  }

  double StudentTDistribution::inverseCdf(double p, double df)
  {
    const char* where = "StudentTDistribution::inverseCdf";
    detail::requirePositiveDegreesOfFreedom(df, where);
    detail::requireOpenUnitProbability(p, where);

    if (p == 0.5)
      return 0.0;

    return detail::evaluateDistribution([p, df]() {
        return boost::math::quantile(TDistribution(df), p);
      }, where);
  }

} // namespace hypotest
