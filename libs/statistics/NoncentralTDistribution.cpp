// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "NoncentralTDistribution.h"
#include <boost/math/distributions/non_central_t.hpp>
#include "DistributionSupport.h"

namespace hypotest
{
  namespace
  {
    using NoncentralT = boost::math::non_central_t_distribution<double, detail::DistributionPolicy>;
  }

  double NoncentralTDistribution::cdf(double t, double df, double ncp)
  {
    const char* where = "NoncentralTDistribution::cdf";
    detail::requirePositiveDegreesOfFreedom(df, where);
    detail::requireFiniteArgument(t, where, "t");
    detail::requireFiniteArgument(ncp, where, "noncentrality");

    return detail::evaluateDistribution([t, df, ncp]() {
        return boost::math::cdf(NoncentralT(df, ncp), t);
      }, where);
  }

  double NoncentralTDistribution::survival(double t, double df, double ncp)
  {
    const char* where = "NoncentralTDistribution::survival";
    detail::requirePositiveDegreesOfFreedom(df, where);
    detail::requireFiniteArgument(t, where, "t");
    detail::requireFiniteArgument(ncp, where, "noncentrality");

    return detail::evaluateDistribution([t, df, ncp]() {
        return boost::math::cdf(boost::math::complement(NoncentralT(df, ncp), t));
      }, where);
  }

} // namespace hypotest
