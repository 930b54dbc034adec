// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "HypothesisTestException.h"

namespace hypotest
{
  using Sample = std::vector<double>;

  struct SampleStatistics
  {
    /**
     * @brief Throws unless sample holds at least minSize finite values.
     *
     * @throws InsufficientDataException if sample.size() < minSize
     * @throws InvalidParameterException if any value is NaN or infinite
     */
    static void validateSample(const Sample& sample, std::size_t minSize, const std::string& where)
    {
      if (sample.size() < minSize)
        throw InsufficientDataException(where + ": sample must contain at least " +
                                        std::to_string(minSize) + " observation" +
                                        (minSize == 1 ? "" : "s") + ", got " +
                                        std::to_string(sample.size()));

      for (double x : sample)
        {
          if (!std::isfinite(x))
            throw InvalidParameterException(where + ": sample values must be finite");
        }
    }

    // Significance levels must lie strictly inside (0, 1)
    static void validateAlpha(double alpha, const std::string& where)
    {
      if (!(alpha > 0.0 && alpha < 1.0))
        throw InvalidParameterException(where + ": alpha must be in (0, 1)");
    }

    static double computeMean(const Sample& data)
    {
      if (data.empty())
        return 0.0;

      double sum = 0.0;
      for (double x : data)
        sum += x;
      return sum / static_cast<double>(data.size());
    }

    /**
     * @brief Mean and unbiased (n - 1) variance in a single Welford pass.
     *
     * Returns {mean, 0} for a single observation and {0, 0} for an empty sample.
     */
    static std::pair<double, double> computeMeanAndVariance(const Sample& data)
    {
      const std::size_t n = data.size();
      if (n == 0)
        return {0.0, 0.0};

      double mean = 0.0;
      double m2 = 0.0;
      std::size_t k = 0;
      for (double x : data)
        {
          ++k;
          const double delta = x - mean;
          mean += delta / static_cast<double>(k);
          m2 += delta * (x - mean);
        }

      if (n < 2)
        return {mean, 0.0};

      return {mean, m2 / static_cast<double>(n - 1)};
    }

    // Σ (x - mean)²
    static double computeSumOfSquaredDeviations(const Sample& data, double mean)
    {
      double ss = 0.0;
      for (double x : data)
        {
          const double d = x - mean;
          ss += d * d;
        }
      return ss;
    }
  };

} // namespace hypotest
