// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SampleSplitting.h"
#include <algorithm>
#include "HypothesisTestException.h"

namespace hypotest
{
  std::pair<Sample, Sample> splitHalves(const Sample& series)
  {
    SampleStatistics::validateSample(series, kMinSeriesForHalves, "splitHalves");

    const auto middle = series.begin() + static_cast<std::ptrdiff_t>(series.size() / 2);
    return {Sample(series.begin(), middle), Sample(middle, series.end())};
  }

  std::vector<Sample> splitQuartileGroups(const Sample& series)
  {
    SampleStatistics::validateSample(series, kMinSeriesForQuartiles, "splitQuartileGroups");

    Sample sorted(series);
    std::sort(sorted.begin(), sorted.end());

    const std::size_t groupSize = sorted.size() / 4;
    std::vector<Sample> groups;
    groups.reserve(4);

    for (std::size_t g = 0; g < 4; ++g)
      {
        auto first = sorted.begin() + static_cast<std::ptrdiff_t>(g * groupSize);
        auto last = (g == 3) ? sorted.end() : first + static_cast<std::ptrdiff_t>(groupSize);
        groups.emplace_back(first, last);
      }

    return groups;
  }

} // namespace hypotest
