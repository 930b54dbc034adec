// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "SampleStatistics.h"

namespace hypotest
{
  constexpr std::size_t kMinSeriesForHalves = 4;
  constexpr std::size_t kMinSeriesForQuartiles = 12;

  /**
   * @brief Splits a series at n/2: the first half in original order and the rest.
   *
   * With odd n the second half holds the extra observation.
   *
   * @throws InsufficientDataException if the series has fewer than 4 values.
   */
  std::pair<Sample, Sample> splitHalves(const Sample& series);

  /**
   * @brief Four groups of the sorted series, each of n/4 values, with the
   * last group taking the remainder.
   *
   * @throws InsufficientDataException if the series has fewer than 12 values.
   */
  std::vector<Sample> splitQuartileGroups(const Sample& series);

} // namespace hypotest
