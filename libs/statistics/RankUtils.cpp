// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "RankUtils.h"
#include <algorithm>
#include <numeric>

namespace hypotest
{
  double CombinedRanks::rankSumFirst() const
  {
    return std::accumulate(ranks.begin(), ranks.begin() + size1, 0.0);
  }

  double CombinedRanks::rankSumSecond() const
  {
    return std::accumulate(ranks.begin() + size1, ranks.end(), 0.0);
  }

  std::vector<double> averageRanks(const std::vector<double>& values, double* tieCorrection)
  {
    std::vector<std::size_t> idx(values.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(), [&values](std::size_t a, std::size_t b) {
      return values[a] < values[b];
    });

    std::vector<double> ranks(values.size(), 0.0);
    double ties = 0.0;

    std::size_t i = 0;
    while (i < idx.size())
      {
        std::size_t j = i + 1;
        while (j < idx.size() && values[idx[j]] == values[idx[i]])
          ++j;

        // positions i..j-1 hold ranks i+1..j
        const double rank = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
        for (std::size_t k = i; k < j; ++k)
          ranks[idx[k]] = rank;

        const double t = static_cast<double>(j - i);
        if (t > 1.0)
          ties += t * t * t - t;

        i = j;
      }

    if (tieCorrection)
      *tieCorrection = ties;

    return ranks;
  }

  CombinedRanks rankCombined(const std::vector<double>& sample1,
                             const std::vector<double>& sample2)
  {
    std::vector<double> pooled;
    pooled.reserve(sample1.size() + sample2.size());
    pooled.insert(pooled.end(), sample1.begin(), sample1.end());
    pooled.insert(pooled.end(), sample2.begin(), sample2.end());

    CombinedRanks result;
    result.size1 = sample1.size();
    result.size2 = sample2.size();
    result.ranks = averageRanks(pooled, &result.tieCorrection);
    return result;
  }

} // namespace hypotest
