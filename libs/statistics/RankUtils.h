// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <vector>

namespace hypotest
{
  /**
   * @brief Ranks of two samples pooled together.
   *
   * ranks holds the 1-based rank of every observation, sample1 first and then
   * sample2, in input order. Tied values share the average of the ranks they
   * span. tieCorrection is T = Σ (t³ - t) over all groups of t tied values.
   */
  struct CombinedRanks
  {
    std::vector<double> ranks;
    double tieCorrection = 0.0;
    std::size_t size1 = 0;
    std::size_t size2 = 0;

    // Sum of the ranks that belong to sample1
    double rankSumFirst() const;

    // Sum of the ranks that belong to sample2
    double rankSumSecond() const;

    bool hasTies() const { return tieCorrection > 0.0; }
  };

  /**
   * @brief Average ranks of a single sequence, ties sharing their mean rank.
   *
   * @param values Input values; not modified.
   * @param tieCorrection If non-null, receives Σ (t³ - t) over tied groups.
   */
  std::vector<double> averageRanks(const std::vector<double>& values,
                                   double* tieCorrection = nullptr);

  /**
   * @brief Rank sample1 and sample2 as one pooled sample.
   */
  CombinedRanks rankCombined(const std::vector<double>& sample1,
                             const std::vector<double>& sample2);

} // namespace hypotest
