#pragma once

#include <string>

namespace hypotest
{
  /**
   * @brief Render the decision sentence for a test outcome.
   *
   * "Reject the null hypothesis at α=0.05: p=0.004659 < 0.05. Conclusion: <alternative>."
   * "Fail to reject the null hypothesis at α=0.05: p=0.373 >= 0.05. Conclusion: consistent with <null>."
   *
   * The conclusion clause is omitted when the relevant label is empty.
   * Numbers are printed with four significant digits, or more when rounding
   * to four would make the printed p and α contradict the decision
   * (p=0.049996 < 0.05 rather than p=0.05 < 0.05).
   */
  std::string formatInterpretation(double pValue,
                                   double alpha,
                                   const std::string& nullHypothesis,
                                   const std::string& alternativeHypothesis);

  // Four significant digits, the format used for p-values and alpha in reports
  std::string formatSignificant(double value);

} // namespace hypotest
