#include "TestInterpretation.h"
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace hypotest
{
  namespace
  {
    std::string formatWithPrecision(double value, int precision)
    {
      std::ostringstream os;
      os << std::setprecision(precision) << value;
      return os.str();
    }
  }

  std::string formatSignificant(double value)
  {
    return formatWithPrecision(value, 4);
  }

  std::string formatInterpretation(double pValue,
                                   double alpha,
                                   const std::string& nullHypothesis,
                                   const std::string& alternativeHypothesis)
  {
    const bool reject = pValue < alpha;

    // Start at four significant digits and add more until the printed numbers
    // compare the same way the unrounded ones do
    std::string alphaText;
    std::string pText;
    const int maxPrecision = std::numeric_limits<double>::max_digits10;
    for (int precision = 4; precision <= maxPrecision; ++precision)
      {
        alphaText = formatWithPrecision(alpha, precision);
        pText = formatWithPrecision(pValue, precision);

        const double printedP = std::strtod(pText.c_str(), nullptr);
        const double printedAlpha = std::strtod(alphaText.c_str(), nullptr);
        if ((printedP < printedAlpha) == reject)
          break;
      }

    std::ostringstream os;
    os << (reject ? "Reject" : "Fail to reject")
       << " the null hypothesis at α=" << alphaText
       << ": p=" << pText
       << (reject ? " < " : " >= ") << alphaText << ".";

    if (reject && !alternativeHypothesis.empty())
      os << " Conclusion: " << alternativeHypothesis << ".";
    else if (!reject && !nullHypothesis.empty())
      os << " Conclusion: consistent with " << nullHypothesis << ".";

    return os.str();
  }

} // namespace hypotest
