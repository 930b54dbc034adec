// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __HYPOTEST_EXCEPTION_H
#define __HYPOTEST_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace hypotest
{
  // Base class for every error raised by the hypothesis testing engine
  class HypothesisTestException : public std::runtime_error
  {
  public:
    explicit HypothesisTestException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~HypothesisTestException() = default;
  };

  // Malformed distribution or test parameters: non-positive degrees of
  // freedom, probabilities outside (0, 1), NaN or infinite inputs.
  class InvalidParameterException : public HypothesisTestException
  {
  public:
    explicit InvalidParameterException(const std::string& msg)
      : HypothesisTestException(msg) {}
  };

  // A sample or group has fewer observations than the test requires
  class InsufficientDataException : public HypothesisTestException
  {
  public:
    explicit InsufficientDataException(const std::string& msg)
      : HypothesisTestException(msg) {}
  };

  // A contingency table row or column sums to zero
  class DegenerateTableException : public HypothesisTestException
  {
  public:
    explicit DegenerateTableException(const std::string& msg)
      : HypothesisTestException(msg) {}
  };

  // An iterative numerical routine exceeded its iteration cap
  class ConvergenceFailureException : public HypothesisTestException
  {
  public:
    explicit ConvergenceFailureException(const std::string& msg)
      : HypothesisTestException(msg) {}
  };

} // namespace hypotest

#endif // __HYPOTEST_EXCEPTION_H
