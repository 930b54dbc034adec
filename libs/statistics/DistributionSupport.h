#pragma once

#include <cmath>
#include <stdexcept>
#include <string>
#include <boost/math/policies/policy.hpp>
#include <boost/math/policies/error_handling.hpp>
#include "HypothesisTestException.h"

namespace hypotest
{
  namespace detail
  {
    namespace bmp = boost::math::policies;

    // Every Boost.Math error we can see is raised as an exception and then
    // translated by evaluateDistribution(). Underflow stays silent (returns 0).
    using DistributionPolicy = bmp::policy<
      bmp::domain_error<bmp::throw_on_error>,
      bmp::pole_error<bmp::throw_on_error>,
      bmp::overflow_error<bmp::throw_on_error>,
      bmp::evaluation_error<bmp::throw_on_error>,
      bmp::underflow_error<bmp::ignore_error>>;

    inline void requireFiniteArgument(double value, const std::string& where, const char* name)
    {
      if (!std::isfinite(value))
        throw InvalidParameterException(where + ": " + name + " must be finite");
    }

    inline void requirePositiveDegreesOfFreedom(double df, const std::string& where)
    {
      requireFiniteArgument(df, where, "degrees of freedom");
      if (df <= 0.0)
        throw InvalidParameterException(where + ": degrees of freedom must be positive");
    }

    inline void requireOpenUnitProbability(double p, const std::string& where)
    {
      if (!(p > 0.0 && p < 1.0))
        throw InvalidParameterException(where + ": probability must be in (0, 1)");
    }

    /**
     * @brief Run a Boost.Math evaluation and translate its errors.
     *
     * Domain errors become InvalidParameterException. Evaluation errors
     * (series or root finder out of iterations) and overflow become
     * ConvergenceFailureException.
     */
    template <typename Function>
    double evaluateDistribution(Function f, const std::string& where)
    {
      try
        {
          return f();
        }
      catch (const std::domain_error& e)
        {
          throw InvalidParameterException(where + ": " + e.what());
        }
      catch (const boost::math::evaluation_error& e)
        {
          throw ConvergenceFailureException(where + ": " + e.what());
        }
      catch (const std::overflow_error& e)
        {
          throw ConvergenceFailureException(where + ": " + e.what());
        }
    }
  } // namespace detail
} // namespace hypotest
