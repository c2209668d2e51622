// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "StepSizes.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace treestat
{
  namespace numdiff
  {
    namespace
    {
      bool fitsAbove(double x, double step, double reach, double upper)
      {
	return x + reach * step <= upper;
      }

      bool fitsBelow(double x, double step, double reach, double lower)
      {
	return x - reach * step >= lower;
      }

      // Largest step no bigger than room/reach that keeps x + reach*step (or
      // x - reach*step) inside the bound after rounding.
      double shrinkToRoom(double x, double room, double reach, bool upward, double bound)
      {
	double step = room / reach;
	while (step > 0.0
	       && (upward ? !fitsAbove(x, step, reach, bound) : !fitsBelow(x, step, reach, bound)))
	  step = std::nextafter(step, 0.0);
	return step;
      }
    }

    const char* toString(Stencil s)
    {
      switch (s)
	{
	case Stencil::Central:  return "central";
	case Stencil::Forward:  return "forward";
	case Stencil::Backward: return "backward";
	}
      return "unknown";
    }

    double firstDerivativeScale()
    {
      return std::sqrt(std::numeric_limits<double>::epsilon());
    }

    double secondDerivativeScale()
    {
      return std::cbrt(std::numeric_limits<double>::epsilon());
    }

    double relativeStep(double x, double scale, double minStep)
    {
      const double h = std::max(scale * std::max(std::fabs(x), 1.0), minStep);
      const double representable = (x + h) - x;
      return representable >= minStep ? representable : h;
    }

    std::vector<double> nominalSteps(const std::vector<double>& x,
				     double scale,
				     double minStep,
				     const std::optional<std::vector<double>>& baseStep)
    {
      if (!(minStep > 0.0))
	throw std::invalid_argument("nominalSteps: minStep must be positive");

      if (baseStep)
	{
	  if (baseStep->size() != x.size())
	    throw std::invalid_argument("nominalSteps: baseStep has " + std::to_string(baseStep->size())
					+ " entries but params have " + std::to_string(x.size()));

	  for (std::size_t i = 0; i < x.size(); ++i)
	    if (!((*baseStep)[i] > 0.0))
	      throw std::invalid_argument("nominalSteps: baseStep entry " + std::to_string(i)
					  + " must be positive");
	  return *baseStep;
	}

      std::vector<double> steps(x.size());
      for (std::size_t i = 0; i < x.size(); ++i)
	steps[i] = relativeStep(x[i], scale, minStep);
      return steps;
    }

    CoordinateStep fitStep(double x,
			   double step,
			   double lower,
			   double upper,
			   Stencil requested,
			   double minStep,
			   double reach,
			   std::size_t coordinate)
    {
      const bool up   = fitsAbove(x, step, reach, upper);
      const bool down = fitsBelow(x, step, reach, lower);

      switch (requested)
	{
	case Stencil::Central:
	  if (up && down)
	    return CoordinateStep{ step, Stencil::Central };
	  if (up)
	    return CoordinateStep{ step, Stencil::Forward };
	  if (down)
	    return CoordinateStep{ step, Stencil::Backward };
	  break;

	case Stencil::Forward:
	  if (up)
	    return CoordinateStep{ step, Stencil::Forward };
	  if (down)
	    return CoordinateStep{ step, Stencil::Backward };
	  break;

	case Stencil::Backward:
	  if (down)
	    return CoordinateStep{ step, Stencil::Backward };
	  if (up)
	    return CoordinateStep{ step, Stencil::Forward };
	  break;
	}

      const double roomUp   = upper - x;
      const double roomDown = x - lower;
      const bool   upward   = roomUp >= roomDown;
      const double shrunk   = upward
	? shrinkToRoom(x, roomUp, reach, true, upper)
	: shrinkToRoom(x, roomDown, reach, false, lower);

      if (shrunk < minStep)
	throw InfeasibleStepError("fitStep: coordinate " + std::to_string(coordinate)
				  + " at " + std::to_string(x) + " has only "
				  + std::to_string(std::max(roomUp, roomDown))
				  + " room inside its bounds, below the minimum step "
				  + std::to_string(minStep));

      return CoordinateStep{ shrunk, upward ? Stencil::Forward : Stencil::Backward };
    }

    double richardsonExtrapolate(std::vector<double> estimates,
				 double ratio,
				 unsigned errorOrder)
    {
      if (estimates.empty())
	throw std::invalid_argument("richardsonExtrapolate: no estimates");
      if (!(ratio > 1.0))
	throw std::invalid_argument("richardsonExtrapolate: step ratio must exceed 1");
      if (errorOrder == 0)
	throw std::invalid_argument("richardsonExtrapolate: error order must be positive");

      // estimates[s] is overwritten in place by the next tableau level
      for (std::size_t level = 1; level < estimates.size(); ++level)
	{
	  const double factor = std::pow(ratio, static_cast<double>(errorOrder * level));
	  for (std::size_t s = 0; s + level < estimates.size(); ++s)
	    estimates[s] = (factor * estimates[s + 1] - estimates[s]) / (factor - 1.0);
	}
      return estimates.front();
    }
  }
}
