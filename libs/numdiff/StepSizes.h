// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __NUMDIFF_STEP_SIZES_H
#define __NUMDIFF_STEP_SIZES_H 1

#include <cstddef>
#include <optional>
#include <vector>

#include "Bounds.h"

namespace treestat
{
  namespace numdiff
  {
    // Direction of the finite-difference stencil on one coordinate.
    enum class Stencil { Central, Forward, Backward };

    const char* toString(Stencil s);

    // Step and stencil chosen for one coordinate.
    struct CoordinateStep
    {
      double  step;
      Stencil stencil;
    };

    /**
     * @brief Relative step rule h = scale * max(|x|, 1), floored at minStep.
     *
     * scale is sqrt(eps) for first derivatives and cbrt(eps) for second
     * derivatives. The returned step is representable exactly as a
     * difference of doubles at x, i.e. (x + h) - x == h.
     */
    double relativeStep(double x, double scale, double minStep);

    double firstDerivativeScale();
    double secondDerivativeScale();

    /**
     * @brief Nominal steps for every coordinate.
     *
     * @param baseStep optional user override, one positive entry per coordinate
     * @throws std::invalid_argument if the override has the wrong length or a
     *         non-positive entry, or minStep is not positive.
     */
    std::vector<double> nominalSteps(const std::vector<double>& x,
				     double scale,
				     double minStep,
				     const std::optional<std::vector<double>>& baseStep);

    /**
     * @brief Fit one coordinate's stencil inside its bounds.
     *
     * reach is the largest multiple of the step the stencil moves the
     * coordinate by: 1 for first derivatives, 2 for second derivatives.
     *
     * A central request whose two sides do not both fit becomes forward or
     * backward; a one-sided request whose side does not fit switches to the
     * opposite side. If neither side fits, the step shrinks to the larger
     * available room.
     *
     * @throws InfeasibleStepError if the shrunk step falls below minStep.
     */
    CoordinateStep fitStep(double x,
			   double step,
			   double lower,
			   double upper,
			   Stencil requested,
			   double minStep,
			   double reach,
			   std::size_t coordinate);

    /**
     * @brief Richardson extrapolation of estimates taken at the steps
     *        h, h / ratio, h / ratio^2, ...
     *
     * errorOrder is the exponent of the leading error term of the stencil,
     * 2 for central and 1 for one-sided stencils. Level l of the tableau
     * removes the term of order errorOrder * l. A single estimate is
     * returned unchanged; a NaN estimate makes the result NaN.
     *
     * @throws std::invalid_argument if estimates is empty, ratio <= 1 or
     *         errorOrder is 0.
     */
    double richardsonExtrapolate(std::vector<double> estimates,
				 double ratio,
				 unsigned errorOrder);
  }
}

#endif
