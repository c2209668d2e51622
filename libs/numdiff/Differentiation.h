// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __NUMDIFF_DIFFERENTIATION_H
#define __NUMDIFF_DIFFERENTIATION_H 1

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ParamTree.h"
#include "TreeTraits.h"
#include "Bounds.h"
#include "StepSizes.h"
#include "DerivativeResult.h"
#include "IDiagnosticsObserver.h"

namespace treestat
{
  namespace numdiff
  {
    enum class FirstDerivativeMethod { Central, Forward, Backward };
    enum class SecondDerivativeMethod { CentralCross, Forward };

    const char* toString(FirstDerivativeMethod m);
    const char* toString(SecondDerivativeMethod m);

    // Accepts "central", "forward", "backward"; throws std::invalid_argument otherwise.
    FirstDerivativeMethod parseFirstDerivativeMethod(const std::string& name);

    // Accepts "central_cross", "forward"; throws std::invalid_argument otherwise.
    SecondDerivativeMethod parseSecondDerivativeMethod(const std::string& name);

    using DerivativeFunction = std::function<tree::ParamTree(const tree::ParamTree&)>;

    struct NumdiffOptions
    {
      FirstDerivativeMethod  method       = FirstDerivativeMethod::Central;
      SecondDerivativeMethod secondMethod = SecondDerivativeMethod::CentralCross;

      std::optional<Bounds> bounds;

      // 1 evaluates inline on the calling thread.
      std::size_t nCores = 1;

      // Per-coordinate step override, aligned with the flattened params.
      std::optional<std::vector<double>> baseStep;
      double minStep = 1e-8;

      // Richardson extrapolation over nSteps steps, each stepRatio times
      // smaller than the one before. nSteps = 1 takes a single step.
      std::size_t nSteps = 1;
      double stepRatio = 2.0;

      // Known function value at params. The base point is then not evaluated.
      std::optional<tree::ParamTree> f0;

      bool returnFunctionValues = false;

      std::shared_ptr<diagnostics::IDerivativeObserver> observer;
    };

    /**
     * @brief Finite-difference first derivative of func at params.
     *
     * A function returning a single number (a scalar or any one-element
     * tree) yields a derivative shaped like params. Any other output yields
     * the Jacobian in outerProductStructure(outputSpec, paramsSpec) form.
     *
     * With options.nSteps > 1 every quotient is taken at each of the steps
     * h, h / stepRatio, ... and the estimates are Richardson extrapolated
     * per stencil before the NaN fallback picks one.
     *
     * All evaluation points are listed before any is evaluated; evaluation
     * runs on options.nCores workers, so func must be safe to call
     * concurrently when nCores > 1. The result does not depend on nCores.
     *
     * @throws InvalidBoundsError, InfeasibleStepError, std::invalid_argument
     *         for bad options (nCores or nSteps of 0, stepRatio not above 1,
     *         minStep not positive), TreeStructureError if func returns
     *         trees of different structure or one unlike f0. Exceptions thrown by func propagate
     *         unchanged and no result is produced.
     */
    DerivativeResult firstDerivative(const DerivativeFunction& func,
				     const tree::ParamTree& params,
				     const NumdiffOptions& options = NumdiffOptions());

    /**
     * @brief Finite-difference Hessian of a scalar function at params.
     *
     * Returned in outerProductStructure(paramsSpec, paramsSpec) form. Only
     * pairs i <= j are evaluated and identical points are evaluated once.
     * Each stencil divides by the offsets the evaluation points actually
     * realize, so unrepresentable or clamped steps do not bias the result.
     *
     * @throws TreeStructureError if func does not return a single number,
     *         and everything firstDerivative() throws.
     */
    DerivativeResult secondDerivative(const DerivativeFunction& func,
				      const tree::ParamTree& params,
				      const NumdiffOptions& options = NumdiffOptions());

    // Convenience forms for functions over types with a TreeTraits specialization.
    template <class Params, class Func>
    DerivativeResult firstDerivativeOf(Func func,
				       const Params& params,
				       const NumdiffOptions& options = NumdiffOptions())
    {
      return firstDerivative([&func](const tree::ParamTree& t) {
	  return tree::toTree(func(tree::fromTree<Params>(t)));
	}, tree::toTree(params), options);
    }

    template <class Params, class Func>
    DerivativeResult secondDerivativeOf(Func func,
					const Params& params,
					const NumdiffOptions& options = NumdiffOptions())
    {
      return secondDerivative([&func](const tree::ParamTree& t) {
	  return tree::toTree(func(tree::fromTree<Params>(t)));
	}, tree::toTree(params), options);
    }
  }
}

#endif
