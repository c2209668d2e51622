// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __NUMDIFF_DERIVATIVE_RESULT_H
#define __NUMDIFF_DERIVATIVE_RESULT_H 1

#include <cstddef>
#include <optional>
#include <vector>

#include "ParamTree.h"
#include "BlockSpec.h"
#include "StepSizes.h"

namespace treestat
{
  namespace numdiff
  {
    // One function call made while differentiating.
    struct FunctionEvaluation
    {
      tree::ParamTree params;
      tree::ParamTree value;
    };

    /**
     * @class DerivativeResult
     * @brief Derivative re-expressed in tree shape plus evaluation diagnostics.
     *
     * For a first derivative of a scalar function derivative() is shaped like
     * the params; for a vector-valued function it is the Jacobian in block
     * structure (outputs x params). For a second derivative it is the Hessian
     * in block structure (params x params). matrix() holds the same numbers
     * as a dense matrix with rows = outputs (or params) and cols = params.
     */
    class DerivativeResult
    {
    public:
      DerivativeResult(tree::ParamTree derivative,
		       tree::Matrix matrix,
		       std::vector<double> steps,
		       std::vector<Stencil> stencils,
		       std::size_t numEvaluations,
		       std::optional<tree::ParamTree> baseValue,
		       std::vector<FunctionEvaluation> functionValues)
	: m_derivative(std::move(derivative)),
	  m_matrix(std::move(matrix)),
	  m_steps(std::move(steps)),
	  m_stencils(std::move(stencils)),
	  m_numEvaluations(numEvaluations),
	  m_baseValue(std::move(baseValue)),
	  m_functionValues(std::move(functionValues))
      {}

      const tree::ParamTree& derivative() const
      {
	return m_derivative;
      }

      const tree::Matrix& matrix() const
      {
	return m_matrix;
      }

      // First (largest) step used on each flat params coordinate.
      const std::vector<double>& steps() const
      {
	return m_steps;
      }

      /**
       * Stencil used on each flat params coordinate. When the outputs of a
       * vector valued function fall back differently on one coordinate, this
       * is the stencil of the first output (in flat order) that fell back;
       * the other outputs keep their own quotients in matrix().
       */
      const std::vector<Stencil>& stencils() const
      {
	return m_stencils;
      }

      // Number of distinct points at which the function was evaluated. A
      // supplied f0 is not counted.
      std::size_t numEvaluations() const
      {
	return m_numEvaluations;
      }

      // Function value at the unperturbed params; empty if it was never evaluated.
      const std::optional<tree::ParamTree>& baseValue() const
      {
	return m_baseValue;
      }

      // Every evaluation in task order, filled only when requested in the options.
      const std::vector<FunctionEvaluation>& functionValues() const
      {
	return m_functionValues;
      }

    private:
      tree::ParamTree                 m_derivative;
      tree::Matrix                    m_matrix;
      std::vector<double>             m_steps;
      std::vector<Stencil>            m_stencils;
      std::size_t                     m_numEvaluations;
      std::optional<tree::ParamTree>  m_baseValue;
      std::vector<FunctionEvaluation> m_functionValues;
    };
  }
}

#endif
