// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __NUMDIFF_BOUNDS_H
#define __NUMDIFF_BOUNDS_H 1

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include "ParamTree.h"
#include "TreeSpec.h"
#include "NumdiffException.h"

namespace treestat
{
  namespace numdiff
  {
    /**
     * @class Bounds
     * @brief Box constraints aligned with the flattened params vector.
     *
     * Unbounded coordinates hold -infinity / +infinity. A default constructed
     * Bounds is unbounded in every coordinate, whatever the dimension.
     */
    class Bounds
    {
    public:
      Bounds();

      /**
       * @throws InvalidBoundsError if the vectors differ in length or
       *         lower[i] > upper[i] (or either is NaN) for some i.
       */
      Bounds(std::vector<double> lower, std::vector<double> upper);

      /**
       * @brief Bounds given as trees keyed like the params.
       *
       * Either side may be omitted, in which case it is unbounded. A bound
       * tree may also cover a subset of the params: mapping keys and
       * trailing sequence elements it leaves out are unbounded. Leaves it
       * does give must have the shape of the matching params leaf.
       *
       * @throws InvalidBoundsError if a bound tree names a key or position
       *         the params lack, a leaf differs in shape, or lower > upper.
       */
      static Bounds fromTrees(const tree::TreeSpec& paramsSpec,
			      const std::optional<tree::ParamTree>& lower,
			      const std::optional<tree::ParamTree>& upper);

      // True if no coordinate vectors were supplied.
      bool isUnbounded() const
      {
	return m_lower.empty();
      }

      std::size_t size() const
      {
	return m_lower.size();
      }

      double lower(std::size_t i) const
      {
	return m_lower.empty() ? -std::numeric_limits<double>::infinity() : m_lower[i];
      }

      double upper(std::size_t i) const
      {
	return m_upper.empty() ? std::numeric_limits<double>::infinity() : m_upper[i];
      }

      const std::vector<double>& lowerValues() const
      {
	return m_lower;
      }

      const std::vector<double>& upperValues() const
      {
	return m_upper;
      }

      /**
       * @brief Check that a flat params vector is compatible with these bounds.
       * @throws InvalidBoundsError on a length mismatch or a coordinate
       *         outside [lower, upper].
       */
      void validate(const std::vector<double>& x) const;

    private:
      std::vector<double> m_lower;
      std::vector<double> m_upper;
    };
  }
}

#endif
