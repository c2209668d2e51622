// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TREE_SPEC_H
#define __TREE_SPEC_H 1

#include <cstddef>
#include <string>
#include <vector>

#include "ParamTree.h"

namespace treestat
{
  namespace tree
  {
    /**
     * @brief Location of one leaf inside the flat vector.
     *
     * The path joins mapping keys and sequence positions with '/'. A tree that
     * is itself a single leaf has the empty path.
     */
    struct LeafInfo
    {
      std::string              path;
      std::vector<std::size_t> shape;
      std::size_t              offset;
      std::size_t              size;
    };

    /**
     * @class TreeSpec
     * @brief Immutable structural description of a ParamTree.
     *
     * Holds the ordered leaves, their shapes and offsets, the total flat
     * dimension, and a value-free copy of the tree used as the reconstruction
     * recipe. A spec is derived once from a concrete tree and can then convert
     * flat vectors of the right length back into trees of that structure.
     *
     * Invariants:
     *  - flattenLike(unflatten(v)) == v for any v with v.size() == totalDim()
     *  - unflatten(flatten(t).values) == t
     */
    class TreeSpec
    {
    public:
      explicit TreeSpec(const ParamTree& tree);

      std::size_t totalDim() const
      {
	return m_totalDim;
      }

      std::size_t numLeaves() const
      {
	return m_leaves.size();
      }

      const std::vector<LeafInfo>& leaves() const
      {
	return m_leaves;
      }

      // One entry per flat coordinate, e.g. "beta/2" or "table/r1/c2".
      std::vector<std::string> coordinateNames() const;

      // The reconstruction recipe: same structure, every value zero.
      const ParamTree& skeleton() const
      {
	return m_skeleton;
      }

      /**
       * @brief Rebuild a tree of this structure from a flat vector.
       * @throws ShapeMismatchError if values.size() != totalDim().
       */
      ParamTree unflatten(const std::vector<double>& values) const;

      /**
       * @brief Flatten a tree that must have exactly this structure.
       * @throws TreeStructureError if the tree's structure differs (different
       *         kinds, keys, sequence lengths, labels or leaf shapes).
       */
      std::vector<double> flattenLike(const ParamTree& tree) const;

      // Same structure (kinds, keys, labels, shapes); values are ignored.
      bool sameStructure(const TreeSpec& rhs) const
      {
	return m_skeleton == rhs.m_skeleton;
      }

      bool operator==(const TreeSpec& rhs) const
      {
	return sameStructure(rhs);
      }

    private:
      ParamTree             m_skeleton;
      std::vector<LeafInfo> m_leaves;
      std::size_t           m_totalDim;
    };

    struct FlatTree
    {
      std::vector<double> values;
      TreeSpec            spec;
    };

    /**
     * @brief Flatten a tree into one ordered vector of its numeric leaves.
     *
     * Mapping children are visited in ascending key order, sequence children
     * in position order, array and labeled block values row-major.
     *
     * @throws TreeStructureError for a malformed array or labeled block.
     */
    FlatTree flatten(const ParamTree& tree);

    /// Convenience alias for spec.unflatten(values).
    ParamTree unflatten(const std::vector<double>& values, const TreeSpec& spec);

    std::string joinPath(const std::string& parent, const std::string& child);

  } // namespace tree
} // namespace treestat

#endif
