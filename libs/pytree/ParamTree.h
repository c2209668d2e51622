// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PARAM_TREE_H
#define __PARAM_TREE_H 1

#include <cstddef>
#include <string>
#include <vector>
#include <variant>
#include <initializer_list>
#include <utility>
#include <boost/container/flat_map.hpp>

#include "TreestatException.h"

namespace treestat
{
  namespace tree
  {
    /**
     * @brief Dense numeric block stored row-major together with its shape.
     *
     * A rank-1 array of length n has shape {n}. The product of the shape
     * entries must equal values.size().
     */
    struct Array
    {
      std::vector<std::size_t> shape;
      std::vector<double>      values;

      bool operator==(const Array& rhs) const
      {
	return shape == rhs.shape && values == rhs.values;
      }
    };

    /**
     * @brief Numeric table with labeled rows and columns, stored row-major.
     */
    struct LabeledBlock
    {
      std::vector<std::string> rowLabels;
      std::vector<std::string> columnLabels;
      std::vector<double>      values;

      double at(std::size_t row, std::size_t col) const
      {
	return values.at(row * columnLabels.size() + col);
      }

      bool operator==(const LabeledBlock& rhs) const
      {
	return rowLabels == rhs.rowLabels
	  && columnLabels == rhs.columnLabels
	  && values == rhs.values;
      }
    };

    /**
     * @class ParamTree
     * @brief Nested container of numeric leaves.
     *
     * A ParamTree is exactly one of:
     *  - Scalar: a single double (a leaf of size 1),
     *  - Array: a dense numeric block (one leaf),
     *  - LabeledBlock: a labeled numeric table (one leaf),
     *  - Mapping: string keys to subtrees, always iterated in sorted key order,
     *  - Sequence: ordered subtrees.
     *
     * Mapping and Sequence nodes are containers; they hold no numbers of their
     * own. The traversal order used by flatten() is fixed by this structure:
     * mapping children by ascending key, sequence children by position, array
     * and block values row-major.
     */
    class ParamTree
    {
    public:
      enum class Kind { Scalar, Array, Mapping, Sequence, LabeledBlock };

      using Mapping  = boost::container::flat_map<std::string, ParamTree>;
      using Sequence = std::vector<ParamTree>;

      ParamTree();
      ParamTree(double value);
      ParamTree(Array array);
      ParamTree(LabeledBlock block);
      ParamTree(Mapping mapping);
      ParamTree(Sequence sequence);

      static ParamTree scalar(double value);
      static ParamTree vector(std::vector<double> values);
      static ParamTree array(std::vector<std::size_t> shape, std::vector<double> values);
      static ParamTree labeledBlock(std::vector<std::string> rowLabels,
				    std::vector<std::string> columnLabels,
				    std::vector<double> values);
      static ParamTree mapping(std::initializer_list<std::pair<const std::string, ParamTree>> entries);
      static ParamTree mapping();
      static ParamTree sequence(std::initializer_list<ParamTree> children);
      static ParamTree sequence();

      Kind kind() const;

      bool isScalar() const { return kind() == Kind::Scalar; }
      bool isArray() const { return kind() == Kind::Array; }
      bool isLabeledBlock() const { return kind() == Kind::LabeledBlock; }
      bool isMapping() const { return kind() == Kind::Mapping; }
      bool isSequence() const { return kind() == Kind::Sequence; }

      // True for the three kinds that hold numbers directly.
      bool isLeaf() const;

      // Number of scalars held by this node if it is a leaf.
      std::size_t leafSize() const;

      // Shape of this node if it is a leaf: {} for a scalar, the array
      // shape for an array, {rows, cols} for a labeled block.
      std::vector<std::size_t> leafShape() const;

      double              asScalar() const;
      const Array&        asArray() const;
      const LabeledBlock& asLabeledBlock() const;
      const Mapping&      asMapping() const;
      Mapping&            asMapping();
      const Sequence&     asSequence() const;
      Sequence&           asSequence();

      // Mapping child access. at() throws TreeStructureError for a missing key.
      const ParamTree& at(const std::string& key) const;
      ParamTree&       operator[](const std::string& key);

      // Sequence child access.
      const ParamTree& at(std::size_t index) const;

      // Number of children of a container node, 0 for a leaf.
      std::size_t size() const;

      bool operator==(const ParamTree& rhs) const;
      bool operator!=(const ParamTree& rhs) const { return !(*this == rhs); }

      static const char* kindName(Kind kind);

    private:
      std::variant<double, Array, Mapping, Sequence, LabeledBlock> m_node;
    };

    // Throws TreeStructureError if an array or block is internally inconsistent.
    void validateLeaf(const ParamTree& leaf, const std::string& path);

  } // namespace tree
} // namespace treestat

#endif
