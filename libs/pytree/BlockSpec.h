#pragma once

#include <cstddef>
#include <vector>
#include <stdexcept>

#include "TreeSpec.h"

namespace treestat
{
  namespace tree
  {
    /**
     * @brief Dense row-major matrix used for Jacobians, Hessians and covariances.
     */
    struct Matrix
    {
      std::size_t         rows = 0;
      std::size_t         cols = 0;
      std::vector<double> data;

      Matrix() = default;

      Matrix(std::size_t r, std::size_t c, double fill = 0.0)
	: rows(r), cols(c), data(r * c, fill)
      {}

      double& operator()(std::size_t i, std::size_t j)
      {
	return data[i * cols + j];
      }

      double operator()(std::size_t i, std::size_t j) const
      {
	return data[i * cols + j];
      }

      bool operator==(const Matrix& rhs) const
      {
	return rows == rhs.rows && cols == rhs.cols && data == rhs.data;
      }
    };

    /**
     * @class BlockSpec
     * @brief Structure of a tree x tree quantity such as a Jacobian or Hessian.
     *
     * The block tree has the structure of the outer tree, with each outer leaf
     * replaced by a copy of the inner tree in which each inner leaf is replaced
     * by one numeric block of shape (dim(outerLeaf), dim(innerLeaf)). A block
     * between two scalar leaves is a scalar.
     *
     * Consequences: when the outer tree is a single scalar (a scalar function
     * value) the block tree has the shape of the inner tree, i.e. a gradient
     * looks like the params; when both trees are the same rank-1 array the
     * block tree is one (d, d) array.
     */
    class BlockSpec
    {
    public:
      BlockSpec(TreeSpec outer, TreeSpec inner);

      const TreeSpec& outer() const { return m_outer; }
      const TreeSpec& inner() const { return m_inner; }

      std::size_t rows() const { return m_outer.totalDim(); }
      std::size_t cols() const { return m_inner.totalDim(); }

      // Structure of the block tree itself.
      const TreeSpec& blockTreeSpec() const { return m_blockSpec; }

      /**
       * @brief Re-express a rows() x cols() matrix as a block tree.
       * @throws ShapeMismatchError if the matrix dimensions differ.
       */
      ParamTree toTree(const Matrix& m) const;

      /**
       * @brief Inverse of toTree().
       * @throws TreeStructureError if the tree is not shaped like blockTreeSpec().
       */
      Matrix fromTree(const ParamTree& blockTree) const;

    private:
      TreeSpec m_outer;
      TreeSpec m_inner;
      TreeSpec m_blockSpec;
    };

    /// Build the structure representing a second derivative (or Jacobian) of specA x specB.
    BlockSpec outerProductStructure(const TreeSpec& specA, const TreeSpec& specB);

  } // namespace tree
} // namespace treestat
