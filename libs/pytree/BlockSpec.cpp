#include "BlockSpec.h"

#include <string>

namespace treestat
{
  namespace tree
  {
    namespace
    {
      // Replace every leaf of a skeleton, in traversal order, by makeLeaf(leafIndex, leaf).
      template <class LeafFn>
      ParamTree replaceLeaves(const ParamTree& node, std::size_t& leafIndex, LeafFn&& makeLeaf)
      {
	if (node.isLeaf())
	  return makeLeaf(leafIndex++, node);

	if (node.isMapping())
	  {
	    ParamTree::Mapping out;
	    out.reserve(node.size());
	    for (const auto& entry : node.asMapping())
	      out.emplace_hint(out.end(), entry.first, replaceLeaves(entry.second, leafIndex, makeLeaf));
	    return ParamTree(std::move(out));
	  }

	ParamTree::Sequence out;
	out.reserve(node.size());
	for (const auto& child : node.asSequence())
	  out.push_back(replaceLeaves(child, leafIndex, makeLeaf));
	return ParamTree(std::move(out));
      }

      ParamTree makeBlock(const ParamTree& outerLeaf, const ParamTree& innerLeaf)
      {
	// A scalar on one side keeps the other side's own leaf kind, so that a
	// gradient of a scalar function has exactly the shape of the params.
	if (outerLeaf.isScalar())
	  return innerLeaf;
	if (innerLeaf.isScalar())
	  return outerLeaf;

	const std::size_t na = outerLeaf.leafSize();
	const std::size_t nb = innerLeaf.leafSize();
	return ParamTree::array({ na, nb }, std::vector<double>(na * nb, 0.0));
      }

      ParamTree buildBlockSkeleton(const TreeSpec& outer, const TreeSpec& inner)
      {
	std::size_t outerIndex = 0;
	return replaceLeaves(outer.skeleton(), outerIndex,
			     [&inner](std::size_t, const ParamTree& outerLeaf) {
			       std::size_t innerIndex = 0;
			       return replaceLeaves(inner.skeleton(), innerIndex,
						    [&outerLeaf](std::size_t, const ParamTree& innerLeaf) {
						      return makeBlock(outerLeaf, innerLeaf);
						    });
			     });
      }
    }

    BlockSpec::BlockSpec(TreeSpec outer, TreeSpec inner)
      : m_outer(std::move(outer)),
	m_inner(std::move(inner)),
	m_blockSpec(buildBlockSkeleton(m_outer, m_inner))
    {}

    ParamTree BlockSpec::toTree(const Matrix& m) const
    {
      if (m.rows != rows() || m.cols != cols())
	throw ShapeMismatchError("BlockSpec::toTree: expected a " + std::to_string(rows()) + "x"
				 + std::to_string(cols()) + " matrix but received "
				 + std::to_string(m.rows) + "x" + std::to_string(m.cols));

      std::vector<double> flat;
      flat.reserve(rows() * cols());
      for (const LeafInfo& a : m_outer.leaves())
	for (const LeafInfo& b : m_inner.leaves())
	  for (std::size_t i = 0; i < a.size; ++i)
	    for (std::size_t j = 0; j < b.size; ++j)
	      flat.push_back(m(a.offset + i, b.offset + j));

      return m_blockSpec.unflatten(flat);
    }

    Matrix BlockSpec::fromTree(const ParamTree& blockTree) const
    {
      const std::vector<double> flat = m_blockSpec.flattenLike(blockTree);

      Matrix m(rows(), cols());
      std::size_t pos = 0;
      for (const LeafInfo& a : m_outer.leaves())
	for (const LeafInfo& b : m_inner.leaves())
	  for (std::size_t i = 0; i < a.size; ++i)
	    for (std::size_t j = 0; j < b.size; ++j)
	      m(a.offset + i, b.offset + j) = flat[pos++];
      return m;
    }

    BlockSpec outerProductStructure(const TreeSpec& specA, const TreeSpec& specB)
    {
      return BlockSpec(specA, specB);
    }

  } // namespace tree
} // namespace treestat
