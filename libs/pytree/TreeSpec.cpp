// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "TreeSpec.h"

#include <algorithm>
#include <functional>

namespace treestat
{
  namespace tree
  {
    namespace
    {
      // Builds the zero-valued skeleton and collects leaf records in traversal order.
      ParamTree buildSkeleton(const ParamTree& node,
			      const std::string& path,
			      std::vector<LeafInfo>& leaves,
			      std::size_t& offset)
      {
	switch (node.kind())
	  {
	  case ParamTree::Kind::Scalar:
	  case ParamTree::Kind::Array:
	  case ParamTree::Kind::LabeledBlock:
	    {
	      validateLeaf(node, path);
	      const std::size_t n = node.leafSize();
	      leaves.push_back(LeafInfo{ path, node.leafShape(), offset, n });
	      offset += n;

	      if (node.isScalar())
		return ParamTree(0.0);

	      if (node.isArray())
		return ParamTree::array(node.asArray().shape, std::vector<double>(n, 0.0));

	      const LabeledBlock& b = node.asLabeledBlock();
	      return ParamTree::labeledBlock(b.rowLabels, b.columnLabels, std::vector<double>(n, 0.0));
	    }

	  case ParamTree::Kind::Mapping:
	    {
	      ParamTree::Mapping out;
	      out.reserve(node.size());
	      // flat_map iterates in ascending key order
	      for (const auto& entry : node.asMapping())
		{
		  if (entry.first.empty())
		    throw TreeStructureError("mapping at " + (path.empty() ? std::string("<root>") : path)
					     + " has an empty key");
		  out.emplace_hint(out.end(), entry.first,
				   buildSkeleton(entry.second, joinPath(path, entry.first), leaves, offset));
		}
	      return ParamTree(std::move(out));
	    }

	  case ParamTree::Kind::Sequence:
	    {
	      ParamTree::Sequence out;
	      const auto& children = node.asSequence();
	      out.reserve(children.size());
	      for (std::size_t i = 0; i < children.size(); ++i)
		out.push_back(buildSkeleton(children[i], joinPath(path, std::to_string(i)), leaves, offset));
	      return ParamTree(std::move(out));
	    }
	  }

	throw TreeStructureError("TreeSpec: unknown node kind");
      }

      void collectValues(const ParamTree& node, std::vector<double>& out)
      {
	switch (node.kind())
	  {
	  case ParamTree::Kind::Scalar:
	    out.push_back(node.asScalar());
	    break;
	  case ParamTree::Kind::Array:
	    {
	      const auto& v = node.asArray().values;
	      out.insert(out.end(), v.begin(), v.end());
	    }
	    break;
	  case ParamTree::Kind::LabeledBlock:
	    {
	      const auto& v = node.asLabeledBlock().values;
	      out.insert(out.end(), v.begin(), v.end());
	    }
	    break;
	  case ParamTree::Kind::Mapping:
	    for (const auto& entry : node.asMapping())
	      collectValues(entry.second, out);
	    break;
	  case ParamTree::Kind::Sequence:
	    for (const auto& child : node.asSequence())
	      collectValues(child, out);
	    break;
	  }
      }

      // Fills a copy of the skeleton with consecutive values from the flat vector.
      ParamTree fill(const ParamTree& skeleton,
		     const std::vector<double>& values,
		     std::size_t& pos)
      {
	switch (skeleton.kind())
	  {
	  case ParamTree::Kind::Scalar:
	    return ParamTree(values[pos++]);

	  case ParamTree::Kind::Array:
	    {
	      const Array& a = skeleton.asArray();
	      const std::size_t n = a.values.size();
	      std::vector<double> v(values.begin() + static_cast<std::ptrdiff_t>(pos),
				    values.begin() + static_cast<std::ptrdiff_t>(pos + n));
	      pos += n;
	      return ParamTree::array(a.shape, std::move(v));
	    }

	  case ParamTree::Kind::LabeledBlock:
	    {
	      const LabeledBlock& b = skeleton.asLabeledBlock();
	      const std::size_t n = b.values.size();
	      std::vector<double> v(values.begin() + static_cast<std::ptrdiff_t>(pos),
				    values.begin() + static_cast<std::ptrdiff_t>(pos + n));
	      pos += n;
	      return ParamTree::labeledBlock(b.rowLabels, b.columnLabels, std::move(v));
	    }

	  case ParamTree::Kind::Mapping:
	    {
	      ParamTree::Mapping out;
	      out.reserve(skeleton.size());
	      for (const auto& entry : skeleton.asMapping())
		out.emplace_hint(out.end(), entry.first, fill(entry.second, values, pos));
	      return ParamTree(std::move(out));
	    }

	  case ParamTree::Kind::Sequence:
	    {
	      ParamTree::Sequence out;
	      out.reserve(skeleton.size());
	      for (const auto& child : skeleton.asSequence())
		out.push_back(fill(child, values, pos));
	      return ParamTree(std::move(out));
	    }
	  }

	throw TreeStructureError("TreeSpec: unknown node kind");
      }
    }

    std::string joinPath(const std::string& parent, const std::string& child)
    {
      if (parent.empty())
	return child;
      if (child.empty())
	return parent;
      return parent + "/" + child;
    }

    TreeSpec::TreeSpec(const ParamTree& tree)
      : m_skeleton(),
	m_leaves(),
	m_totalDim(0)
    {
      m_skeleton = buildSkeleton(tree, "", m_leaves, m_totalDim);
    }

    std::vector<std::string> TreeSpec::coordinateNames() const
    {
      std::vector<std::string> names;
      names.reserve(m_totalDim);

      // Labeled blocks are named by row and column label; everything else by
      // position inside the leaf.
      std::size_t leafIndex = 0;
      std::vector<const LabeledBlock*> blocks;
      std::function<void(const ParamTree&)> findBlocks = [&](const ParamTree& node) {
	if (node.isLabeledBlock())
	  blocks.push_back(&node.asLabeledBlock());
	else if (node.isLeaf())
	  blocks.push_back(nullptr);
	else if (node.isMapping())
	  for (const auto& entry : node.asMapping()) findBlocks(entry.second);
	else
	  for (const auto& child : node.asSequence()) findBlocks(child);
      };
      findBlocks(m_skeleton);

      for (const LeafInfo& leaf : m_leaves)
	{
	  const LabeledBlock* block = blocks[leafIndex++];
	  if (leaf.size == 1 && leaf.shape.empty())
	    {
	      names.push_back(leaf.path);
	      continue;
	    }
	  for (std::size_t k = 0; k < leaf.size; ++k)
	    {
	      if (block)
		{
		  const std::size_t cols = block->columnLabels.size();
		  names.push_back(joinPath(joinPath(leaf.path, block->rowLabels[k / cols]),
					   block->columnLabels[k % cols]));
		}
	      else
		names.push_back(joinPath(leaf.path, std::to_string(k)));
	    }
	}
      return names;
    }

    ParamTree TreeSpec::unflatten(const std::vector<double>& values) const
    {
      if (values.size() != m_totalDim)
	throw ShapeMismatchError("TreeSpec::unflatten: expected " + std::to_string(m_totalDim)
				 + " values but received " + std::to_string(values.size()));
      std::size_t pos = 0;
      return fill(m_skeleton, values, pos);
    }

    std::vector<double> TreeSpec::flattenLike(const ParamTree& tree) const
    {
      FlatTree flat = flatten(tree);
      if (!sameStructure(flat.spec))
	throw TreeStructureError("TreeSpec::flattenLike: tree structure does not match this TreeSpec ("
				 + std::to_string(flat.spec.numLeaves()) + " leaves / "
				 + std::to_string(flat.spec.totalDim()) + " values versus "
				 + std::to_string(m_leaves.size()) + " leaves / "
				 + std::to_string(m_totalDim) + " values)");
      return std::move(flat.values);
    }

    FlatTree flatten(const ParamTree& tree)
    {
      TreeSpec spec(tree);
      std::vector<double> values;
      values.reserve(spec.totalDim());
      collectValues(tree, values);
      return FlatTree{ std::move(values), std::move(spec) };
    }

    ParamTree unflatten(const std::vector<double>& values, const TreeSpec& spec)
    {
      return spec.unflatten(values);
    }

  } // namespace tree
} // namespace treestat
