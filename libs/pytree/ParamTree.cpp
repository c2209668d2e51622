// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ParamTree.h"

#include <functional>
#include <numeric>

namespace treestat
{
  namespace tree
  {
    namespace
    {
      std::size_t shapeProduct(const std::vector<std::size_t>& shape)
      {
	return std::accumulate(shape.begin(), shape.end(), std::size_t(1),
			       std::multiplies<std::size_t>());
      }

      [[noreturn]] void throwWrongKind(ParamTree::Kind expected, ParamTree::Kind actual)
      {
	throw TreeStructureError(std::string("ParamTree: expected a ")
				 + ParamTree::kindName(expected)
				 + " node but found a "
				 + ParamTree::kindName(actual));
      }
    }

    ParamTree::ParamTree()
      : m_node(0.0)
    {}

    ParamTree::ParamTree(double value)
      : m_node(value)
    {}

    ParamTree::ParamTree(Array array)
      : m_node(std::move(array))
    {
      validateLeaf(*this, "");
    }

    ParamTree::ParamTree(LabeledBlock block)
      : m_node(std::move(block))
    {
      validateLeaf(*this, "");
    }

    ParamTree::ParamTree(Mapping mapping)
      : m_node(std::move(mapping))
    {}

    ParamTree::ParamTree(Sequence sequence)
      : m_node(std::move(sequence))
    {}

    ParamTree ParamTree::scalar(double value)
    {
      return ParamTree(value);
    }

    ParamTree ParamTree::vector(std::vector<double> values)
    {
      Array a;
      a.shape  = { values.size() };
      a.values = std::move(values);
      return ParamTree(std::move(a));
    }

    ParamTree ParamTree::array(std::vector<std::size_t> shape, std::vector<double> values)
    {
      Array a;
      a.shape  = std::move(shape);
      a.values = std::move(values);
      return ParamTree(std::move(a));
    }

    ParamTree ParamTree::labeledBlock(std::vector<std::string> rowLabels,
				      std::vector<std::string> columnLabels,
				      std::vector<double> values)
    {
      LabeledBlock b;
      b.rowLabels    = std::move(rowLabels);
      b.columnLabels = std::move(columnLabels);
      b.values       = std::move(values);
      return ParamTree(std::move(b));
    }

    ParamTree ParamTree::mapping(std::initializer_list<std::pair<const std::string, ParamTree>> entries)
    {
      Mapping m;
      m.reserve(entries.size());
      for (const auto& entry : entries)
	{
	  if (!m.emplace(entry.first, entry.second).second)
	    throw TreeStructureError("ParamTree::mapping: duplicate key '" + entry.first + "'");
	}
      return ParamTree(std::move(m));
    }

    ParamTree ParamTree::mapping()
    {
      return ParamTree(Mapping());
    }

    ParamTree ParamTree::sequence(std::initializer_list<ParamTree> children)
    {
      return ParamTree(Sequence(children));
    }

    ParamTree ParamTree::sequence()
    {
      return ParamTree(Sequence());
    }

    ParamTree::Kind ParamTree::kind() const
    {
      return static_cast<Kind>(m_node.index());
    }

    bool ParamTree::isLeaf() const
    {
      const Kind k = kind();
      return k == Kind::Scalar || k == Kind::Array || k == Kind::LabeledBlock;
    }

    std::size_t ParamTree::leafSize() const
    {
      switch (kind())
	{
	case Kind::Scalar:
	  return 1;
	case Kind::Array:
	  return asArray().values.size();
	case Kind::LabeledBlock:
	  return asLabeledBlock().values.size();
	default:
	  throw TreeStructureError(std::string("ParamTree::leafSize: ")
				   + kindName(kind()) + " node is not a leaf");
	}
    }

    std::vector<std::size_t> ParamTree::leafShape() const
    {
      switch (kind())
	{
	case Kind::Scalar:
	  return {};
	case Kind::Array:
	  return asArray().shape;
	case Kind::LabeledBlock:
	  return { asLabeledBlock().rowLabels.size(), asLabeledBlock().columnLabels.size() };
	default:
	  throw TreeStructureError(std::string("ParamTree::leafShape: ")
				   + kindName(kind()) + " node is not a leaf");
	}
    }

    double ParamTree::asScalar() const
    {
      if (const double* v = std::get_if<double>(&m_node))
	return *v;
      throwWrongKind(Kind::Scalar, kind());
    }

    const Array& ParamTree::asArray() const
    {
      if (const Array* a = std::get_if<Array>(&m_node))
	return *a;
      throwWrongKind(Kind::Array, kind());
    }

    const LabeledBlock& ParamTree::asLabeledBlock() const
    {
      if (const LabeledBlock* b = std::get_if<LabeledBlock>(&m_node))
	return *b;
      throwWrongKind(Kind::LabeledBlock, kind());
    }

    const ParamTree::Mapping& ParamTree::asMapping() const
    {
      if (const Mapping* m = std::get_if<Mapping>(&m_node))
	return *m;
      throwWrongKind(Kind::Mapping, kind());
    }

    ParamTree::Mapping& ParamTree::asMapping()
    {
      if (Mapping* m = std::get_if<Mapping>(&m_node))
	return *m;
      throwWrongKind(Kind::Mapping, kind());
    }

    const ParamTree::Sequence& ParamTree::asSequence() const
    {
      if (const Sequence* s = std::get_if<Sequence>(&m_node))
	return *s;
      throwWrongKind(Kind::Sequence, kind());
    }

    ParamTree::Sequence& ParamTree::asSequence()
    {
      if (Sequence* s = std::get_if<Sequence>(&m_node))
	return *s;
      throwWrongKind(Kind::Sequence, kind());
    }

    const ParamTree& ParamTree::at(const std::string& key) const
    {
      const Mapping& m = asMapping();
      auto it = m.find(key);
      if (it == m.end())
	throw TreeStructureError("ParamTree::at: no entry with key '" + key + "'");
      return it->second;
    }

    ParamTree& ParamTree::operator[](const std::string& key)
    {
      return asMapping()[key];
    }

    const ParamTree& ParamTree::at(std::size_t index) const
    {
      const Sequence& s = asSequence();
      if (index >= s.size())
	throw TreeStructureError("ParamTree::at: sequence index " + std::to_string(index)
				 + " out of range (size " + std::to_string(s.size()) + ")");
      return s[index];
    }

    std::size_t ParamTree::size() const
    {
      switch (kind())
	{
	case Kind::Mapping:
	  return asMapping().size();
	case Kind::Sequence:
	  return asSequence().size();
	default:
	  return 0;
	}
    }

    bool ParamTree::operator==(const ParamTree& rhs) const
    {
      return m_node == rhs.m_node;
    }

    const char* ParamTree::kindName(Kind kind)
    {
      switch (kind)
	{
	case Kind::Scalar:       return "scalar";
	case Kind::Array:        return "array";
	case Kind::Mapping:      return "mapping";
	case Kind::Sequence:     return "sequence";
	case Kind::LabeledBlock: return "labeled block";
	}
      return "unknown";
    }

    void validateLeaf(const ParamTree& leaf, const std::string& path)
    {
      const std::string where = path.empty() ? std::string("<root>") : path;

      if (leaf.isArray())
	{
	  const Array& a = leaf.asArray();
	  if (a.shape.empty())
	    throw TreeStructureError("array at " + where + " has an empty shape; use a scalar instead");
	  if (shapeProduct(a.shape) != a.values.size())
	    throw TreeStructureError("array at " + where + " holds " + std::to_string(a.values.size())
				     + " values but its shape implies " + std::to_string(shapeProduct(a.shape)));
	}
      else if (leaf.isLabeledBlock())
	{
	  const LabeledBlock& b = leaf.asLabeledBlock();
	  const std::size_t expected = b.rowLabels.size() * b.columnLabels.size();
	  if (b.values.size() != expected)
	    throw TreeStructureError("labeled block at " + where + " holds " + std::to_string(b.values.size())
				     + " values but has " + std::to_string(b.rowLabels.size()) + " rows and "
				     + std::to_string(b.columnLabels.size()) + " columns");
	}
    }

  } // namespace tree
} // namespace treestat
