// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "Bounds.h"

#include <string>

namespace treestat
{
  namespace numdiff
  {
    namespace
    {
      std::string describe(const std::string& path)
      {
	return path.empty() ? std::string("<root>") : path;
      }

      /**
       * Walks the params skeleton alongside a bound tree that may cover only
       * part of it. Parts the bound tree leaves out receive fill.
       */
      void collectBound(const tree::ParamTree& skeleton,
			const tree::ParamTree* bound,
			const std::string& path,
			double fill,
			std::vector<double>& out)
      {
	using tree::ParamTree;

	if (bound == nullptr)
	  {
	    const std::size_t n = tree::TreeSpec(skeleton).totalDim();
	    out.insert(out.end(), n, fill);
	    return;
	  }

	if (skeleton.isLeaf())
	  {
	    try
	      {
		const std::vector<double> v = tree::TreeSpec(skeleton).flattenLike(*bound);
		out.insert(out.end(), v.begin(), v.end());
	      }
	    catch (const TreeStructureError& e)
	      {
		throw InvalidBoundsError("leaf " + describe(path) + " has the wrong shape: " + e.what());
	      }
	    return;
	  }

	if (skeleton.isMapping())
	  {
	    if (!bound->isMapping())
	      throw InvalidBoundsError(describe(path) + " is a mapping in params but a "
				       + ParamTree::kindName(bound->kind()) + " in the bound");

	    const auto& given = bound->asMapping();
	    for (const auto& entry : given)
	      if (skeleton.asMapping().find(entry.first) == skeleton.asMapping().end())
		throw InvalidBoundsError("key " + tree::joinPath(path, entry.first)
					 + " does not exist in params");

	    for (const auto& entry : skeleton.asMapping())
	      {
		auto it = given.find(entry.first);
		collectBound(entry.second, it == given.end() ? nullptr : &it->second,
			     tree::joinPath(path, entry.first), fill, out);
	      }
	    return;
	  }

	if (!bound->isSequence())
	  throw InvalidBoundsError(describe(path) + " is a sequence in params but a "
				   + ParamTree::kindName(bound->kind()) + " in the bound");

	const auto& children = skeleton.asSequence();
	const auto& given = bound->asSequence();
	if (given.size() > children.size())
	  throw InvalidBoundsError(describe(path) + " has " + std::to_string(children.size())
				   + " elements in params but " + std::to_string(given.size())
				   + " in the bound");

	for (std::size_t i = 0; i < children.size(); ++i)
	  collectBound(children[i], i < given.size() ? &given[i] : nullptr,
		       tree::joinPath(path, std::to_string(i)), fill, out);
      }

      std::vector<double> flattenBound(const tree::TreeSpec& paramsSpec,
				       const std::optional<tree::ParamTree>& bound,
				       double fill,
				       const char* side)
      {
	if (!bound)
	  return std::vector<double>(paramsSpec.totalDim(), fill);

	std::vector<double> values;
	values.reserve(paramsSpec.totalDim());
	try
	  {
	    collectBound(paramsSpec.skeleton(), &*bound, "", fill, values);
	  }
	catch (const InvalidBoundsError& e)
	  {
	    throw InvalidBoundsError(std::string("Bounds: ") + side + " bound: " + e.what());
	  }
	return values;
      }
    }

    Bounds::Bounds()
      : m_lower(),
	m_upper()
    {}

    Bounds::Bounds(std::vector<double> lower, std::vector<double> upper)
      : m_lower(std::move(lower)),
	m_upper(std::move(upper))
    {
      if (m_lower.size() != m_upper.size())
	throw InvalidBoundsError("Bounds: lower has " + std::to_string(m_lower.size())
				 + " entries but upper has " + std::to_string(m_upper.size()));

      for (std::size_t i = 0; i < m_lower.size(); ++i)
	{
	  // written so that NaN fails as well
	  if (!(m_lower[i] <= m_upper[i]))
	    throw InvalidBoundsError("Bounds: lower bound " + std::to_string(m_lower[i])
				     + " exceeds upper bound " + std::to_string(m_upper[i])
				     + " at coordinate " + std::to_string(i));
	}
    }

    Bounds Bounds::fromTrees(const tree::TreeSpec& paramsSpec,
			     const std::optional<tree::ParamTree>& lower,
			     const std::optional<tree::ParamTree>& upper)
    {
      return Bounds(flattenBound(paramsSpec, lower, -std::numeric_limits<double>::infinity(), "lower"),
		    flattenBound(paramsSpec, upper, std::numeric_limits<double>::infinity(), "upper"));
    }

    void Bounds::validate(const std::vector<double>& x) const
    {
      if (isUnbounded())
	return;

      if (x.size() != m_lower.size())
	throw InvalidBoundsError("Bounds: bounds have " + std::to_string(m_lower.size())
				 + " coordinates but params have " + std::to_string(x.size()));

      for (std::size_t i = 0; i < x.size(); ++i)
	{
	  if (x[i] < m_lower[i] || x[i] > m_upper[i])
	    throw InvalidBoundsError("Bounds: params coordinate " + std::to_string(i)
				     + " = " + std::to_string(x[i]) + " lies outside ["
				     + std::to_string(m_lower[i]) + ", "
				     + std::to_string(m_upper[i]) + "]");
	}
    }
  }
}
