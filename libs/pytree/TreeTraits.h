#pragma once

#include <map>
#include <string>
#include <vector>
#include <type_traits>

#include "ParamTree.h"

namespace treestat
{
  namespace tree
  {
    /**
     * @brief Extension point converting user types to and from ParamTree.
     *
     * Specialize TreeTraits<T> with
     *   static ParamTree toTree(const T&);
     *   static T fromTree(const ParamTree&);
     * to let flatten(), firstDerivative() and bootstrap outcomes work on a new
     * container kind. The core traversal never needs to change for this.
     */
    template <class T, class Enable = void>
    struct TreeTraits;

    template <>
    struct TreeTraits<double>
    {
      static ParamTree toTree(double v)
      {
	return ParamTree(v);
      }

      static double fromTree(const ParamTree& t)
      {
	return t.asScalar();
      }
    };

    template <>
    struct TreeTraits<std::vector<double>>
    {
      static ParamTree toTree(const std::vector<double>& v)
      {
	return ParamTree::vector(v);
      }

      static std::vector<double> fromTree(const ParamTree& t)
      {
	const Array& a = t.asArray();
	if (a.shape.size() != 1)
	  throw TreeStructureError("TreeTraits<std::vector<double>>: expected a rank-1 array");
	return a.values;
      }
    };

    template <class T>
    struct TreeTraits<std::map<std::string, T>>
    {
      static ParamTree toTree(const std::map<std::string, T>& m)
      {
	ParamTree::Mapping out;
	out.reserve(m.size());
	for (const auto& entry : m)
	  out.emplace_hint(out.end(), entry.first, TreeTraits<T>::toTree(entry.second));
	return ParamTree(std::move(out));
      }

      static std::map<std::string, T> fromTree(const ParamTree& t)
      {
	std::map<std::string, T> out;
	for (const auto& entry : t.asMapping())
	  out.emplace(entry.first, TreeTraits<T>::fromTree(entry.second));
	return out;
      }
    };

    // Sequences of anything other than double; std::vector<double> is an array.
    template <class T>
    struct TreeTraits<std::vector<T>, std::enable_if_t<!std::is_same<T, double>::value>>
    {
      static ParamTree toTree(const std::vector<T>& v)
      {
	ParamTree::Sequence out;
	out.reserve(v.size());
	for (const auto& item : v)
	  out.push_back(TreeTraits<T>::toTree(item));
	return ParamTree(std::move(out));
      }

      static std::vector<T> fromTree(const ParamTree& t)
      {
	std::vector<T> out;
	out.reserve(t.size());
	for (const auto& child : t.asSequence())
	  out.push_back(TreeTraits<T>::fromTree(child));
	return out;
      }
    };

    template <class T>
    ParamTree toTree(const T& value)
    {
      return TreeTraits<T>::toTree(value);
    }

    template <class T>
    T fromTree(const ParamTree& tree)
    {
      return TreeTraits<T>::fromTree(tree);
    }

  } // namespace tree
} // namespace treestat
