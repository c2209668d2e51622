// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TREESTAT_EXCEPTION_H
#define __TREESTAT_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace treestat
{
  // Base class of every error raised by the tree, differentiation and
  // bootstrap engines. User function exceptions are never wrapped in it.
  class TreestatException : public std::runtime_error
  {
  public:
    explicit TreestatException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~TreestatException() = default;
  };

  // A tree is malformed, or does not have the structure a spec expects.
  class TreeStructureError : public TreestatException
  {
  public:
    explicit TreeStructureError(const std::string& msg)
      : TreestatException(msg) {}
  };

  // A flat vector does not have the length a spec expects.
  class ShapeMismatchError : public TreestatException
  {
  public:
    explicit ShapeMismatchError(const std::string& msg)
      : TreestatException(msg) {}
  };

} // namespace treestat

#endif // __TREESTAT_EXCEPTION_H
