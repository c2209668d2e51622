#ifndef __BOOTSTRAP_EXCEPTION_H
#define __BOOTSTRAP_EXCEPTION_H 1

#include <string>

#include "TreestatException.h"

namespace treestat
{
  // A column named by the caller (for example the cluster key) is not in the data.
  class MissingColumnError : public TreestatException
  {
  public:
    explicit MissingColumnError(const std::string& msg)
      : TreestatException(msg)
    {}
  };
}

#endif
