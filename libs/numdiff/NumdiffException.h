// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __NUMDIFF_EXCEPTION_H
#define __NUMDIFF_EXCEPTION_H 1

#include <string>
#include "TreestatException.h"

namespace treestat
{
  // Bounds leave no room for a finite-difference step of at least the
  // minimum step size on either side of a coordinate.
  class InfeasibleStepError : public TreestatException
  {
  public:
    explicit InfeasibleStepError(const std::string& msg)
      : TreestatException(msg) {}
  };

  // lower > upper, bounds not aligned with the params, or params outside bounds.
  class InvalidBoundsError : public TreestatException
  {
  public:
    explicit InvalidBoundsError(const std::string& msg)
      : TreestatException(msg) {}
  };

} // namespace treestat

#endif // __NUMDIFF_EXCEPTION_H
