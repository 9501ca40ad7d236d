// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __NATURAL_ORDER_H
#define __NATURAL_ORDER_H 1

#include <string>

namespace mkc_measurement
{
  /**
   * @brief Orders strings the way an operator reads them: digit runs compare
   * by numeric value, so "A2" < "A10" and "No.9" < "No.10".
   *
   * Other characters compare by byte value. Strings that are equal under
   * this rule (e.g. "A01" and "A1") fall back to plain comparison so the
   * ordering stays strict.
   */
  bool naturalLess(const std::string& lhs, const std::string& rhs);

  struct NaturalLess
  {
    bool operator()(const std::string& lhs, const std::string& rhs) const
    {
      return naturalLess(lhs, rhs);
    }
  };
} // namespace mkc_measurement

#endif // __NATURAL_ORDER_H
