// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "NaturalOrder.h"
#include <cctype>

namespace mkc_measurement
{
  namespace
  {
    bool isDigit(char c)
    {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // Compares the digit runs starting at lhsPos and rhsPos; advances both.
    int compareDigitRuns(const std::string& lhs, std::string::size_type& lhsPos,
			 const std::string& rhs, std::string::size_type& rhsPos)
    {
      while (lhsPos < lhs.size() && lhs[lhsPos] == '0')
	++lhsPos;
      while (rhsPos < rhs.size() && rhs[rhsPos] == '0')
	++rhsPos;

      std::string::size_type lhsEnd = lhsPos;
      while (lhsEnd < lhs.size() && isDigit(lhs[lhsEnd]))
	++lhsEnd;
      std::string::size_type rhsEnd = rhsPos;
      while (rhsEnd < rhs.size() && isDigit(rhs[rhsEnd]))
	++rhsEnd;

      // Without leading zeros the longer run is the larger number
      int result = 0;
      if (lhsEnd - lhsPos != rhsEnd - rhsPos)
	result = (lhsEnd - lhsPos < rhsEnd - rhsPos) ? -1 : 1;
      else
	result = lhs.compare(lhsPos, lhsEnd - lhsPos, rhs, rhsPos, rhsEnd - rhsPos);

      lhsPos = lhsEnd;
      rhsPos = rhsEnd;
      return result;
    }
  }

  bool naturalLess(const std::string& lhs, const std::string& rhs)
  {
    std::string::size_type i = 0;
    std::string::size_type j = 0;

    while (i < lhs.size() && j < rhs.size())
      {
	if (isDigit(lhs[i]) && isDigit(rhs[j]))
	  {
	    const int result = compareDigitRuns(lhs, i, rhs, j);
	    if (result != 0)
	      return result < 0;
	    continue;
	  }

	if (lhs[i] != rhs[j])
	  return static_cast<unsigned char>(lhs[i]) < static_cast<unsigned char>(rhs[j]);

	++i;
	++j;
      }

    if ((i < lhs.size()) != (j < rhs.size()))
      return i >= lhs.size();

    return lhs < rhs;
  }
} // namespace mkc_measurement
