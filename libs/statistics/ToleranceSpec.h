// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TOLERANCE_SPEC_H
#define __TOLERANCE_SPEC_H 1

#include <tuple>

namespace mkc_measurement
{
  //
  // class ToleranceSpec
  //
  // Design value with its upper and lower tolerance offsets.
  //

  class ToleranceSpec
  {
  public:
    ToleranceSpec(double designValue, double upperTolerance, double lowerTolerance)
      : mDesignValue(designValue),
	mUpperTolerance(upperTolerance),
	mLowerTolerance(lowerTolerance)
    {}

    double getDesignValue() const
    {
      return mDesignValue;
    }

    double getUpperTolerance() const
    {
      return mUpperTolerance;
    }

    double getLowerTolerance() const
    {
      return mLowerTolerance;
    }

    double getUpperSpecLimit() const
    {
      return mDesignValue + mUpperTolerance;
    }

    double getLowerSpecLimit() const
    {
      return mDesignValue + mLowerTolerance;
    }

    double getSpecWidth() const
    {
      return getUpperSpecLimit() - getLowerSpecLimit();
    }

  private:
    double mDesignValue;
    double mUpperTolerance;
    double mLowerTolerance;
  };

  inline bool operator==(const ToleranceSpec& lhs, const ToleranceSpec& rhs)
  {
    return lhs.getDesignValue() == rhs.getDesignValue() &&
      lhs.getUpperTolerance() == rhs.getUpperTolerance() &&
      lhs.getLowerTolerance() == rhs.getLowerTolerance();
  }

  inline bool operator!=(const ToleranceSpec& lhs, const ToleranceSpec& rhs)
  {
    return !(lhs == rhs);
  }

  inline bool operator<(const ToleranceSpec& lhs, const ToleranceSpec& rhs)
  {
    return std::make_tuple(lhs.getDesignValue(), lhs.getUpperTolerance(), lhs.getLowerTolerance()) <
      std::make_tuple(rhs.getDesignValue(), rhs.getUpperTolerance(), rhs.getLowerTolerance());
  }
} // namespace mkc_measurement

#endif // __TOLERANCE_SPEC_H
