//
//  ZMUtil.hpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#ifndef _ZMUTIL_HPP_
#define _ZMUTIL_HPP_

/*! Static helpers shared by the calendar code */
class ZMUtil {
  public:
    // Integer division rounding toward negative infinity (C++ '/' truncates toward zero)
    static long             floorDiv(long numerator,
                                     long denominator) {
        long q = numerator / denominator;
        if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
            q--;
        }
        return q;
    }

    // Modulo with the sign of the denominator, so floorDiv(n, d) * d + floorMod(n, d) == n
    static long             floorMod(long numerator,
                                     long denominator) {
        return numerator - floorDiv(numerator, denominator) * denominator;
    }
};

#endif  // _ZMUTIL_HPP_
