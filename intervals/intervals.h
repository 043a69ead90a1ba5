
//    --------------------------------------------------------------------
//
//    This file is part of Velo.
//
//    VELO is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Velo is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Velo. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#ifndef __VELO_INTERVALS_H__
#define __VELO_INTERVALS_H__

#include <stdint.h>

#include <sstream>
#include <ostream>
#include <vector>


//
// intervals are ranges of sample-points, from start to stop, where
// *both* ends are inclusive: a single-sample interval has start == stop
//


struct interval_t
{
  
  friend std::ostream & operator<<( std::ostream & out , const interval_t & rhs );
  
  interval_t() { start = 0 ; stop = -1; }
  
  interval_t( int start , int stop ) : start(start) , stop(stop) { } 

  // i.e. stop before start
  bool empty() const { return stop < start; } 

  // number of sample-points spanned
  int n() const { return empty() ? 0 : stop - start + 1 ; } 

  // grow to include b
  void extend( const interval_t & b )
  {
    if ( b.start < start ) start = b.start;
    if ( b.stop > stop ) stop = b.stop;
  }
  
  int start;
  
  int stop;
  
  bool operator<( const interval_t & rhs ) const 
  {
    if ( start == rhs.start ) return stop < rhs.stop;
    return start < rhs.start;
  }

  bool operator==( const interval_t & rhs ) const 
  {
    return start == rhs.start && stop == rhs.stop;
  }

  bool overlaps( const interval_t & b ) const 
  {
    return start <= b.stop && b.start <= stop;
  }

  bool contains( const int sp ) const
  {
    return sp >= start && sp <= stop;
  }

  std::string as_string() const 
  {
    std::stringstream ss;
    ss << start << "->" << stop;
    return ss.str();
  }

  // maximal runs of T in a mask, in order
  static std::vector<interval_t> runs( const std::vector<bool> & mask );
  
};


#endif
