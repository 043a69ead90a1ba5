
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


#include "intervals/intervals.h"

#include <iostream>

std::ostream & operator<<( std::ostream & out , const interval_t & rhs ) 
{
  out << rhs.start << "-" << rhs.stop;
  return out;
}


std::vector<interval_t> interval_t::runs( const std::vector<bool> & mask )
{
  std::vector<interval_t> r;

  const int n = mask.size();
  
  int i = 0;
  while ( i < n )
    {
      if ( ! mask[i] ) { ++i; continue; }
      
      // start a new run, and step to its end
      int j = i;
      while ( j + 1 < n && mask[j+1] ) ++j;
      r.push_back( interval_t( i , j ) );
      i = j + 1;
    }
  return r;
}
