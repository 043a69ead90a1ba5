
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


#ifndef __VELO_MISCMATH_H__
#define __VELO_MISCMATH_H__

#include <vector>
#include <cstddef>
#include <algorithm>
#include <map>

namespace MiscMath
{
  
  // differences 
  std::vector<double> diff( const std::vector<double> & x );

  double mean( const std::vector<double> & x );

  double sum( const std::vector<double> & x );

  // median (average of the two central values if n is even)
  double median( const std::vector<double> & x );

  // sum of positive (or negative) consecutive changes, only between
  // points where 'present' is T; nb. skips over absent points 
  double ascent( const std::vector<double> & x , const std::vector<bool> & present , int start , int stop );

  double descent( const std::vector<double> & x , const std::vector<bool> & present , int start , int stop );

  // counts per bin of width w: key is the lower edge of the bin
  std::map<double,int> histogram( const std::vector<double> & x , const std::vector<bool> & include , double w );
  
}

#endif
