
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


#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

std::vector<double> MiscMath::diff( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n < 2 ) 
    Helper::halt( "problem in diff() -- input less than two elements" );  
  std::vector<double> r( n - 1 );
  for (int i=1;i<n;i++)
    r[i-1] = x[i] - x[i-1];
  return r;
}

double MiscMath::sum( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  double s = 0;
  for (int i=0;i<n;i++) s += x[i];
  return s;
}

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  double s = 0;
  for (int i=0;i<n;i++) s += x[i];
  return s/(double)n;
}

double MiscMath::median( const std::vector<double> & x )
{
  
  const int n = x.size();  

  if ( n == 0 ) Helper::halt( "internal problem, taking median of 0 elements");
  if ( n == 1 ) return x[0];

  std::vector<double> y = x;
  std::nth_element( y.begin() , y.begin() + n / 2 , y.end() );
  const double upper_median = y[ n / 2 ];

  if ( n % 2 ) return upper_median;
  
  const double lower_median = *std::max_element( y.begin() , y.begin() + n / 2 );
  
  return ( lower_median + upper_median ) / 2.0 ;
      
}

double MiscMath::ascent( const std::vector<double> & x , const std::vector<bool> & present , int start , int stop )
{
  double s = 0;
  int last = -1;
  for (int i=start; i<=stop; i++)
    {
      if ( ! present[i] ) continue;
      if ( last != -1 && x[i] > x[last] ) s += x[i] - x[last];
      last = i;
    }
  return s;
}

double MiscMath::descent( const std::vector<double> & x , const std::vector<bool> & present , int start , int stop )
{
  double s = 0;
  int last = -1;
  for (int i=start; i<=stop; i++)
    {
      if ( ! present[i] ) continue;
      if ( last != -1 && x[i] < x[last] ) s += x[last] - x[i];
      last = i;
    }
  return s;
}

std::map<double,int> MiscMath::histogram( const std::vector<double> & x , const std::vector<bool> & include , double w )
{
  if ( w <= 0 ) Helper::halt( "histogram bin width must be positive" );
  std::map<double,int> h;
  const int n = x.size();
  for (int i=0; i<n; i++)
    {
      if ( ! include[i] ) continue;
      const double lwr = std::floor( x[i] / w ) * w;
      ++h[ lwr ];
    }
  return h;
}
