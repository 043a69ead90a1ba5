
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


// extension of the method of Knuth and Welford for computing standard
// deviation in one pass through the data; source: John D. Cook
// Consulting

#include "stats/running-stats.h"
#include <cmath>
#include <limits>

running_stats_t::running_stats_t() 
{
  clear();
}

void running_stats_t::clear()
{
  n = 0;
  M1 = M2 = 0.0;
  mn = std::numeric_limits<double>::quiet_NaN();
  mx = std::numeric_limits<double>::quiet_NaN();
}

void running_stats_t::push(double x)
{
  double delta, delta_n, term1;
  
  long long n1 = n;
  n++;
  delta = x - M1;
  delta_n = delta / n;
  term1 = delta * delta_n * n1;
  M1 += delta_n;
  M2 += term1;

  if ( n == 1 || x < mn ) mn = x;
  if ( n == 1 || x > mx ) mx = x;
}

long long running_stats_t::num_data_values() const
{
  return n;
}

double running_stats_t::mean() const
{
  return n == 0 ? std::numeric_limits<double>::quiet_NaN() : M1;
}

double running_stats_t::variance() const
{
  return n < 2 ? 0 : M2/(n-1.0);
}

running_stats_t operator+(const running_stats_t a, const running_stats_t b)
{

  if ( a.n == 0 ) return b;
  if ( b.n == 0 ) return a;
  
  running_stats_t combined;
  
  combined.n = a.n + b.n;
  
  double delta = b.M1 - a.M1;
  double delta2 = delta*delta;
  
  combined.M1 = (a.n*a.M1 + b.n*b.M1) / combined.n;
  
  combined.M2 = a.M2 + b.M2 + 
    delta2 * a.n * b.n / combined.n;

  combined.mn = a.mn < b.mn ? a.mn : b.mn;
  combined.mx = a.mx > b.mx ? a.mx : b.mx;
  
  return combined;
}

running_stats_t& running_stats_t::operator+=(const running_stats_t& rhs)
{ 
  running_stats_t combined = *this + rhs;
  *this = combined;
  return *this;
}
