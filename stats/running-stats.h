
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

#ifndef __VELO_RUNNINGSTATS_H__
#define __VELO_RUNNINGSTATS_H__

class running_stats_t
{

 public:
  running_stats_t();
  void clear();
  void push(double x);
  long long num_data_values() const;
  bool empty() const { return n == 0; }
  double mean() const;
  double variance() const;
  double min() const { return mn; }
  double max() const { return mx; }
  double sum() const { return n * M1; }
  
  // pooled moments of two independent sets (order does not matter)
  friend running_stats_t operator+(const running_stats_t a, const running_stats_t b);

  running_stats_t& operator+=(const running_stats_t &rhs);

private:
  long long n;
  double M1, M2;
  double mn, mx;
};

#endif
