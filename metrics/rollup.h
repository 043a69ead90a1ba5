
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


#ifndef __VELO_ROLLUP_H__
#define __VELO_ROLLUP_H__

#include <string>
#include <vector>
#include <map>
#include <set>
#include <stdint.h>

#include "metrics/metrics.h"


//
// period aggregate over several activities; '+' is commutative and
// associative, and a default rollup_t is the identity
//

struct rollup_t
{

  rollup_t();

  explicit rollup_t( const activity_summary_t & s );
  
  int n;

  std::set<std::string> ids;

  // epoch seconds of the first and last activity start
  int64_t first;
  int64_t last;
  
  double distance;
  double moving_time;
  double elapsed;
  double elev_gain;
  double load;

  int n_climb;
  int n_effort;
  
  // sum of avg_hr x hr_secs, and hr_secs
  double hr_weighted;
  double hr_secs;

  // time-weighted
  bool has_hr() const { return hr_secs > 0; } 
  double avg_hr() const { return hr_secs > 0 ? hr_weighted / hr_secs : 0; } 
  
  double max_hr;
  double max_power;
  double max_speed;
  
  zone_distribution_t hr_zones;
  zone_distribution_t power_zones;

  friend rollup_t operator+( const rollup_t & a , const rollup_t & b );

  rollup_t & operator+=( const rollup_t & rhs );
  
};


// one calendar day of training load
struct load_day_t
{
  load_day_t() : day(0) , load(0) , has_mean7(false) , mean7(0) { } 
  int64_t day;
  double load;
  // trailing 7-day mean (from the 7th day on)
  bool has_mean7;
  double mean7;
};


namespace rollup
{
  
  rollup_t fold( const std::vector<activity_summary_t> & s );

  // activities starting in [from,to)
  rollup_t window( const std::vector<activity_summary_t> & s , int64_t from , int64_t to );

  // keyed by the Monday 00:00 (UTC) of each ISO week
  std::map<int64_t,rollup_t> weekly( const std::vector<activity_summary_t> & s );

  // keyed by 00:00 (UTC) of each day
  std::map<int64_t,rollup_t> daily( const std::vector<activity_summary_t> & s );

  // every day from the first to the last activity (zero on rest days)
  std::vector<load_day_t> daily_load( const std::vector<activity_summary_t> & s );
  
  std::vector<activity_summary_t> of_type( const std::vector<activity_summary_t> & s , const std::string & type );
  
  int64_t day_start( int64_t t );

  int64_t week_start( int64_t t );

  // YYYY-MM-DD (UTC)
  std::string date( int64_t t );
  
}

#endif
