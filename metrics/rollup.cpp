
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


#include "metrics/rollup.h"

#include "helper/helper.h"

#include <algorithm>
#include <ctime>

static const int64_t SECS_PER_DAY = 86400;

static const int64_t SECS_PER_WEEK = 604800;

// 1970-01-05 was a Monday
static const int64_t FIRST_MONDAY = 345600;


rollup_t::rollup_t()
{
  n = 0;
  first = last = 0;
  distance = moving_time = elapsed = elev_gain = load = 0;
  n_climb = n_effort = 0;
  hr_weighted = hr_secs = 0;
  max_hr = max_power = max_speed = 0;
  hr_zones.metric = M_HR;
  power_zones.metric = M_POWER;
}

rollup_t::rollup_t( const activity_summary_t & s )
{
  *this = rollup_t();
  n = 1;
  ids.insert( s.meta.id );
  first = last = s.meta.start;
  distance = s.has_distance ? s.distance : 0 ;
  moving_time = s.moving_time;
  elapsed = s.elapsed;
  elev_gain = s.has_altitude ? s.elev_gain : 0 ;
  load = s.has_load ? s.load : 0 ;
  n_climb = s.n_segments( CLIMB );
  n_effort = s.n_segments( EFFORT );
  if ( s.has_hr )
    {
      hr_weighted = s.avg_hr * s.hr_secs;
      hr_secs = s.hr_secs;
      max_hr = s.max_hr;
    }
  if ( s.has_power ) max_power = s.max_power;
  if ( s.has_speed ) max_speed = s.max_speed;
  hr_zones = s.hr_zones;
  power_zones = s.power_zones;
}

rollup_t operator+( const rollup_t & a , const rollup_t & b )
{
  rollup_t r;
  r.n = a.n + b.n;
  r.ids = a.ids;
  r.ids.insert( b.ids.begin() , b.ids.end() );

  if ( a.n == 0 ) { r.first = b.first; r.last = b.last; }
  else if ( b.n == 0 ) { r.first = a.first; r.last = a.last; }
  else
    {
      r.first = std::min( a.first , b.first );
      r.last = std::max( a.last , b.last );
    }
  
  r.distance = a.distance + b.distance;
  r.moving_time = a.moving_time + b.moving_time;
  r.elapsed = a.elapsed + b.elapsed;
  r.elev_gain = a.elev_gain + b.elev_gain;
  r.load = a.load + b.load;
  r.n_climb = a.n_climb + b.n_climb;
  r.n_effort = a.n_effort + b.n_effort;
  r.hr_weighted = a.hr_weighted + b.hr_weighted;
  r.hr_secs = a.hr_secs + b.hr_secs;
  r.max_hr = std::max( a.max_hr , b.max_hr );
  r.max_power = std::max( a.max_power , b.max_power );
  r.max_speed = std::max( a.max_speed , b.max_speed );
  r.hr_zones = a.hr_zones + b.hr_zones;
  r.power_zones = a.power_zones + b.power_zones;
  return r;
}

rollup_t & rollup_t::operator+=( const rollup_t & rhs )
{
  *this = *this + rhs;
  return *this;
}


rollup_t rollup::fold( const std::vector<activity_summary_t> & s )
{
  rollup_t r;
  for (int i=0; i<(int)s.size(); i++)
    r += rollup_t( s[i] );
  return r;
}

rollup_t rollup::window( const std::vector<activity_summary_t> & s , int64_t from , int64_t to )
{
  rollup_t r;
  for (int i=0; i<(int)s.size(); i++)
    if ( s[i].meta.start >= from && s[i].meta.start < to )
      r += rollup_t( s[i] );
  return r;
}


// floor division, also for times before the epoch
static int64_t floor_div( int64_t a , int64_t b )
{
  int64_t q = a / b;
  if ( ( a % b != 0 ) && ( ( a < 0 ) != ( b < 0 ) ) ) --q;
  return q;
}

int64_t rollup::day_start( int64_t t )
{
  return floor_div( t , SECS_PER_DAY ) * SECS_PER_DAY;
}

int64_t rollup::week_start( int64_t t )
{
  return floor_div( t - FIRST_MONDAY , SECS_PER_WEEK ) * SECS_PER_WEEK + FIRST_MONDAY;
}

std::string rollup::date( int64_t t )
{
  std::time_t tt = t;
  std::tm tm;
  gmtime_r( &tt , &tm );
  char buf[ 16 ];
  std::strftime( buf , sizeof( buf ) , "%Y-%m-%d" , &tm );
  return buf;
}

std::map<int64_t,rollup_t> rollup::weekly( const std::vector<activity_summary_t> & s )
{
  std::map<int64_t,rollup_t> r;
  for (int i=0; i<(int)s.size(); i++)
    r[ week_start( s[i].meta.start ) ] += rollup_t( s[i] );
  return r;
}

std::map<int64_t,rollup_t> rollup::daily( const std::vector<activity_summary_t> & s )
{
  std::map<int64_t,rollup_t> r;
  for (int i=0; i<(int)s.size(); i++)
    r[ day_start( s[i].meta.start ) ] += rollup_t( s[i] );
  return r;
}

std::vector<load_day_t> rollup::daily_load( const std::vector<activity_summary_t> & s )
{
  std::vector<load_day_t> r;

  std::map<int64_t,rollup_t> days = daily( s );
  if ( days.size() == 0 ) return r;

  const int64_t d0 = days.begin()->first;
  const int64_t d1 = days.rbegin()->first;
  
  for (int64_t d = d0; d <= d1; d += SECS_PER_DAY)
    {
      load_day_t day;
      day.day = d;
      std::map<int64_t,rollup_t>::const_iterator dd = days.find( d );
      if ( dd != days.end() ) day.load = dd->second.load;
      r.push_back( day );
    }

  // trailing 7-day mean
  double sum = 0;
  for (int i=0; i<(int)r.size(); i++)
    {
      sum += r[i].load;
      if ( i >= 7 ) sum -= r[i-7].load;
      if ( i >= 6 )
	{
	  r[i].has_mean7 = true;
	  r[i].mean7 = sum / 7.0;
	}
    }
  
  return r;
}

std::vector<activity_summary_t> rollup::of_type( const std::vector<activity_summary_t> & s , const std::string & type )
{
  std::vector<activity_summary_t> r;
  for (int i=0; i<(int)s.size(); i++)
    if ( Helper::iequals( s[i].meta.type , type ) ) r.push_back( s[i] );
  return r;
}
