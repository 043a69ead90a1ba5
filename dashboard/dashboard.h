
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


#ifndef __VELO_DASHBOARD_H__
#define __VELO_DASHBOARD_H__

#include <string>
#include <vector>
#include <map>

#include "metrics/metrics.h"

struct param_t;


struct dashboard_param_t
{
  dashboard_param_t();

  explicit dashboard_param_t( const param_t & param );
  
  // cap on the number of points per series (0: no cap)
  int max_points;

  // route colour metric, and a multiplier for it (e.g. 3.6 for km/h)
  field_t color;
  double color_mult;
  
  double cadence_bin;
  double grade_bin;
  double speed_bin;

  void validate() const;
};


// one plotted line: x/y pairs, absent points skipped
struct series_t
{
  series_t() { }
  explicit series_t( const std::string & label ) : label(label) { } 
  std::string label;
  std::vector<double> x;
  std::vector<double> y;
  int size() const { return x.size(); }
};

// route point, with the colour value if present
struct route_point_t
{
  route_point_t() : lat(0) , lng(0) , has_value(false) , value(0) { }
  double lat, lng;
  bool has_value;
  double value;
};


//
// everything a renderer needs for one activity
//

struct dashboard_t
{
  
  activity_meta_t meta;

  activity_summary_t summary;
  
  // retained sample indices (after down-sampling)
  std::vector<int> index;

  // heart rate & power over time (minutes)
  series_t hr, power;

  // speed (km/h) & cadence over time (minutes)
  series_t speed, cadence;

  // altitude against distance (km), or time if no distance
  series_t altitude;

  std::vector<route_point_t> route;
  std::string route_label;

  // zone shares (may be 'unavailable')
  zone_distribution_t hr_zones, power_zones;

  // performance metrics table: (name, value)
  std::vector<std::pair<std::string,double> > table;

  std::vector<segment_t> segments;

  std::map<double,int> cadence_hist, grade_hist, speed_hist;

};


namespace dashboard
{
  
  // uniform stride over n points, always keeping the last; everything if n <= max (or max == 0)
  std::vector<int> decimate( int n , int max_points );

  dashboard_t assemble( const activity_summary_t & summary ,
			const activity_stream_t & stream ,
			const dashboard_param_t & par );

  std::vector<std::pair<std::string,double> > performance_table( const activity_summary_t & s );
}

#endif
