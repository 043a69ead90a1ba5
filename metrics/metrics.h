
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


#ifndef __VELO_METRICS_H__
#define __VELO_METRICS_H__

#include <string>
#include <vector>
#include <map>

#include "stream/stream.h"
#include "zones/zones.h"
#include "segments/segments.h"

struct param_t;


struct summary_param_t
{
  summary_param_t();

  explicit summary_param_t( const param_t & param );

  // minimal movement (m/s) for moving time
  double moving_speed;

  // normalized power rolling window (seconds)
  double np_window;

  // power-curve durations (seconds)
  std::vector<int> curve;

  void validate() const;
};


//
// whole-activity rollup
//

struct activity_summary_t
{

  activity_summary_t();
  
  activity_meta_t meta;

  int n;
  double interval;
  
  double elapsed;
  double moving_time;

  bool has_distance;
  double distance;

  bool has_altitude;
  double elev_gain, elev_loss;
  double alt_min, alt_max;
  
  bool has_speed;
  double avg_speed, max_speed;  

  bool has_hr;
  double avg_hr, max_hr;

  // time with heart rate present (weights avg_hr in rollups)
  double hr_secs;
  
  bool has_power;
  double avg_power, max_power;

  bool has_np;
  double np;

  bool has_ftp;
  double ftp;

  // duration (s) -> best average power
  std::map<int,double> power_curve;
  
  bool has_cadence;
  double avg_cadence, max_cadence;

  // moving hours x average heart rate
  bool has_load;
  double load;
  
  zone_distribution_t hr_zones;
  zone_distribution_t power_zones;
  
  std::vector<segment_t> segments;

  int n_segments( segment_kind_t k ) const;

  const zone_distribution_t & zones( metric_t m ) const { return m == M_HR ? hr_zones : power_zones; } 
};


namespace metrics
{

  activity_summary_t summarize( const activity_stream_t & stream ,
				const zone_distribution_t & hr_zones ,
				const zone_distribution_t & power_zones ,
				const std::vector<segment_t> & segments ,
				const summary_param_t & par );

  // seconds flagged moving by the device, else with speed above 'moving_speed'
  // (speed channel, else distance deltas), else all of the elapsed time
  double moving_time( const activity_stream_t & stream , double moving_speed );

  // metres
  bool distance( const activity_stream_t & stream , double * d );
  
  // 4th root of the mean 4th power of the rolling 'window'-second
  // average; F if fewer than 'window' seconds of power
  bool normalized_power( const activity_stream_t & stream , double window , double * np );

  // 95% of the best 20-minute average
  bool ftp_estimate( const activity_stream_t & stream , double * ftp );

  // best average power over each duration (omitted if longer than the ride)
  std::map<int,double> power_curve( const activity_stream_t & stream , const std::vector<int> & durations );
  
}

#endif
