
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


#include "dashboard/dashboard.h"

#include "param.h"
#include "zones/zones.h"
#include "helper/helper.h"
#include "helper/errors.h"

#include <cmath>


dashboard_param_t::dashboard_param_t()
{
  max_points = 0;
  color = F_ALTITUDE;
  color_mult = 1;
  cadence_bin = 5;
  grade_bin = 1;
  speed_bin = 1;
}

dashboard_param_t::dashboard_param_t( const param_t & param )
{
  *this = dashboard_param_t();

  max_points = param.integer( "max-points" , max_points );

  if ( param.has( "color" ) )
    {
      color = globals::field( param.value( "color" ) );
      if ( color == F_NONE || color == F_LAT || color == F_LNG )
	throw invalid_param_error( "cannot color route by " + param.value( "color" ) );
      // speed is shown in km/h unless told otherwise
      if ( color == F_SPEED ) color_mult = 3.6;
    }
  
  color_mult = param.dbl( "color-mult" , color_mult );
  cadence_bin = param.dbl( "cadence-bin" , cadence_bin );
  grade_bin = param.dbl( "grade-bin" , grade_bin );
  speed_bin = param.dbl( "speed-bin" , speed_bin );

  validate();
}

void dashboard_param_t::validate() const
{
  if ( max_points < 0 )
    throw invalid_param_error( "max-points cannot be negative" );
  if ( ! ( cadence_bin > 0 && grade_bin > 0 && speed_bin > 0 ) )
    throw invalid_param_error( "histogram bin widths must be positive" );
}


std::vector<int> dashboard::decimate( int n , int max_points )
{
  std::vector<int> r;
  if ( n <= 0 ) return r;
  
  if ( max_points == 0 || n <= max_points )
    {
      r.resize( n );
      for (int i=0; i<n; i++) r[i] = i;
      return r;
    }

  if ( max_points == 1 )
    {
      r.push_back( n - 1 );
      return r;
    }
  
  // stride such that the last point still fits under the cap
  const int q = (int)std::ceil( ( n - 1 ) / (double)( max_points - 1 ) );
  for (int i=0; i<n-1; i+=q) r.push_back( i );
  r.push_back( n - 1 );
  return r;
}


static series_t make_series( const std::string & label ,
			     const std::vector<int> & index ,
			     const std::vector<double> & x , 
			     const channel_t & y ,
			     const std::vector<bool> * xp = NULL ,
			     double ymult = 1.0 )
{
  series_t s( label );
  for (int j=0; j<(int)index.size(); j++)
    {
      const int i = index[j];
      if ( ! y.p[i] ) continue;
      if ( xp != NULL && ! (*xp)[i] ) continue;
      s.x.push_back( x[i] );
      s.y.push_back( y.x[i] * ymult );
    }
  return s;
}


std::vector<std::pair<std::string,double> > dashboard::performance_table( const activity_summary_t & s )
{
  std::vector<std::pair<std::string,double> > t;
  
  if ( s.has_distance ) t.push_back( std::make_pair( "Distance (km)" , s.distance / 1000.0 ) );
  t.push_back( std::make_pair( "Moving Time (min)" , s.moving_time / 60.0 ) );
  
  if ( s.has_hr )
    {
      t.push_back( std::make_pair( "Avg HR" , s.avg_hr ) );
      t.push_back( std::make_pair( "Max HR" , s.max_hr ) );
    }

  if ( s.has_power )
    {
      t.push_back( std::make_pair( "Avg Power" , s.avg_power ) );
      t.push_back( std::make_pair( "Max Power" , s.max_power ) );
      if ( s.has_np ) t.push_back( std::make_pair( "NP" , s.np ) );
    }

  if ( s.has_speed )
    {
      t.push_back( std::make_pair( "Avg Speed (km/h)" , s.avg_speed * 3.6 ) );
      t.push_back( std::make_pair( "Max Speed (km/h)" , s.max_speed * 3.6 ) );
    }

  if ( s.has_cadence )
    t.push_back( std::make_pair( "Avg Cadence" , s.avg_cadence ) );

  if ( s.has_altitude )
    t.push_back( std::make_pair( "Elevation Gain (m)" , s.elev_gain ) );

  if ( s.has_load )
    t.push_back( std::make_pair( "Training Load" , s.load ) );
  
  return t;
}


dashboard_t dashboard::assemble( const activity_summary_t & summary ,
				 const activity_stream_t & stream ,
				 const dashboard_param_t & par )
{
  
  dashboard_t d;

  d.meta = summary.meta;
  d.summary = summary;
  d.index = decimate( stream.size() , par.max_points );

  // time axis in minutes
  std::vector<double> mins( stream.size() );
  for (int i=0; i<stream.size(); i++)
    mins[i] = ( stream.tp[i] - stream.tp[0] ) / 60.0;

  d.hr = make_series( "Heart Rate (bpm)" , d.index , mins , stream[ F_HR ] );
  d.power = make_series( "Power (W)" , d.index , mins , stream[ F_POWER ] );
  d.speed = make_series( "Speed (km/h)" , d.index , mins , stream[ F_SPEED ] , NULL , 3.6 );
  d.cadence = make_series( "Cadence (rpm)" , d.index , mins , stream[ F_CADENCE ] );
  
  //
  // elevation profile: against distance if we have it
  //
  
  const channel_t & dist = stream[ F_DISTANCE ];
  if ( dist.any() )
    {
      std::vector<double> km( stream.size() );
      for (int i=0; i<stream.size(); i++) km[i] = dist.x[i] / 1000.0;
      d.altitude = make_series( "Altitude (m)" , d.index , km , stream[ F_ALTITUDE ] , &dist.p );
    }
  else
    d.altitude = make_series( "Altitude (m)" , d.index , mins , stream[ F_ALTITUDE ] );

  
  //
  // route
  //
  
  const channel_t & lat = stream[ F_LAT ];
  const channel_t & lng = stream[ F_LNG ];
  const channel_t & col = stream[ par.color ];

  d.route_label = globals::field( par.color );
  
  for (int j=0; j<(int)d.index.size(); j++)
    {
      const int i = d.index[j];
      if ( ! ( lat.p[i] && lng.p[i] ) ) continue;
      route_point_t pt;
      pt.lat = lat.x[i];
      pt.lng = lng.x[i];
      if ( col.p[i] )
	{
	  pt.has_value = true;
	  pt.value = col.x[i] * par.color_mult;
	}
      d.route.push_back( pt );
    }

  d.hr_zones = summary.hr_zones;
  d.power_zones = summary.power_zones;
  d.segments = summary.segments;
  d.table = performance_table( summary );

  // histograms are over the full stream, not the decimated one
  d.cadence_hist = zones::histogram( stream , F_CADENCE , par.cadence_bin , true );
  d.grade_hist = zones::histogram( stream , F_GRADE , par.grade_bin );
  d.speed_hist = zones::histogram( stream , F_SPEED , par.speed_bin );
  
  return d;
}
