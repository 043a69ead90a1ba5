
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


#include "metrics/metrics.h"

#include "param.h"
#include "stats/eigen_ops.h"
#include "stats/running-stats.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include <cmath>
#include <algorithm>
#include <sstream>

extern logger_t logger;


summary_param_t::summary_param_t()
{
  moving_speed = 0.5;
  np_window = 30;
  const int d[] = { 5 , 10 , 30 , 60 , 300 , 600 , 1200 , 1800 , 3600 };
  curve.assign( d , d + 9 );
}

summary_param_t::summary_param_t( const param_t & param )
{
  *this = summary_param_t();
  moving_speed = param.dbl( "moving-speed" , moving_speed );
  np_window = param.dbl( "np-window" , np_window );
  if ( param.has( "curve" ) ) curve = param.intvector( "curve" );
  validate();
}

void summary_param_t::validate() const
{
  if ( moving_speed < 0 )
    throw invalid_param_error( "moving-speed cannot be negative" );
  if ( ! ( np_window > 0 ) )
    throw invalid_param_error( "np-window must be positive" );
  for (int i=0; i<(int)curve.size(); i++)
    if ( curve[i] <= 0 )
      throw invalid_param_error( "power-curve durations must be positive" );
}


activity_summary_t::activity_summary_t()
{
  n = 0;
  interval = elapsed = moving_time = 0;
  has_distance = has_altitude = has_speed = has_hr = has_power = has_np = has_ftp = has_cadence = has_load = false;
  distance = elev_gain = elev_loss = alt_min = alt_max = 0;
  avg_speed = max_speed = avg_hr = max_hr = hr_secs = 0;
  avg_power = max_power = np = ftp = 0;
  avg_cadence = max_cadence = load = 0;
  hr_zones.metric = M_HR;
  power_zones.metric = M_POWER;
}

int activity_summary_t::n_segments( segment_kind_t k ) const
{
  int c = 0;
  for (int i=0; i<(int)segments.size(); i++)
    if ( segments[i].kind == k ) ++c;
  return c;
}


// speeds (m/s) between successive present distance points, with their spans
static void distance_speeds( const activity_stream_t & stream ,
			     std::vector<double> * v ,
			     std::vector<double> * dt )
{
  const channel_t & d = stream[ F_DISTANCE ];
  int last = -1;
  for (int i=0; i<stream.size(); i++)
    {
      if ( ! d.p[i] ) continue;
      if ( last != -1 )
	{
	  const double t = stream.tp[i] - stream.tp[last];
	  v->push_back( ( d.x[i] - d.x[last] ) / t );
	  dt->push_back( t );
	}
      last = i;
    }
}


double metrics::moving_time( const activity_stream_t & stream , double moving_speed )
{
  // the device's own flag takes precedence
  const channel_t & mov = stream[ F_MOVING ];

  if ( mov.any() )
    {
      int c = 0;
      for (int i=0; i<mov.size(); i++)
	if ( mov.p[i] && mov.x[i] > 0 ) ++c;
      return c * stream.interval;
    }
  
  const channel_t & spd = stream[ F_SPEED ];

  if ( spd.any() )
    {
      int c = 0;
      for (int i=0; i<spd.size(); i++)
	if ( spd.p[i] && spd.x[i] > moving_speed ) ++c;
      return c * stream.interval;
    }

  if ( stream.has( F_DISTANCE ) )
    {
      std::vector<double> v, dt;
      distance_speeds( stream , &v , &dt );
      double t = 0;
      for (int i=0; i<(int)v.size(); i++)
	if ( v[i] > moving_speed ) t += dt[i];
      return t;
    }

  // nothing to tell
  return stream.elapsed();
}


bool metrics::distance( const activity_stream_t & stream , double * d )
{
  const channel_t & dist = stream[ F_DISTANCE ];
  
  if ( dist.any() )
    {
      std::vector<double> x = dist.present_values();
      *d = x.back() - x.front();
      return true;
    }

  const channel_t & spd = stream[ F_SPEED ];
  if ( spd.any() )
    {
      *d = MiscMath::sum( spd.present_values() ) * stream.interval;
      return true;
    }
  
  return false;
}


// present power samples with the cranks turning (0 W is coasting)
static std::vector<double> pedalling( const activity_stream_t & stream )
{
  const channel_t & pwr = stream[ F_POWER ];
  std::vector<double> r;
  for (int i=0; i<pwr.size(); i++)
    if ( pwr.p[i] && pwr.x[i] > 0 ) r.push_back( pwr.x[i] );
  return r;
}

// samples spanning 'secs' at the nominal interval
static int window_samples( double secs , double interval )
{
  const int w = std::lround( secs / interval );
  return w < 1 ? 1 : w;
}

bool metrics::normalized_power( const activity_stream_t & stream , double window , double * np )
{
  std::vector<double> p = pedalling( stream );
  
  const int w = window_samples( window , stream.interval );
  if ( (int)p.size() < w ) return false;

  Eigen::VectorXd r = eigen_ops::rolling_mean( eigen_ops::copy_array( p ) , w );
  
  *np = std::pow( r.array().pow( 4 ).mean() , 0.25 );
  return true;
}

bool metrics::ftp_estimate( const activity_stream_t & stream , double * ftp )
{
  std::vector<double> p = pedalling( stream );
  const int w = window_samples( 1200 , stream.interval );
  if ( (int)p.size() < w ) return false;
  *ftp = 0.95 * eigen_ops::best_mean( eigen_ops::copy_array( p ) , w );
  return true;
}

std::map<int,double> metrics::power_curve( const activity_stream_t & stream , const std::vector<int> & durations )
{
  std::map<int,double> r;
  std::vector<double> p = pedalling( stream );
  if ( p.size() == 0 ) return r;

  Eigen::VectorXd x = eigen_ops::copy_array( p );
  for (int d=0; d<(int)durations.size(); d++)
    {
      const int w = window_samples( durations[d] , stream.interval );
      if ( w <= (int)p.size() )
	r[ durations[d] ] = eigen_ops::best_mean( x , w );
    }
  return r;
}


activity_summary_t metrics::summarize( const activity_stream_t & stream ,
				       const zone_distribution_t & hr_zones ,
				       const zone_distribution_t & power_zones ,
				       const std::vector<segment_t> & segments ,
				       const summary_param_t & par )
{

  activity_summary_t s;

  s.meta = stream.meta;
  s.n = stream.size();
  s.interval = stream.interval;
  s.elapsed = stream.elapsed();
  s.moving_time = moving_time( stream , par.moving_speed );

  s.has_distance = distance( stream , &s.distance );

  //
  // elevation
  //
  
  const channel_t & alt = stream[ F_ALTITUDE ];
  if ( alt.any() )
    {
      s.has_altitude = true;
      s.elev_gain = MiscMath::ascent( alt.x , alt.p , 0 , s.n - 1 );
      s.elev_loss = MiscMath::descent( alt.x , alt.p , 0 , s.n - 1 );
      running_stats_t a;
      for (int i=0; i<s.n; i++) if ( alt.p[i] ) a.push( alt.x[i] );
      s.alt_min = a.min();
      s.alt_max = a.max();
    }

  
  //
  // speed
  //

  const channel_t & spd = stream[ F_SPEED ];
  if ( spd.any() )
    {
      running_stats_t v;
      for (int i=0; i<s.n; i++) if ( spd.p[i] ) v.push( spd.x[i] );
      s.has_speed = true;
      s.avg_speed = v.mean();
      s.max_speed = v.max();
    }
  else if ( stream.has( F_DISTANCE ) )
    {
      std::vector<double> v, dt;
      distance_speeds( stream , &v , &dt );
      if ( v.size() != 0 )
	{
	  s.has_speed = true;
	  s.avg_speed = s.elapsed > 0 ? s.distance / s.elapsed : 0 ;
	  s.max_speed = *std::max_element( v.begin() , v.end() );
	}
    }

  
  //
  // heart rate
  //

  const channel_t & hr = stream[ F_HR ];
  if ( hr.any() )
    {
      running_stats_t h;
      for (int i=0; i<s.n; i++) if ( hr.p[i] ) h.push( hr.x[i] );
      s.has_hr = true;
      s.avg_hr = h.mean();
      s.max_hr = h.max();
      s.hr_secs = h.num_data_values() * stream.interval;
      s.has_load = true;
      s.load = s.moving_time / 3600.0 * s.avg_hr;
    }

  
  //
  // power (as for cadence, coasting zeros are left out)
  //

  const std::vector<double> pwr = pedalling( stream );
  if ( pwr.size() != 0 )
    {
      running_stats_t p;
      for (int i=0; i<(int)pwr.size(); i++) p.push( pwr[i] );
      s.has_power = true;
      s.avg_power = p.mean();
      s.max_power = p.max();
      s.has_np = normalized_power( stream , par.np_window , &s.np );
      s.has_ftp = ftp_estimate( stream , &s.ftp );
      s.power_curve = power_curve( stream , par.curve );
    }

  
  //
  // cadence (zeros, i.e. coasting, do not count towards the average)
  //

  const channel_t & cad = stream[ F_CADENCE ];
  running_stats_t c;
  for (int i=0; i<cad.size(); i++)
    if ( cad.p[i] && cad.x[i] > 0 ) c.push( cad.x[i] );
  if ( ! c.empty() )
    {
      s.has_cadence = true;
      s.avg_cadence = c.mean();
      s.max_cadence = c.max();
    }
  
  s.hr_zones = hr_zones;
  s.power_zones = power_zones;
  s.segments = segments;

  if ( globals::verbose )
    {
      std::stringstream ss;
      ss << "  " << s.meta.id << ": " << Helper::dbl2str( s.distance / 1000.0 , 2 ) << " km, moving "
	 << Helper::timestring( s.moving_time ) << ", +" << Helper::dbl2str( s.elev_gain , 0 ) << " m\n";
      logger << ss.str();
    }
  
  return s;
}
