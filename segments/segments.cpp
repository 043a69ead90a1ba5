
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


#include "segments/segments.h"

#include "param.h"
#include "stream/stream.h"
#include "stats/eigen_ops.h"
#include "stats/running-stats.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include <cmath>
#include <map>
#include <sstream>

extern logger_t logger;


detector_param_t::detector_param_t()
{
  smooth = 5;
  grade_th = 5;
  power_th = 250;
  hr_th = 160;
  min_dur = 30;
  merge_gap = 5;
}

detector_param_t::detector_param_t( const param_t & param )
{
  *this = detector_param_t();
  smooth    = param.integer( "smooth" , smooth );
  grade_th  = param.dbl( "grade-th" , grade_th );
  power_th  = param.dbl( "power-th" , power_th );
  hr_th     = param.dbl( "hr-th" , hr_th );
  min_dur   = param.dbl( "min-dur" , min_dur );
  merge_gap = param.dbl( "merge-gap" , merge_gap );
  validate();
}

void detector_param_t::validate() const
{
  if ( smooth < 1 || smooth % 2 == 0 )
    throw invalid_param_error( "smooth must be a positive odd number of samples" );
  if ( min_dur < 0 )
    throw invalid_param_error( "min-dur cannot be negative" );
  if ( merge_gap < 0 )
    throw invalid_param_error( "merge-gap cannot be negative" );
  if ( ! ( Helper::realnum( grade_th ) && Helper::realnum( power_th ) && Helper::realnum( hr_th ) ) )
    throw invalid_param_error( "non-finite segment threshold" );
}


segment_t::segment_t()
{
  kind = CLIMB;
  start_sec = stop_sec = dur = 0;
  has_hr = has_power = has_speed = has_grade = has_cadence = has_altitude = has_distance = false;
  avg_hr = max_hr = avg_power = max_power = avg_speed = avg_grade = avg_cadence = 0;
  elev_gain = vam = distance = 0;
  frac_climb = frac_effort = 0;
}

std::string segment_t::label() const
{
  return globals::kind( kind ) + ":" + tp.as_string();
}

std::ostream & operator<<( std::ostream & out , const segment_t & seg )
{
  out << globals::kind( seg.kind ) << " " << seg.tp
      << " (" << seg.start_sec << "-" << seg.stop_sec << "s, " << seg.dur << "s)";
  return out;
}


//
// 1) smoothing
//

signals_t segment_detector_t::smooth( const activity_stream_t & stream ) const
{
  signals_t sig;
  
  const channel_t & grade = stream[ F_GRADE ];
  
  Eigen::VectorXd g = eigen_ops::moving_average( eigen_ops::copy_array( grade.x ) ,
						 grade.p , par.smooth , &sig.grade_p );
  sig.grade = eigen_ops::copy_vector( g );
  
  sig.intensity_metric = stream.has( F_POWER ) ? M_POWER : M_HR;

  const channel_t & intensity = stream[ globals::metric_field( sig.intensity_metric ) ];

  Eigen::VectorXd e = eigen_ops::moving_average( eigen_ops::copy_array( intensity.x ) ,
						 intensity.p , par.smooth , &sig.intensity_p );
  sig.intensity = eigen_ops::copy_vector( e );

  return sig;
}


//
// 2) per-sample triggers
//

void segment_detector_t::triggers( const signals_t & sig ,
				   std::vector<bool> * climbing ,
				   std::vector<bool> * effort ) const
{
  const int n = sig.grade.size();
  const double ith = intensity_th( sig.intensity_metric );
  
  climbing->assign( n , false );
  effort->assign( n , false );
  
  for (int i=0; i<n; i++)
    {
      (*climbing)[i] = sig.grade_p[i] && sig.grade[i] > par.grade_th;
      (*effort)[i] = sig.intensity_p[i] && sig.intensity[i] > ith;
    }
}


//
// 3) runs, with a provisional kind
//

std::vector<run_t> segment_detector_t::runs( const signals_t & sig ,
					     const std::vector<bool> & climbing ,
					     const std::vector<bool> & effort ) const
{
  const int n = climbing.size();
  std::vector<bool> any( n , false );
  for (int i=0; i<n; i++)
    any[i] = climbing[i] || effort[i];

  std::vector<interval_t> intervals = interval_t::runs( any );
  
  std::vector<run_t> r;
  for (int j=0; j<(int)intervals.size(); j++)
    {
      run_t run( intervals[j] , CLIMB );
      for (int i=run.tp.start; i<=run.tp.stop; i++)
	{
	  if ( climbing[i] ) ++run.n_climb;
	  if ( effort[i] ) ++run.n_effort;
	  if ( climbing[i] && effort[i] ) ++run.n_both;
	}
      run.kind = kind( run , sig );
      r.push_back( run );
    }
  
  return r;
}


static double relative_margin( double x , double th )
{
  return th != 0 ? ( x - th ) / std::fabs( th ) : x - th ;
}

segment_kind_t segment_detector_t::kind( const run_t & run , const signals_t & sig ) const
{
  
  // one trigger dominant
  if ( 2 * run.n_both <= run.tp.n() )
    return run.n_climb >= run.n_effort ? CLIMB : EFFORT;

  // both active for most of the run: larger relative excess over threshold, ties to climb
  running_stats_t g, e;
  for (int i=run.tp.start; i<=run.tp.stop; i++)
    {
      if ( sig.grade_p[i] ) g.push( sig.grade[i] );
      if ( sig.intensity_p[i] ) e.push( sig.intensity[i] );
    }

  const double mg = relative_margin( g.mean() , par.grade_th );
  const double me = relative_margin( e.mean() , intensity_th( sig.intensity_metric ) );

  return me > mg ? EFFORT : CLIMB;
}


//
// 4) merge nearby runs of the same kind
//

std::vector<run_t> segment_detector_t::merge( const std::vector<run_t> & runs ,
					      const std::vector<double> & tp ) const
{
  
  std::vector<run_t> merged;

  if ( runs.size() == 0 ) return merged;

  bool extending = false;

  run_t previous = runs[0];
  
  for (int i=1; i<(int)runs.size(); i++)
    {
      const run_t & current = runs[i];

      // gap: from the first sample after the previous run to the start of this one
      const int after = previous.tp.stop + 1;
      const double gap = tp[ current.tp.start ] - tp[ after < (int)tp.size() ? after : previous.tp.stop ];

      extending = current.kind == previous.kind && gap < par.merge_gap;

      if ( extending )
	{
	  previous.tp.extend( current.tp );
	  previous.n_climb += current.n_climb;
	  previous.n_effort += current.n_effort;
	  previous.n_both += current.n_both;
	}
      else
	{
	  merged.push_back( previous );
	  previous = current;
	}
    }

  // and finally the last one (extended or not)
  merged.push_back( previous );

  return merged;
}


//
// 5) minimum duration
//

std::vector<run_t> segment_detector_t::filter( const std::vector<run_t> & runs ,
					       const std::vector<double> & tp ,
					       double interval ) const
{
  std::vector<run_t> r;
  for (int i=0; i<(int)runs.size(); i++)
    {
      const double dur = tp[ runs[i].tp.stop ] - tp[ runs[i].tp.start ] + interval;
      if ( dur >= par.min_dur ) r.push_back( runs[i] );
    }
  return r;
}


//
// 6) per-segment metrics
//

segment_t segment_detector_t::describe( const run_t & run ,
					const activity_stream_t & stream ) const
{
  segment_t seg;
  seg.kind = run.kind;
  seg.tp = run.tp;

  const int s0 = run.tp.start;
  const int s1 = run.tp.stop;
  const int n = run.tp.n();
  
  seg.start_sec = stream.tp[ s0 ];
  seg.stop_sec = stream.tp[ s1 ];
  seg.dur = seg.stop_sec - seg.start_sec + stream.interval;

  running_stats_t hr, pwr, spd, grd, cad;
  
  const channel_t & HR = stream[ F_HR ];
  const channel_t & PWR = stream[ F_POWER ];
  const channel_t & SPD = stream[ F_SPEED ];
  const channel_t & GRD = stream[ F_GRADE ];
  const channel_t & CAD = stream[ F_CADENCE ];
  const channel_t & DST = stream[ F_DISTANCE ];
  const channel_t & ALT = stream[ F_ALTITUDE ];

  int first_dist = -1 , last_dist = -1;
  bool any_alt = false;
  
  for (int i=s0; i<=s1; i++)
    {
      if ( HR.p[i] ) hr.push( HR.x[i] );
      if ( PWR.p[i] ) pwr.push( PWR.x[i] );
      if ( SPD.p[i] ) spd.push( SPD.x[i] );
      if ( GRD.p[i] ) grd.push( GRD.x[i] );
      if ( CAD.p[i] && CAD.x[i] > 0 ) cad.push( CAD.x[i] );
      if ( ALT.p[i] ) any_alt = true;
      if ( DST.p[i] )
	{
	  if ( first_dist == -1 ) first_dist = i;
	  last_dist = i;
	}
    }

  if ( ! hr.empty() )
    {
      seg.has_hr = true;
      seg.avg_hr = hr.mean();
      seg.max_hr = hr.max();
    }
  
  if ( ! pwr.empty() )
    {
      seg.has_power = true;
      seg.avg_power = pwr.mean();
      seg.max_power = pwr.max();
    }

  if ( first_dist != -1 )
    {
      seg.has_distance = true;
      seg.distance = DST.x[ last_dist ] - DST.x[ first_dist ];
    }
  
  if ( ! spd.empty() )
    {
      seg.has_speed = true;
      seg.avg_speed = spd.mean();
    }
  else if ( seg.has_distance && seg.dur > 0 )
    {
      seg.has_speed = true;
      seg.avg_speed = seg.distance / seg.dur;
    }
  
  if ( ! grd.empty() )
    {
      seg.has_grade = true;
      seg.avg_grade = grd.mean();
    }

  if ( ! cad.empty() )
    {
      seg.has_cadence = true;
      seg.avg_cadence = cad.mean();
    }

  if ( any_alt )
    {
      seg.has_altitude = true;
      seg.elev_gain = MiscMath::ascent( ALT.x , ALT.p , s0 , s1 );
      seg.vam = seg.dur > 0 ? seg.elev_gain / ( seg.dur / 3600.0 ) : 0 ;
    }

  seg.frac_climb = run.n_climb / (double)n;
  seg.frac_effort = run.n_effort / (double)n;
  
  return seg;
}


//
// invariants: a bad run is an engine defect; report and drop it
//

std::vector<run_t> segment_detector_t::check( const std::vector<run_t> & runs ,
					      int n ,
					      const std::string & id ) const
{
  std::vector<run_t> r;
  std::map<segment_kind_t,int> last_stop;
  
  for (int i=0; i<(int)runs.size(); i++)
    {
      const run_t & run = runs[i];

      if ( run.tp.empty() || run.tp.start < 0 || run.tp.stop >= n )
	{
	  logger.warning( "dropping invalid segment " + run.tp.as_string() + " in " + id );
	  continue;
	}

      std::map<segment_kind_t,int>::const_iterator ll = last_stop.find( run.kind );
      if ( ll != last_stop.end() && run.tp.start <= ll->second )
	{
	  logger.warning( "dropping overlapping " + globals::kind( run.kind ) + " segment "
			  + run.tp.as_string() + " in " + id );
	  continue;
	}

      last_stop[ run.kind ] = run.tp.stop;
      r.push_back( run );
    }

  return r;
}


//
// all steps
//

std::vector<segment_t> segment_detector_t::detect( const activity_stream_t & stream ) const
{

  const int n = stream.size();
  
  signals_t sig = smooth( stream );

  std::vector<bool> climbing, effort;
  triggers( sig , &climbing , &effort );

  std::vector<run_t> runs0 = runs( sig , climbing , effort );

  std::vector<run_t> runs1 = merge( runs0 , stream.tp );

  std::vector<run_t> runs2 = filter( runs1 , stream.tp , stream.interval );

  std::stringstream ss;
  ss << "  " << stream.meta.id << ": " << runs0.size() << " candidate runs ("
     << globals::metric( sig.intensity_metric ) << " intensity), "
     << runs1.size() << " after merging, "
     << runs2.size() << " of at least " << par.min_dur << "s\n";
  logger << ss.str();
  
  std::vector<run_t> runs3 = check( runs2 , n , stream.meta.id );
  
  std::vector<segment_t> segs;

  for (int r=0; r<(int)runs3.size(); r++)
    {
      segment_t seg = describe( runs3[r] , stream );

      if ( globals::verbose )
	{
	  std::stringstream ls;
	  ls << "   " << seg << "\n";
	  logger << ls.str();
	}
      
      segs.push_back( seg );
    }
  
  return segs;
}
