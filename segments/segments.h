
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


#ifndef __VELO_SEGMENTS_H__
#define __VELO_SEGMENTS_H__

#include <string>
#include <vector>
#include <ostream>

#include "defs/defs.h"
#include "intervals/intervals.h"

struct param_t;
struct activity_stream_t;
struct channel_t;


struct detector_param_t
{
  detector_param_t();

  explicit detector_param_t( const param_t & param );
  
  // centred moving-average window, in samples (odd)
  int smooth;
  
  // climbing: smoothed grade (%) above this
  double grade_th;

  // high effort: smoothed power (W) above this, or HR (bpm) if no power
  double power_th;
  double hr_th;

  // minimum segment duration (seconds)
  double min_dur;

  // merge same-kind runs separated by less than this (seconds)
  double merge_gap;

  void validate() const;
};


//
// a maximal run of samples with at least one trigger active
//

struct run_t
{
  run_t() : kind( CLIMB ) , n_climb(0) , n_effort(0) , n_both(0) { } 

  run_t( const interval_t & tp , segment_kind_t kind ) 
    : tp(tp) , kind(kind) , n_climb(0) , n_effort(0) , n_both(0) { } 
  
  // sample indices, inclusive
  interval_t tp;

  segment_kind_t kind;

  // trigger counts within the run
  int n_climb;
  int n_effort;
  int n_both;
  
  bool operator<( const run_t & rhs ) const { return tp < rhs.tp; }
};


//
// the smoothed inputs to thresholding
//

struct signals_t
{
  signals_t() : intensity_metric( M_POWER ) { }
  
  std::vector<double> grade;
  std::vector<bool>   grade_p;

  std::vector<double> intensity;
  std::vector<bool>   intensity_p;

  // power if any power sample is present, else heart rate
  metric_t intensity_metric;
};


struct segment_t
{

  segment_t();

  segment_kind_t kind;

  // sample indices (inclusive)
  interval_t tp;

  // elapsed seconds
  double start_sec;
  double stop_sec;
  double dur;
  
  bool has_hr;
  double avg_hr, max_hr;

  bool has_power;
  double avg_power, max_power;

  bool has_speed;
  double avg_speed;

  bool has_grade;
  double avg_grade;

  bool has_cadence;
  double avg_cadence;

  bool has_altitude;
  double elev_gain;

  // vertical ascent, metres per hour
  double vam;

  bool has_distance;
  double distance;

  // fraction of the segment with each trigger active
  double frac_climb;
  double frac_effort;
  
  std::string label() const;
  
  bool operator<( const segment_t & rhs ) const 
  {
    if ( tp == rhs.tp ) return kind < rhs.kind;
    return tp < rhs.tp;
  }
  
};

std::ostream & operator<<( std::ostream & out , const segment_t & seg );


//
// climb / effort segment detection:
//   smooth -> triggers -> runs -> merge -> filter -> describe
//

struct segment_detector_t
{
  
  explicit segment_detector_t( const detector_param_t & par ) : par(par) { } 

  std::vector<segment_t> detect( const activity_stream_t & stream ) const;

  //
  // individual steps
  //
  
  signals_t smooth( const activity_stream_t & stream ) const;

  void triggers( const signals_t & sig ,
		 std::vector<bool> * climbing ,
		 std::vector<bool> * effort ) const;

  // maximal runs where either trigger holds, each with a provisional kind
  std::vector<run_t> runs( const signals_t & sig ,
			   const std::vector<bool> & climbing ,
			   const std::vector<bool> & effort ) const;

  // combine consecutive same-kind runs closer than merge_gap
  std::vector<run_t> merge( const std::vector<run_t> & runs ,
			    const std::vector<double> & tp ) const;
  
  // drop runs shorter than min_dur
  std::vector<run_t> filter( const std::vector<run_t> & runs ,
			     const std::vector<double> & tp ,
			     double interval ) const;

  // drop runs outside [0,n) and runs overlapping an earlier one of the same kind
  std::vector<run_t> check( const std::vector<run_t> & runs ,
			    int n ,
			    const std::string & id ) const;

  segment_t describe( const run_t & run ,
		      const activity_stream_t & stream ) const;
  
  // kind of one run (both triggers for most of it: larger relative margin wins)
  segment_kind_t kind( const run_t & run , const signals_t & sig ) const;

  double intensity_th( metric_t m ) const { return m == M_POWER ? par.power_th : par.hr_th ; } 
  
  const detector_param_t par;

};


#endif
