
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


#ifndef __VELO_PIPELINE_H__
#define __VELO_PIPELINE_H__

#include <string>
#include <vector>

#include "stream/stream.h"
#include "zones/zones.h"
#include "segments/segments.h"
#include "metrics/metrics.h"
#include "dashboard/dashboard.h"

struct param_t;


//
// all settings for one run, passed explicitly to every activity
//

struct analysis_param_t
{
  analysis_param_t() { } 

  // e.g. { "smooth=7" , "min-dur=60" , "max-points=500" }
  explicit analysis_param_t( const param_t & param );
  
  align_param_t align;
  detector_param_t detector;
  summary_param_t summary;
  dashboard_param_t dashboard;
};


// one activity, as supplied by the fetch / storage layer
struct activity_input_t
{
  activity_input_t() { } 
  activity_input_t( const activity_meta_t & meta , const std::vector<raw_field_t> & fields )
    : meta(meta) , fields(fields) { } 
  activity_meta_t meta;
  std::vector<raw_field_t> fields;
};


struct analysis_t
{
  activity_summary_t summary;
  dashboard_t dashboard;
};


struct activity_status_t
{
  activity_status_t() : ok( false ) { } 
  std::string id;
  bool ok;
  // skipped: why
  std::string reason;
};


struct batch_t
{
  // parallel to the inputs; results[i] is only meaningful if status[i].ok
  std::vector<activity_status_t> status;
  std::vector<analysis_t> results;

  int succeeded() const;
  int skipped() const;

  // summaries of the succeeded activities, in input order
  std::vector<activity_summary_t> summaries() const;
};


namespace pipeline
{
  
  // align -> zones & segments -> summary -> dashboard
  analysis_t analyze( const activity_input_t & input ,
		      const zone_set_t & zones ,
		      const analysis_param_t & par );

  // a velo_error skips that activity only; anything else is rethrown
  // once all workers are done
  batch_t batch( const std::vector<activity_input_t> & inputs ,
		 const zone_set_t & zones ,
		 const analysis_param_t & par ,
		 int nthreads = 1 );

}

#endif
