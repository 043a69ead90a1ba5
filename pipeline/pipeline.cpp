
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


#include "pipeline/pipeline.h"

#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include <thread>
#include <atomic>
#include <mutex>
#include <exception>
#include <sstream>

extern logger_t logger;


analysis_param_t::analysis_param_t( const param_t & param )
  : align( param ) , detector( param ) , summary( param ) , dashboard( param )
{
}


int batch_t::succeeded() const
{
  int c = 0;
  for (int i=0; i<(int)status.size(); i++)
    if ( status[i].ok ) ++c;
  return c;
}

int batch_t::skipped() const
{
  return status.size() - succeeded();
}

std::vector<activity_summary_t> batch_t::summaries() const
{
  std::vector<activity_summary_t> r;
  for (int i=0; i<(int)status.size(); i++)
    if ( status[i].ok ) r.push_back( results[i].summary );
  return r;
}


analysis_t pipeline::analyze( const activity_input_t & input ,
			      const zone_set_t & zones ,
			      const analysis_param_t & par )
{

  stream_aligner_t aligner( par.align );
  
  const activity_stream_t stream = aligner.align( input.meta , input.fields );

  std::stringstream ss;
  ss << "  " << input.meta.id << ": " << stream.size() << " samples over "
     << Helper::timestring( stream.span() ) << "\n";
  logger << ss.str();

  const zone_distribution_t hr_zones = zones::distribution( stream , M_HR , zones );
  const zone_distribution_t power_zones = zones::distribution( stream , M_POWER , zones );

  segment_detector_t detector( par.detector );
  const std::vector<segment_t> segments = detector.detect( stream );

  analysis_t r;
  r.summary = metrics::summarize( stream , hr_zones , power_zones , segments , par.summary );
  r.dashboard = dashboard::assemble( r.summary , stream , par.dashboard );
  return r;
}


batch_t pipeline::batch( const std::vector<activity_input_t> & inputs ,
			 const zone_set_t & zones ,
			 const analysis_param_t & par ,
			 int nthreads )
{

  // bad zone definitions fail the whole batch, before anything runs
  zones.validate();
  
  const int n = inputs.size();

  batch_t b;
  b.status.resize( n );
  b.results.resize( n );

  if ( nthreads < 1 ) nthreads = 1;
  if ( nthreads > n ) nthreads = n;

  logger << " processing " + Helper::int2str( n ) + " activities"
    + ( nthreads > 1 ? " on " + Helper::int2str( nthreads ) + " threads" : "" ) + "\n";
  
  std::atomic<int> next( 0 );

  std::mutex failure_lock;
  std::exception_ptr failure;
  
  // each worker owns whichever slots it pulls, so no locking on b
  auto worker = [&]()
    {
      while ( true )
	{
	  const int i = next++;
	  if ( i >= n ) return;

	  {
	    std::lock_guard<std::mutex> lock( failure_lock );
	    if ( failure ) return;
	  }
	  
	  activity_status_t & status = b.status[i];
	  status.id = inputs[i].meta.id;

	  try
	    {
	      b.results[i] = analyze( inputs[i] , zones , par );
	      status.ok = true;
	    }
	  catch ( const velo_error & e )
	    {
	      status.ok = false;
	      status.reason = e.what();
	      logger.warning( "skipping " + status.id + ": " + status.reason );
	    }
	  catch ( ... )
	    {
	      std::lock_guard<std::mutex> lock( failure_lock );
	      if ( ! failure ) failure = std::current_exception();
	      return;
	    }
	}
    };

  if ( nthreads == 1 )
    worker();
  else
    {
      std::vector<std::thread> pool;
      for (int t=0; t<nthreads; t++)
	pool.push_back( std::thread( worker ) );
      for (int t=0; t<nthreads; t++)
	pool[t].join();
    }

  if ( failure ) std::rethrow_exception( failure );

  logger << " " + Helper::int2str( b.succeeded() ) + " succeeded, "
    + Helper::int2str( b.skipped() ) + " skipped\n";
  
  return b;
}
