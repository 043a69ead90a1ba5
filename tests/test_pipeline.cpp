
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


#include <gtest/gtest.h>

#include <stdexcept>
#include <mutex>

#include "velo.h"
#include "tests/synthetic.h"

static std::vector<activity_input_t> mixed_batch()
{
  std::vector<activity_input_t> in;
  in.push_back( synthetic::climb_ride( "good-1" ) );

  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 10 );
  f[ "heartrate" ] = synthetic::constant( 10 , 120 );
  in.push_back( synthetic::input( "too-short" , f ) );

  in.push_back( synthetic::interval_ride( 3 , "good-2" ) );

  f[ "time" ] = synthetic::seconds( 50 );
  f[ "time" ][ 5 ] = 2;
  f[ "heartrate" ] = synthetic::constant( 50 , 120 );
  in.push_back( synthetic::input( "bad-time" , f ) );
  return in;
}

TEST( Pipeline , AnalyzeOneActivity )
{
  analysis_t a = pipeline::analyze( synthetic::climb_ride() , zone_set_t::defaults( 190 , 250 ) , analysis_param_t() );
  EXPECT_EQ( a.summary.meta.id , "climb" );
  EXPECT_EQ( a.summary.n_segments( CLIMB ) , 1 );
  EXPECT_EQ( a.dashboard.meta.id , "climb" );
}

TEST( Pipeline , ConfigurationFromParameters )
{
  param_t param( std::vector<std::string>{ "min-dur=200" , "smooth=3" , "max-points=50" , "min-samples=10" } );
  analysis_param_t par( param );
  EXPECT_EQ( par.align.min_samples , 10 );
  EXPECT_EQ( par.detector.smooth , 3 );
  EXPECT_EQ( par.dashboard.max_points , 50 );
  // the climb is too short now
  analysis_t a = pipeline::analyze( synthetic::climb_ride() , zone_set_t::defaults( 190 , 250 ) , par );
  EXPECT_TRUE( a.summary.segments.empty() );
}

TEST( Pipeline , BatchSkipsBadActivities )
{
  std::vector<activity_input_t> in = mixed_batch();
  batch_t b = pipeline::batch( in , zone_set_t::defaults( 190 , 250 ) , analysis_param_t() );
  ASSERT_EQ( b.status.size() , 4u );
  EXPECT_EQ( b.succeeded() , 2 );
  EXPECT_EQ( b.skipped() , 2 );
  EXPECT_TRUE( b.status[0].ok );
  EXPECT_FALSE( b.status[1].ok );
  EXPECT_EQ( b.status[1].id , "too-short" );
  EXPECT_NE( b.status[1].reason.find( "samples" ) , std::string::npos );
  EXPECT_TRUE( b.status[2].ok );
  EXPECT_FALSE( b.status[3].ok );
  EXPECT_EQ( b.summaries().size() , 2u );
}

TEST( Pipeline , ThreadedBatchMatchesSerial )
{
  std::vector<activity_input_t> in = mixed_batch();
  for (int i=0; i<8; i++)
    in.push_back( synthetic::interval_ride( 3 + i , "extra-" + Helper::int2str( i ) ) );

  const zone_set_t zs = zone_set_t::defaults( 190 , 250 );
  batch_t serial = pipeline::batch( in , zs , analysis_param_t() , 1 );
  batch_t threaded = pipeline::batch( in , zs , analysis_param_t() , 4 );
  
  ASSERT_EQ( serial.status.size() , threaded.status.size() );
  for (int i=0; i<(int)in.size(); i++)
    {
      EXPECT_EQ( serial.status[i].ok , threaded.status[i].ok );
      if ( ! serial.status[i].ok ) continue;
      const activity_summary_t & a = serial.results[i].summary;
      const activity_summary_t & b = threaded.results[i].summary;
      EXPECT_EQ( a.meta.id , b.meta.id );
      ASSERT_EQ( a.segments.size() , b.segments.size() );
      for (int j=0; j<(int)a.segments.size(); j++)
	EXPECT_EQ( a.segments[j].tp , b.segments[j].tp );
      EXPECT_DOUBLE_EQ( a.distance , b.distance );
    }
}

static std::mutex captured_lock;
static std::vector<std::string> captured;

static void capture( const std::string & msg )
{
  std::lock_guard<std::mutex> lock( captured_lock );
  captured.push_back( msg );
}

TEST( Pipeline , ThreadedBatchLogsWholeLines )
{
  std::vector<activity_input_t> in = mixed_batch();
  for (int i=0; i<12; i++)
    in.push_back( synthetic::interval_ride( 3 + i , "extra-" + Helper::int2str( i ) ) );

  captured.clear();
  const bool silent = globals::silent;
  const bool verbose = globals::verbose;
  globals::silent = true;
  globals::verbose = true;
  globals::logger_function = capture;

  batch_t b = pipeline::batch( in , zone_set_t::defaults( 190 , 250 ) , analysis_param_t() , 4 );

  globals::logger_function = NULL;
  globals::silent = silent;
  globals::verbose = verbose;

  // each line reaches the logger in one piece
  int lines = 0;
  for (int i=0; i<(int)captured.size(); i++)
    {
      const std::string & m = captured[i];
      if ( m.find( " ** warning: " ) == 0 ) continue;
      ASSERT_FALSE( m.empty() );
      EXPECT_EQ( m.back() , '\n' ) << m;
      if ( m.find( " samples over " ) != std::string::npos )
	{
	  EXPECT_EQ( m.find( "  " ) , 0u ) << m;
	  ++lines;
	}
    }
  EXPECT_EQ( lines , b.succeeded() );
}

TEST( Pipeline , RollupOfBatchIsOrderIndependent )
{
  std::vector<activity_input_t> in = mixed_batch();
  batch_t b = pipeline::batch( in , zone_set_t::defaults( 190 , 250 ) , analysis_param_t() , 2 );
  std::vector<activity_summary_t> s = b.summaries();
  std::vector<activity_summary_t> r( s.rbegin() , s.rend() );
  EXPECT_NEAR( rollup::fold( s ).distance , rollup::fold( r ).distance , 1e-6 );
  EXPECT_EQ( rollup::fold( s ).n , 2 );
}

TEST( Pipeline , EmptyBatch )
{
  batch_t b = pipeline::batch( std::vector<activity_input_t>() , zone_set_t() , analysis_param_t() , 4 );
  EXPECT_EQ( b.succeeded() , 0 );
}

TEST( Pipeline , HeartRateOnlyRideHasNoPowerZones )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 300 );
  f[ "heartrate" ] = synthetic::constant( 300 , 150 );
  analysis_t a = pipeline::analyze( synthetic::input( "hr" , f ) , zone_set_t::defaults( 190 , 250 ) , analysis_param_t() );
  EXPECT_TRUE( a.summary.hr_zones.available );
  EXPECT_FALSE( a.summary.power_zones.available );
  EXPECT_TRUE( a.summary.power_zones.secs.empty() );
  EXPECT_FALSE( a.summary.has_power );
}
