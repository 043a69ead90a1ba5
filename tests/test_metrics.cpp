
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

#include <cmath>

#include "velo.h"
#include "tests/synthetic.h"

static activity_summary_t summarize( const activity_input_t & in , const zone_set_t & zs = zone_set_t::defaults( 190 , 250 ) )
{
  activity_stream_t s = synthetic::align( in );
  segment_detector_t detector( ( detector_param_t() ) );
  return metrics::summarize( s ,
			     zones::distribution( s , M_HR , zs ) ,
			     zones::distribution( s , M_POWER , zs ) ,
			     detector.detect( s ) ,
			     summary_param_t() );
}

TEST( Summary , KinematicTotals )
{
  activity_summary_t s = summarize( synthetic::climb_ride() );
  EXPECT_EQ( s.n , 600 );
  EXPECT_DOUBLE_EQ( s.elapsed , 600 );
  EXPECT_DOUBLE_EQ( s.moving_time , 600 );
  ASSERT_TRUE( s.has_distance );
  EXPECT_DOUBLE_EQ( s.distance , 599 * 8 );
  ASSERT_TRUE( s.has_altitude );
  // 121 samples at 8% and 8 m per sample
  EXPECT_NEAR( s.elev_gain , 121 * 0.64 , 1e-6 );
  EXPECT_NEAR( s.elev_loss , 0 , 1e-9 );
  EXPECT_NEAR( s.alt_max - s.alt_min , s.elev_gain , 1e-6 );
  EXPECT_DOUBLE_EQ( s.avg_speed , 8 );
  EXPECT_DOUBLE_EQ( s.avg_hr , 130 );
  EXPECT_DOUBLE_EQ( s.avg_cadence , 85 );
  EXPECT_FALSE( s.has_power );
  EXPECT_FALSE( s.has_np );
  EXPECT_EQ( s.n_segments( CLIMB ) , 1 );
  EXPECT_TRUE( s.hr_zones.available );
  EXPECT_FALSE( s.power_zones.available );
  ASSERT_TRUE( s.has_load );
  EXPECT_NEAR( s.load , 600 / 3600.0 * 130 , 1e-9 );
}

TEST( Summary , MovingTimeSkipsStops )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 100 );
  f[ "velocity_smooth" ] = synthetic::block( synthetic::constant( 100 , 6 ) , 40 , 69 , 0.2 );
  activity_stream_t s = synthetic::align( synthetic::input( "stop" , f ) );
  EXPECT_DOUBLE_EQ( metrics::moving_time( s , 0.5 ) , 70 );
  double d;
  ASSERT_TRUE( metrics::distance( s , &d ) );
  EXPECT_NEAR( d , 70 * 6 + 30 * 0.2 , 1e-9 );
}

TEST( Summary , MovingTimeFromDistance )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 61 );
  std::vector<double> d( 61 );
  for (int i=0; i<61; i++) d[i] = i < 30 ? i * 5 : 150;
  f[ "distance" ] = d;
  activity_stream_t s = synthetic::align( synthetic::input( "dist" , f ) );
  EXPECT_DOUBLE_EQ( metrics::moving_time( s , 0.5 ) , 30 );
}

TEST( Summary , MovingFlagTakesPrecedenceOverSpeed )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 100 );
  // speed says moving throughout; the device paused for 25 s
  f[ "velocity_smooth" ] = synthetic::constant( 100 , 6 );
  f[ "moving" ] = synthetic::block( synthetic::constant( 100 , 1 ) , 50 , 74 , 0 );
  activity_stream_t s = synthetic::align( synthetic::input( "paused" , f ) );
  EXPECT_DOUBLE_EQ( metrics::moving_time( s , 0.5 ) , 75 );
  EXPECT_DOUBLE_EQ( summarize( synthetic::input( "paused" , f ) ).moving_time , 75 );
}

TEST( Summary , CoastingZerosLeftOutOfPower )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 100 );
  f[ "watts" ] = synthetic::block( synthetic::constant( 100 , 200 ) , 50 , 99 , 0 );
  activity_summary_t s = summarize( synthetic::input( "coast" , f ) );
  ASSERT_TRUE( s.has_power );
  EXPECT_DOUBLE_EQ( s.avg_power , 200 );
  EXPECT_DOUBLE_EQ( s.max_power , 200 );
  ASSERT_TRUE( s.has_np );
  EXPECT_NEAR( s.np , 200 , 1e-9 );
  EXPECT_NEAR( s.power_curve[ 30 ] , 200 , 1e-9 );
  EXPECT_EQ( s.power_curve.count( 60 ) , 0u );

  // all zeros: nothing to report
  f[ "watts" ] = synthetic::constant( 100 , 0 );
  activity_summary_t z = summarize( synthetic::input( "zero" , f ) );
  EXPECT_FALSE( z.has_power );
  EXPECT_FALSE( z.has_np );
  EXPECT_TRUE( z.power_curve.empty() );
}

TEST( Summary , NormalizedPowerOfSteadyRideIsItsAverage )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 120 );
  f[ "watts" ] = synthetic::constant( 120 , 210 );
  activity_stream_t s = synthetic::align( synthetic::input( "steady" , f ) );
  double np;
  ASSERT_TRUE( metrics::normalized_power( s , 30 , &np ) );
  EXPECT_NEAR( np , 210 , 1e-9 );
}

TEST( Summary , NormalizedPowerRewardsVariability )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 600 );
  std::vector<double> w( 600 );
  for (int i=0; i<600; i++) w[i] = ( i / 60 ) % 2 ? 350 : 50;
  f[ "watts" ] = w;
  activity_stream_t s = synthetic::align( synthetic::input( "variable" , f ) );
  double np;
  ASSERT_TRUE( metrics::normalized_power( s , 30 , &np ) );
  EXPECT_GT( np , 200 );
}

TEST( Summary , NormalizedPowerNeedsAFullWindow )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 40 );
  std::vector<double> w = synthetic::constant( 40 , 200 );
  f[ "watts" ] = w;
  activity_input_t in = synthetic::input( "np" , f );
  // only 20 power readings
  in.fields[ 1 ].values.resize( 20 );
  activity_stream_t s = synthetic::align( in );
  double np = 0;
  EXPECT_FALSE( metrics::normalized_power( s , 30 , &np ) );
}

TEST( Summary , FtpAndPowerCurve )
{
  const int n = 1800;
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( n );
  std::vector<double> w = synthetic::block( synthetic::constant( n , 150 ) , 300 , 1499 , 280 );
  w = synthetic::block( w , 1600 , 1604 , 900 );
  f[ "watts" ] = w;
  activity_stream_t s = synthetic::align( synthetic::input( "ftp" , f ) );

  double ftp;
  ASSERT_TRUE( metrics::ftp_estimate( s , &ftp ) );
  EXPECT_NEAR( ftp , 0.95 * 280 , 1e-6 );

  std::vector<int> d = { 5 , 60 , 1200 , 3600 };
  std::map<int,double> curve = metrics::power_curve( s , d );
  EXPECT_NEAR( curve[ 5 ] , 900 , 1e-9 );
  EXPECT_NEAR( curve[ 60 ] , 280 , 1e-9 );
  EXPECT_NEAR( curve[ 1200 ] , 280 , 1e-9 );
  // longer than the ride
  EXPECT_EQ( curve.count( 3600 ) , 0u );
}

TEST( Summary , ParameterValidation )
{
  param_t param;
  param.parse( "curve=5,-10" );
  EXPECT_THROW( summary_param_t p( param ) , invalid_param_error );
  param_t np;
  np.parse( "np-window=0" );
  EXPECT_THROW( summary_param_t p( np ) , invalid_param_error );
}


//
// rollups
//

static std::vector<activity_summary_t> three_rides()
{
  std::vector<activity_summary_t> s;
  s.push_back( summarize( synthetic::climb_ride( "A" ) ) );
  s.push_back( summarize( synthetic::interval_ride( 3 , "B" ) ) );
  s.push_back( summarize( synthetic::interval_ride( 10 , "C" ) ) );
  s[0].meta.start = 1700000000;
  s[1].meta.start = 1700090000;
  s[2].meta.start = 1700700000;
  return s;
}

static void expect_same( const rollup_t & a , const rollup_t & b )
{
  EXPECT_EQ( a.n , b.n );
  EXPECT_EQ( a.ids , b.ids );
  EXPECT_EQ( a.first , b.first );
  EXPECT_EQ( a.last , b.last );
  EXPECT_NEAR( a.distance , b.distance , 1e-6 );
  EXPECT_NEAR( a.moving_time , b.moving_time , 1e-6 );
  EXPECT_NEAR( a.elev_gain , b.elev_gain , 1e-6 );
  EXPECT_NEAR( a.load , b.load , 1e-6 );
  EXPECT_NEAR( a.avg_hr() , b.avg_hr() , 1e-9 );
  EXPECT_EQ( a.n_climb , b.n_climb );
  EXPECT_EQ( a.n_effort , b.n_effort );
  EXPECT_EQ( a.max_power , b.max_power );
  ASSERT_EQ( a.hr_zones.secs.size() , b.hr_zones.secs.size() );
  for (int i=0; i<(int)a.hr_zones.secs.size(); i++)
    EXPECT_NEAR( a.hr_zones.pct[i] , b.hr_zones.pct[i] , 1e-9 );
  EXPECT_NEAR( a.power_zones.total() , b.power_zones.total() , 1e-9 );
}

TEST( Rollup , FoldOrderDoesNotMatter )
{
  std::vector<activity_summary_t> abc = three_rides();
  std::vector<activity_summary_t> cab = { abc[2] , abc[0] , abc[1] };
  rollup_t r1 = rollup::fold( abc ) , r2 = rollup::fold( cab );
  expect_same( r1 , r2 );
  EXPECT_EQ( r1.n , 3 );
  EXPECT_NEAR( r1.distance , abc[0].distance + abc[1].distance + abc[2].distance , 1e-6 );
  EXPECT_TRUE( r1.power_zones.available );
}

TEST( Rollup , CombinationIsAssociative )
{
  std::vector<activity_summary_t> s = three_rides();
  rollup_t a( s[0] ) , b( s[1] ) , c( s[2] );
  expect_same( ( a + b ) + c , a + ( b + c ) );
  expect_same( a + b , b + a );
  expect_same( a + rollup_t() , a );
}

TEST( Rollup , TimeWeightedHeartRate )
{
  std::vector<activity_summary_t> s = three_rides();
  rollup_t r = rollup::fold( s );
  double w = 0 , t = 0;
  for (int i=0; i<3; i++) { w += s[i].avg_hr * s[i].hr_secs; t += s[i].hr_secs; }
  EXPECT_NEAR( r.avg_hr() , w / t , 1e-9 );
}

TEST( Rollup , MergedZonesRecomputed )
{
  rollup_t r = rollup::fold( three_rides() );
  EXPECT_TRUE( r.hr_zones.available );
  EXPECT_NEAR( MiscMath::sum( r.hr_zones.pct ) , 100.0 , 0.01 );
  EXPECT_NEAR( r.hr_zones.total() , 1800 , 1e-9 );
}

TEST( Rollup , WindowAndWeeks )
{
  std::vector<activity_summary_t> s = three_rides();
  EXPECT_EQ( rollup::window( s , 1700000000 , 1700090000 ).n , 1 );
  EXPECT_EQ( rollup::window( s , 1700000000 , 1700090001 ).n , 2 );

  std::map<int64_t,rollup_t> w = rollup::weekly( s );
  ASSERT_EQ( w.size() , 2u );
  // 2023-11-13 was a Monday
  EXPECT_EQ( w.begin()->first , 1699833600 );
  EXPECT_EQ( rollup::date( w.begin()->first ) , "2023-11-13" );
  EXPECT_EQ( w.begin()->second.n , 2 );
}

TEST( Rollup , WeekStartsOnMonday )
{
  // Thursday 1970-01-01 belongs to the week of Monday 1969-12-29
  EXPECT_EQ( rollup::week_start( 0 ) , -259200 );
  EXPECT_EQ( rollup::week_start( 345600 ) , 345600 );
  EXPECT_EQ( rollup::week_start( 345599 ) , -259200 );
  EXPECT_EQ( rollup::day_start( 86399 ) , 0 );
}

TEST( Rollup , DailyLoadWithRollingMean )
{
  std::vector<activity_summary_t> s = three_rides();
  std::vector<load_day_t> d = rollup::daily_load( s );
  // 2023-11-14 to 2023-11-23 inclusive
  ASSERT_EQ( d.size() , 10u );
  EXPECT_NEAR( d[0].load , s[0].load , 1e-9 );
  EXPECT_NEAR( d[1].load , s[1].load , 1e-9 );
  EXPECT_DOUBLE_EQ( d[2].load , 0 );
  EXPECT_FALSE( d[5].has_mean7 );
  ASSERT_TRUE( d[6].has_mean7 );
  EXPECT_NEAR( d[6].mean7 , ( s[0].load + s[1].load ) / 7.0 , 1e-9 );
  EXPECT_NEAR( d[9].mean7 , s[2].load / 7.0 , 1e-9 );
}

TEST( Rollup , FilterByType )
{
  std::vector<activity_summary_t> s = three_rides();
  s[1].meta.type = "Run";
  EXPECT_EQ( rollup::of_type( s , "ride" ).size() , 2u );
}
