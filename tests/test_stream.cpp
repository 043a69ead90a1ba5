
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

#include "velo.h"
#include "tests/synthetic.h"

TEST( Aligner , IndexAlignsFieldsWithTime )
{
  activity_stream_t s = synthetic::align( synthetic::climb_ride() );
  EXPECT_EQ( s.size() , 600 );
  EXPECT_DOUBLE_EQ( s.interval , 1.0 );
  EXPECT_DOUBLE_EQ( s.span() , 599.0 );
  EXPECT_TRUE( s[ F_HR ].all() );
  EXPECT_TRUE( s[ F_GRADE ].all() );
  EXPECT_FALSE( s.has( F_POWER ) );
  EXPECT_FALSE( s.derived_grade );
  EXPECT_DOUBLE_EQ( s[ F_HR ].x[ 10 ] , 130 );
}

TEST( Aligner , ShortFieldIsAbsentNotZero )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 100 );
  f[ "heartrate" ] = synthetic::constant( 60 , 120 );
  f[ "watts" ] = synthetic::constant( 100 , 0 );
  activity_stream_t s = synthetic::align( synthetic::input( "short" , f ) );

  EXPECT_EQ( s[ F_HR ].count() , 60 );
  EXPECT_TRUE( s[ F_HR ].p[ 59 ] );
  EXPECT_FALSE( s[ F_HR ].p[ 60 ] );

  // zero readings are still readings
  EXPECT_TRUE( s[ F_POWER ].all() );
  EXPECT_DOUBLE_EQ( s[ F_POWER ].x[ 50 ] , 0 );
}

TEST( Aligner , TooShortThrows )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 20 );
  f[ "heartrate" ] = synthetic::constant( 20 , 120 );
  try
    {
      synthetic::align( synthetic::input( "tiny" , f ) );
      FAIL() << "expected insufficient_data_error";
    }
  catch ( const insufficient_data_error & e )
    {
      EXPECT_EQ( e.n , 20 );
      EXPECT_EQ( e.required , 30 );
    }
}

TEST( Aligner , NonIncreasingTimeThrows )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 50 );
  f[ "time" ][ 20 ] = 19;
  f[ "heartrate" ] = synthetic::constant( 50 , 120 );
  EXPECT_THROW( synthetic::align( synthetic::input( "bad" , f ) ) , invalid_stream_error );
}

TEST( Aligner , OwnTimeBasisUsesZeroOrderHold )
{
  activity_input_t in;
  in.meta = activity_meta_t( "zoh" , 0 );
  in.fields.push_back( raw_field_t( "time" , synthetic::seconds( 60 ) ) );
  
  // heart rate every 2 s from t=10 to t=40
  std::vector<double> t , hr;
  for (int i=10; i<=40; i+=2) { t.push_back( i ); hr.push_back( 100 + i ); }
  in.fields.push_back( raw_field_t( "heartrate" , hr , t ) );

  activity_stream_t s = synthetic::align( in );
  ASSERT_EQ( s.size() , 60 );
  EXPECT_FALSE( s[ F_HR ].p[ 9 ] );
  EXPECT_DOUBLE_EQ( s[ F_HR ].x[ 10 ] , 110 );
  EXPECT_DOUBLE_EQ( s[ F_HR ].x[ 11 ] , 110 );
  EXPECT_DOUBLE_EQ( s[ F_HR ].x[ 12 ] , 112 );
  EXPECT_TRUE( s[ F_HR ].p[ 40 ] );
  // past the native range
  EXPECT_FALSE( s[ F_HR ].p[ 41 ] );
}

TEST( Aligner , HoldToleranceLeavesGapsAbsent )
{
  activity_input_t in;
  in.meta = activity_meta_t( "gap" , 0 );
  in.fields.push_back( raw_field_t( "time" , synthetic::seconds( 40 ) ) );
  std::vector<double> t = { 0 , 1 , 2 , 3 , 20 , 21 , 22 , 39 };
  in.fields.push_back( raw_field_t( "watts" , std::vector<double>( t.size() , 200 ) , t ) );

  param_t param;
  param.parse( "hold=2" );
  activity_stream_t s = synthetic::align( in , align_param_t( param ) );
  EXPECT_TRUE( s[ F_POWER ].p[ 5 ] );
  EXPECT_FALSE( s[ F_POWER ].p[ 6 ] );
  EXPECT_TRUE( s[ F_POWER ].p[ 20 ] );
}

TEST( Aligner , UnionAxis )
{
  activity_input_t in;
  in.meta = activity_meta_t( "union" , 0 );
  in.fields.push_back( raw_field_t( "heartrate" , synthetic::constant( 30 , 120 ) , synthetic::seconds( 30 , 2.0 ) ) );
  std::vector<double> t2 = synthetic::seconds( 30 , 2.0 );
  for (int i=0; i<30; i++) t2[i] += 1;
  in.fields.push_back( raw_field_t( "cadence" , synthetic::constant( 30 , 90 ) , t2 ) );

  param_t param;
  param.parse( "axis=union" );
  activity_stream_t s = synthetic::align( in , align_param_t( param ) );
  EXPECT_EQ( s.size() , 60 );
  EXPECT_DOUBLE_EQ( s.interval , 1.0 );
  // cadence starts at t=1
  EXPECT_FALSE( s[ F_CADENCE ].p[ 0 ] );
  EXPECT_TRUE( s[ F_CADENCE ].p[ 1 ] );
}

TEST( Aligner , DensestAxis )
{
  activity_input_t in;
  in.meta = activity_meta_t( "densest" , 0 );
  // the sparser field comes first
  in.fields.push_back( raw_field_t( "cadence" , synthetic::constant( 30 , 90 ) , synthetic::seconds( 30 , 2.0 ) ) );
  in.fields.push_back( raw_field_t( "heartrate" , synthetic::constant( 60 , 120 ) , synthetic::seconds( 60 ) ) );

  param_t param;
  param.parse( "axis=densest" );
  activity_stream_t s = synthetic::align( in , align_param_t( param ) );
  ASSERT_EQ( s.size() , 60 );
  EXPECT_DOUBLE_EQ( s.interval , 1.0 );
  EXPECT_DOUBLE_EQ( s.tp.back() , 59 );
  EXPECT_TRUE( s[ F_HR ].all() );
  // held from t=0
  EXPECT_TRUE( s[ F_CADENCE ].p[ 1 ] );
  EXPECT_DOUBLE_EQ( s[ F_CADENCE ].x[ 1 ] , 90 );
  // past the last cadence point at t=58
  EXPECT_FALSE( s[ F_CADENCE ].p[ 59 ] );
}

TEST( Aligner , LatLngPairsAndUnknownFields )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 40 );
  f[ "mystery" ] = synthetic::constant( 40 , 1 );
  activity_input_t in = synthetic::input( "gps" , f );
  std::vector<std::pair<double,double> > ll;
  for (int i=0; i<40; i++) ll.push_back( std::make_pair( 51.5 + i * 1e-4 , -0.1 ) );
  in.fields.push_back( raw_field_t::latlng( ll ) );

  activity_stream_t s = synthetic::align( in );
  EXPECT_TRUE( s[ F_LAT ].all() );
  EXPECT_TRUE( s[ F_LNG ].all() );
  EXPECT_DOUBLE_EQ( s[ F_LNG ].x[ 3 ] , -0.1 );
}

TEST( Aligner , DerivesGradeFromAltitudeAndDistance )
{
  std::map<std::string,std::vector<double> > f;
  f[ "time" ] = synthetic::seconds( 50 );
  f[ "distance" ] = synthetic::distance( 50 , 10 );
  std::vector<double> alt( 50 );
  for (int i=0; i<50; i++) alt[i] = 200 + 0.5 * i;
  f[ "altitude" ] = alt;
  activity_stream_t s = synthetic::align( synthetic::input( "grade" , f ) );
  EXPECT_TRUE( s.derived_grade );
  EXPECT_FALSE( s[ F_GRADE ].p[ 0 ] );
  EXPECT_NEAR( s[ F_GRADE ].x[ 10 ] , 5.0 , 1e-9 );
}

TEST( Aligner , BadAxisOption )
{
  param_t param;
  param.parse( "axis=sideways" );
  EXPECT_THROW( align_param_t a( param ) , invalid_param_error );
}
