
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
#include <stdexcept>

#include "velo.h"

TEST( Intervals , RunsOfTrue )
{
  std::vector<bool> m = { false , true , true , false , true , false , false , true };
  std::vector<interval_t> r = interval_t::runs( m );
  ASSERT_EQ( r.size() , 3u );
  EXPECT_EQ( r[0] , interval_t( 1 , 2 ) );
  EXPECT_EQ( r[1] , interval_t( 4 , 4 ) );
  EXPECT_EQ( r[2] , interval_t( 7 , 7 ) );
  EXPECT_EQ( r[0].n() , 2 );
  EXPECT_TRUE( interval_t::runs( std::vector<bool>( 5 , false ) ).empty() );
}

TEST( Intervals , OverlapAndExtend )
{
  interval_t a( 10 , 20 ) , b( 20 , 30 ) , c( 21 , 25 );
  EXPECT_TRUE( a.overlaps( b ) );
  EXPECT_FALSE( a.overlaps( c ) );
  a.extend( c );
  EXPECT_EQ( a , interval_t( 10 , 25 ) );
  EXPECT_TRUE( interval_t().empty() );
}

TEST( MovingAverage , CentredWithShrinkingEdges )
{
  Eigen::VectorXd x( 5 );
  x << 1 , 2 , 3 , 4 , 5;
  std::vector<bool> p( 5 , true ) , sp;
  Eigen::VectorXd a = eigen_ops::moving_average( x , p , 3 , &sp );
  EXPECT_DOUBLE_EQ( a[0] , 1.5 );
  EXPECT_DOUBLE_EQ( a[2] , 3.0 );
  EXPECT_DOUBLE_EQ( a[4] , 4.5 );
  EXPECT_TRUE( sp[0] && sp[4] );
}

TEST( MovingAverage , AbsentPointsDoNotCount )
{
  Eigen::VectorXd x( 7 );
  x << 10 , 0 , 10 , 0 , 0 , 0 , 0;
  std::vector<bool> p = { true , false , true , false , false , false , false };
  std::vector<bool> sp;
  Eigen::VectorXd a = eigen_ops::moving_average( x , p , 3 , &sp );
  // the absent zero is not averaged in
  EXPECT_DOUBLE_EQ( a[1] , 10.0 );
  EXPECT_TRUE( sp[3] );
  // no present neighbour
  EXPECT_FALSE( sp[5] );
}

TEST( MovingAverage , RequiresOddWindow )
{
  Eigen::VectorXd x = Eigen::VectorXd::Zero( 4 );
  std::vector<bool> p( 4 , true ) , sp;
  EXPECT_THROW( eigen_ops::moving_average( x , p , 4 , &sp ) , std::logic_error );
  EXPECT_THROW( eigen_ops::moving_average( x , p , -1 , &sp ) , std::logic_error );
}

TEST( MovingAverage , MaskMustMatchData )
{
  Eigen::VectorXd x = Eigen::VectorXd::Zero( 4 );
  std::vector<bool> p( 3 , true ) , sp;
  EXPECT_THROW( eigen_ops::moving_average( x , p , 3 , &sp ) , std::logic_error );
}

TEST( RollingMean , BestWindow )
{
  Eigen::VectorXd x = eigen_ops::copy_array( { 1 , 5 , 5 , 1 , 1 } );
  Eigen::VectorXd r = eigen_ops::rolling_mean( x , 2 );
  ASSERT_EQ( r.size() , 4 );
  EXPECT_DOUBLE_EQ( r[1] , 5.0 );
  EXPECT_DOUBLE_EQ( eigen_ops::best_mean( x , 2 ) , 5.0 );
  EXPECT_TRUE( std::isnan( eigen_ops::best_mean( x , 6 ) ) );
}

TEST( RunningStats , PooledEqualsSequential )
{
  running_stats_t a , b , all;
  const double x[] = { 3 , 9 , 4 , 7 , 1 , 12 , 6 };
  for (int i=0; i<7; i++)
    {
      all.push( x[i] );
      if ( i < 3 ) a.push( x[i] ); else b.push( x[i] );
    }
  running_stats_t ab = a + b , ba = b + a;
  EXPECT_EQ( ab.num_data_values() , 7 );
  EXPECT_NEAR( ab.mean() , all.mean() , 1e-12 );
  EXPECT_NEAR( ab.variance() , all.variance() , 1e-9 );
  EXPECT_NEAR( ba.variance() , ab.variance() , 1e-9 );
  EXPECT_DOUBLE_EQ( ab.max() , 12 );
  EXPECT_DOUBLE_EQ( ab.min() , 1 );
  EXPECT_EQ( ( a + running_stats_t() ).num_data_values() , 3 );
}

TEST( MiscMath , Median )
{
  EXPECT_DOUBLE_EQ( MiscMath::median( { 5 , 1 , 3 } ) , 3 );
  EXPECT_DOUBLE_EQ( MiscMath::median( { 4 , 1 , 3 , 2 } ) , 2.5 );
  EXPECT_THROW( MiscMath::median( std::vector<double>() ) , velo_error );
}

TEST( MiscMath , AscentSkipsAbsentPoints )
{
  std::vector<double> alt = { 100 , 105 , 0 , 103 , 110 };
  std::vector<bool> p = { true , true , false , true , true };
  EXPECT_DOUBLE_EQ( MiscMath::ascent( alt , p , 0 , 4 ) , 12 );
  EXPECT_DOUBLE_EQ( MiscMath::descent( alt , p , 0 , 4 ) , 2 );
}

TEST( MiscMath , Histogram )
{
  std::vector<double> x = { 0.5 , 1.2 , 1.9 , 7 };
  std::map<double,int> h = MiscMath::histogram( x , std::vector<bool>( 4 , true ) , 1 );
  EXPECT_EQ( h[ 0 ] , 1 );
  EXPECT_EQ( h[ 1 ] , 2 );
  EXPECT_EQ( h[ 7 ] , 1 );
}
