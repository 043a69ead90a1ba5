
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


#include "stats/eigen_ops.h"

#include <limits>
#include <stdexcept>


Eigen::VectorXd eigen_ops::moving_average( const Eigen::VectorXd & x ,
					   const std::vector<bool> & present ,
					   int s ,
					   std::vector<bool> * smoothed_present )
{

  const int n = x.size();

  // callers validate these: a violation is a programming error, not bad data
  if ( (int)present.size() != n ) 
    throw std::logic_error( "mask/data size mismatch in moving_average()" );
  
  if ( s < 1 || s % 2 == 0 )
    throw std::logic_error( "require an odd-number for moving average" );
  
  smoothed_present->assign( n , false );

  Eigen::VectorXd a = Eigen::VectorXd::Zero( n ) ;

  if ( n == 0 ) return a;
  
  // move this many forward/backward
  const int edge = (s-1)/2;  

  // running sum and count of present points in [i-edge, i+edge]
  double z = 0;
  int cnt = 0;

  // accumulate first window (right half only, as left is off the edge)
  for (int j=0; j<=edge && j<n; j++)
    if ( present[j] ) { z += x[j]; ++cnt; }

  for (int i=0; i<n; i++)
    {

      if ( cnt > 0 )
	{
	  a[i] = z / (double)cnt;
	  (*smoothed_present)[i] = true;
	}
      
      // slide: drop left-most, add next right-most
      const int drop = i - edge;
      const int add  = i + edge + 1;
      
      if ( drop >= 0 && present[drop] ) { z -= x[drop]; --cnt; }
      if ( add < n && present[add] ) { z += x[add]; ++cnt; }

      // avoid drift from repeated add/subtract
      if ( cnt == 0 ) z = 0;
    }
  
  return a;
  
}


Eigen::VectorXd eigen_ops::rolling_mean( const Eigen::VectorXd & x , int w )
{
  const int n = x.size();
  if ( w < 1 || w > n ) return Eigen::VectorXd( 0 );

  Eigen::VectorXd r( n - w + 1 );

  double z = x.head( w ).sum();
  r[0] = z / (double)w;
  
  for (int i=w; i<n; i++)
    {
      z += x[i] - x[i-w];
      r[i-w+1] = z / (double)w;
    }
  
  return r;
}


double eigen_ops::best_mean( const Eigen::VectorXd & x , int w )
{
  Eigen::VectorXd r = rolling_mean( x , w );
  if ( r.size() == 0 ) return std::numeric_limits<double>::quiet_NaN();
  return r.maxCoeff();
}


std::vector<double> eigen_ops::copy_vector( const Eigen::VectorXd & e )
{
  std::vector<double> v( e.size() );
  for (int i=0; i<e.size(); i++) v[i] = e[i];
  return v;
}

Eigen::VectorXd eigen_ops::copy_array( const std::vector<double> & e )
{
  Eigen::VectorXd v( e.size() );
  for (int i=0; i<e.size(); i++) v[i] = e[i];
  return v;
}
