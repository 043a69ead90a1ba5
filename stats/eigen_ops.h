
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


#ifndef __VELO_EIGEN_OPS_H__
#define __VELO_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <vector>

namespace eigen_ops { 

  // centred moving average over a window of 's' (odd) points; only
  // present points contribute, and the window shrinks at either end;
  // a point with no present neighbours stays absent
  Eigen::VectorXd moving_average( const Eigen::VectorXd & x ,
				  const std::vector<bool> & present ,
				  int s ,
				  std::vector<bool> * smoothed_present );

  // trailing-window means (i.e. only full windows: n - w + 1 values)
  Eigen::VectorXd rolling_mean( const Eigen::VectorXd & x , int w );

  // maximum of the above (NaN if the window is longer than x)
  double best_mean( const Eigen::VectorXd & x , int w );
  
  std::vector<double> copy_vector( const Eigen::VectorXd & e );

  Eigen::VectorXd copy_array( const std::vector<double> & e );
  
}

#endif 
