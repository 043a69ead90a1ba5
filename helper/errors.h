
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


#ifndef __VELO_ERRORS_H__
#define __VELO_ERRORS_H__

#include <stdexcept>
#include <string>

//
// all engine errors derive from velo_error; a batch catches these per
// activity and carries on, anything else is a genuine failure
//

struct velo_error : public std::runtime_error
{
  explicit velo_error( const std::string & msg )
    : std::runtime_error( msg ) { }
};

// canonical axis too short to analyse; retrying will not help
struct insufficient_data_error : public velo_error
{
  insufficient_data_error( const std::string & msg , int n , int required )
    : velo_error( msg ) , n(n) , required(required) { }
  int n;
  int required;
};

// malformed raw input (non-monotonic time basis, length mismatch)
struct invalid_stream_error : public velo_error
{
  explicit invalid_stream_error( const std::string & msg )
    : velo_error( msg ) { }
};

// unsorted, overlapping or otherwise unusable zone definitions
struct invalid_zone_config_error : public velo_error
{
  explicit invalid_zone_config_error( const std::string & msg )
    : velo_error( msg ) { }
};

// a computation needs a channel that is entirely absent
struct missing_metric_error : public velo_error
{
  missing_metric_error( const std::string & msg , const std::string & field )
    : velo_error( msg ) , field(field) { }
  std::string field;
};

// bad configuration value (key=value parsing)
struct invalid_param_error : public velo_error
{
  explicit invalid_param_error( const std::string & msg )
    : velo_error( msg ) { }
};

#endif
