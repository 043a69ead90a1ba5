
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


#ifndef __VELO_DEFS_H__
#define __VELO_DEFS_H__

#include <map>
#include <set>
#include <string>
#include <stdint.h>
#include <vector>


//
// channels carried by an aligned activity stream
//

enum field_t
  {
    F_DISTANCE = 0 ,  // cumulative metres
    F_HR ,            // heart rate, bpm
    F_POWER ,         // watts
    F_CADENCE ,       // rpm
    F_ALTITUDE ,      // metres
    F_LAT ,           // degrees
    F_LNG ,           // degrees
    F_SPEED ,         // m/s
    F_GRADE ,         // percent
    F_TEMP ,          // degrees C
    F_MOVING ,        // device moving flag (0/1)
    F_NONE            // i.e. null marker / number of fields
  };


//
// metrics over which training zones are defined
//

enum metric_t
  {
    M_HR ,
    M_POWER
  };


enum segment_kind_t
  {
    CLIMB ,
    EFFORT
  };


struct globals
{
  
  static std::string version;
  static std::string date;

  // labels

  static std::map<field_t,std::string> field_labels;

  // provider stream names, e.g. 'heartrate', 'watts', 'velocity_smooth'
  static std::map<std::string,field_t> provider_fields;
  
  static std::map<metric_t,std::string> metric_labels;

  static std::map<segment_kind_t,std::string> kind_labels;

  // helper functions to pull out global values
  
  static std::string field( field_t f );

  static field_t field( const std::string & s );
  
  static std::string metric( metric_t m );

  static bool metric( const std::string & s , metric_t * m );

  static field_t metric_field( metric_t m );

  static std::string kind( segment_kind_t k );

  //
  // output
  //
  
  // suppress all console output
  static bool silent;

  // extra step-by-step detail
  static bool verbose;

  // keep a copy of the log (logger_t::print_buffer())
  static bool cache_log;

  // optional redirect of the logger
  static void (*logger_function) ( const std::string & msg );

  // statistic labels used in output tables
  static std::string id_strat;
  static std::string metric_strat;
  static std::string zone_strat;
  static std::string segment_strat;
  static std::string period_strat;
  
};

#endif
