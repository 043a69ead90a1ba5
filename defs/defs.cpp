
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


#include "defs/defs.h"
#include "helper/helper.h"

std::string globals::version = "v0.9.2";
std::string globals::date    = "14-Oct-2026";

std::map<field_t,std::string> globals::field_labels =
  {
    { F_DISTANCE , "DIST" } ,
    { F_HR       , "HR" } ,
    { F_POWER    , "POWER" } ,
    { F_CADENCE  , "CAD" } ,
    { F_ALTITUDE , "ALT" } ,
    { F_LAT      , "LAT" } ,
    { F_LNG      , "LNG" } ,
    { F_SPEED    , "SPEED" } ,
    { F_GRADE    , "GRADE" } ,
    { F_TEMP     , "TEMP" } ,
    { F_MOVING   , "MOVING" }
  };

std::map<std::string,field_t> globals::provider_fields =
  {
    { "distance"        , F_DISTANCE } ,
    { "heartrate"       , F_HR } ,
    { "watts"           , F_POWER } ,
    { "cadence"         , F_CADENCE } ,
    { "altitude"        , F_ALTITUDE } ,
    { "lat"             , F_LAT } ,
    { "lng"             , F_LNG } ,
    { "velocity_smooth" , F_SPEED } ,
    { "grade_smooth"    , F_GRADE } ,
    { "temp"            , F_TEMP } ,
    { "moving"          , F_MOVING }
  };

std::map<metric_t,std::string> globals::metric_labels =
  {
    { M_HR    , "HR" } ,
    { M_POWER , "POWER" }
  };

std::map<segment_kind_t,std::string> globals::kind_labels =
  {
    { CLIMB  , "climb" } ,
    { EFFORT , "effort" }
  };

bool globals::silent = false;
bool globals::verbose = false;
bool globals::cache_log = false;
void (*globals::logger_function) ( const std::string & msg ) = NULL;

std::string globals::id_strat      = "ID";
std::string globals::metric_strat  = "METRIC";
std::string globals::zone_strat    = "ZONE";
std::string globals::segment_strat = "SEG";
std::string globals::period_strat  = "PERIOD";


std::string globals::field( field_t f )
{
  std::map<field_t,std::string>::const_iterator ff = field_labels.find( f );
  if ( ff == field_labels.end() ) return "?";
  return ff->second;
}

field_t globals::field( const std::string & s )
{
  // accept either the provider stream name or our own label
  std::map<std::string,field_t>::const_iterator pp = provider_fields.find( s );
  if ( pp != provider_fields.end() ) return pp->second;
  
  std::map<field_t,std::string>::const_iterator ff = field_labels.begin();
  while ( ff != field_labels.end() )
    {
      if ( Helper::iequals( ff->second , s ) ) return ff->first;
      ++ff;
    }
  return F_NONE;
}

std::string globals::metric( metric_t m )
{
  std::map<metric_t,std::string>::const_iterator mm = metric_labels.find( m );
  return mm == metric_labels.end() ? "?" : mm->second;
}

bool globals::metric( const std::string & s , metric_t * m )
{
  const std::string u = Helper::toupper( s );
  if ( u == "HR" || u == "HEARTRATE" ) { *m = M_HR; return true; }
  if ( u == "POWER" || u == "WATTS" || u == "PWR" ) { *m = M_POWER; return true; }
  return false;
}

field_t globals::metric_field( metric_t m )
{
  return m == M_HR ? F_HR : F_POWER;
}

std::string globals::kind( segment_kind_t k )
{
  std::map<segment_kind_t,std::string>::const_iterator kk = kind_labels.find( k );
  return kk == kind_labels.end() ? "?" : kk->second;
}
