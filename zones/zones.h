
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


#ifndef __VELO_ZONES_H__
#define __VELO_ZONES_H__

#include <string>
#include <vector>
#include <map>
#include <istream>

#include "defs/defs.h"

struct activity_stream_t;

// a named, closed interval [lwr,upr]
struct zone_t
{
  zone_t() : lwr(0) , upr(0) { }
  zone_t( const std::string & name , double lwr , double upr )
    : name(name) , lwr(lwr) , upr(upr) { }

  std::string name;
  double lwr;
  double upr;

  bool contains( double x ) const { return x >= lwr && x <= upr; }
};


//
// ordered zones per metric; validated once when constructed and
// immutable thereafter
//

struct zone_set_t
{

  zone_set_t() { } 
  
  explicit zone_set_t( const std::map<metric_t,std::vector<zone_t> > & z );

  // lines of 'METRIC NAME LOWER UPPER', '%' starts a comment
  static zone_set_t read( std::istream & in );

  static zone_set_t read( const std::vector<std::string> & lines );
  
  // Z1..Z5 as 0-60-70-80-90-110 % of max HR, whole bpm
  static std::vector<zone_t> default_hr( double max_hr );

  // Z1..Z7 (Coggan) as % of FTP
  static std::vector<zone_t> default_power( double ftp );

  static zone_set_t defaults( double max_hr , double ftp );
  
  bool has( metric_t m ) const { return z.find( m ) != z.end(); }
  
  // empty if none defined for this metric
  const std::vector<zone_t> & zones( metric_t m ) const;
  
  // index of the first zone containing x, or -1 (unzoned)
  int classify( metric_t m , double x ) const;

  // throws invalid_zone_config_error 
  void validate() const;
  
  static void validate( metric_t m , const std::vector<zone_t> & zones );

 private:
  
  std::map<metric_t,std::vector<zone_t> > z;

};


//
// time in zone for one metric of one (or several) activities
//

struct zone_distribution_t
{

  zone_distribution_t() : metric( M_HR ) , available( false ) , unzoned(0) , unzoned_secs(0) { } 
  
  metric_t metric;
  
  // F means 'not available' (metric absent, or no zones), not all-zero
  bool available;

  std::string reason;
  
  std::vector<std::string> names;

  std::vector<int> counts;
  
  std::vector<double> secs;

  // percent of classified time
  std::vector<double> pct;

  // present but outside every zone
  int unzoned;
  double unzoned_secs;
  
  // classified time (i.e. the denominator for pct)
  double total() const;

  void percentages();

  static zone_distribution_t unavailable( metric_t m , const std::string & reason );
  
  // durations are added and percentages recomputed; different zone
  // definitions cannot be merged
  friend zone_distribution_t operator+( const zone_distribution_t & a , const zone_distribution_t & b );

};


namespace zones
{
  
  // throws missing_metric_error if the channel is entirely absent; unavailable
  // if no present sample falls inside a zone
  zone_distribution_t classify( const activity_stream_t & stream ,
				metric_t m ,
				const zone_set_t & zs );

  // as above, but returns an 'unavailable' distribution instead of throwing
  zone_distribution_t distribution( const activity_stream_t & stream ,
				    metric_t m ,
				    const zone_set_t & zs );
  
  // counts per bin (bin lower edge) over present values; optionally
  // excluding exact zeros (e.g. cadence while coasting)
  std::map<double,int> histogram( const activity_stream_t & stream ,
				  field_t f ,
				  double width ,
				  bool skip_zero = false );
  
}

#endif
