
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


#ifndef __VELO_STREAM_H__
#define __VELO_STREAM_H__

#include <string>
#include <vector>
#include <map>
#include <stdint.h>

#include "defs/defs.h"

struct param_t;

//
// one raw provider field, e.g. 'heartrate' or 'watts', as fetched
//

struct raw_field_t
{
  
  raw_field_t() { }

  raw_field_t( const std::string & name , const std::vector<double> & values )
    : name(name) , values(values) { }
  
  raw_field_t( const std::string & name , const std::vector<double> & values , const std::vector<double> & tp )
    : name(name) , values(values) , tp(tp) { }

  // 'latlng' is a sequence of pairs: values holds lat, values2 lng
  static raw_field_t latlng( const std::vector<std::pair<double,double> > & ll );
  
  std::string name;
  
  std::vector<double> values;

  std::vector<double> values2;

  // gaps: if non-empty, F means no reading at that point (same length as values)
  std::vector<bool> present;
  
  // own time basis (seconds); if empty, index-aligned with 'time'
  std::vector<double> tp;

  bool has_own_time() const { return tp.size() != 0; }

  bool is_present( int i ) const 
  {
    return present.size() == 0 || present[i];
  }
  
};


struct activity_meta_t
{
  activity_meta_t() : start(0) { } 

  activity_meta_t( const std::string & id , int64_t start , const std::string & type = "Ride" )
    : id(id) , start(start) , type(type) { }
  
  std::string id;

  // epoch seconds
  int64_t start;

  // declared activity type, e.g. Ride
  std::string type;

  std::string name;
};


//
// one aligned channel: values plus a presence mask; an absent point is
// 'no reading', which is not the same as a reading of zero
//

struct channel_t
{

  channel_t() { }
  
  explicit channel_t( int n ) : x( n , 0 ) , p( n , false ) { }

  std::vector<double> x;
  
  std::vector<bool> p;

  int size() const { return x.size(); }
  
  // number of present points
  int count() const;

  bool any() const;

  bool all() const;

  void set( int i , double v )
  {
    x[i] = v;
    p[i] = true;
  }

  // present values only
  std::vector<double> present_values() const;
  
};


//
// an activity on one common time axis
//

struct activity_stream_t
{
  
  activity_meta_t meta;

  // elapsed seconds, strictly increasing
  std::vector<double> tp;

  // nominal sample interval (median difference), seconds
  double interval;

  // indexed by field_t (F_DISTANCE .. F_MOVING)
  std::vector<channel_t> channels;

  // T if grade was not supplied but derived from altitude/distance
  bool derived_grade;
  
  activity_stream_t() : interval(0) , channels( F_NONE ) , derived_grade( false ) { } 
  
  int size() const { return tp.size(); }

  double span() const { return tp.size() == 0 ? 0 : tp.back() - tp.front(); }
  
  // span plus one sample interval
  double elapsed() const { return tp.size() == 0 ? 0 : span() + interval; }
  
  const channel_t & operator[]( field_t f ) const { return channels[ f ]; }

  channel_t & operator[]( field_t f ) { return channels[ f ]; }

  bool has( field_t f ) const { return channels[ f ].any(); } 

  // per-field presence counts
  std::map<field_t,int> counts() const;
  
  std::string summary() const;
  
};


//
// aligner configuration
//

enum axis_mode_t
  {
    AXIS_TIME ,     // the 'time' field (union if not supplied)
    AXIS_UNION ,    // union of all time bases
    AXIS_DENSEST    // the longest single time basis
  };


struct align_param_t
{
  align_param_t();

  explicit align_param_t( const param_t & param );

  // minimum number of samples on the canonical axis
  int min_samples;

  axis_mode_t axis;

  // zero-order-hold tolerance (seconds); negative means use each field's own median interval
  double hold;

  // derive grade from altitude and distance if not supplied
  bool derive_grade;
  
  void validate() const;
};


struct stream_aligner_t
{
  
  explicit stream_aligner_t( const align_param_t & par ) : par(par) { }
  
  activity_stream_t align( const activity_meta_t & meta ,
			   const std::vector<raw_field_t> & fields ) const;
  
  // canonical axis from a set of (validated) time bases
  std::vector<double> axis( const std::vector<const std::vector<double>*> & bases ,
			    const std::vector<double> * time ) const;
  
  // map one field onto the axis by zero-order hold within 'hold' seconds
  static channel_t hold( const std::vector<double> & values ,
			 const std::vector<bool> & present , 
			 const std::vector<double> & basis ,
			 const std::vector<double> & axis ,
			 double hold );

  // 100 * d(altitude) / d(distance), between successive points with both present
  static channel_t grade( const channel_t & altitude , const channel_t & distance );

  const align_param_t par;

 private:

  static void check_basis( const std::string & label , const std::vector<double> & tp );
  
};

#endif
