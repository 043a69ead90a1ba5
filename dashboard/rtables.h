
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


#ifndef __VELO_RTABLES_H__
#define __VELO_RTABLES_H__

#include <map>
#include <string>
#include <vector>
#include <tuple>
#include <variant>
#include <stdint.h>

#include "helper/helper.h"

struct activity_summary_t;
struct rollup_t;

// flat 'return-tables' for storage or a dataframe-style consumer

// internal elements (monostate == missing)
typedef std::variant<std::string,double,int,std::monostate> rtable_elem_t;
typedef std::vector<std::vector<rtable_elem_t> > rtable_data_t;

// column names plus data
typedef std::tuple<std::vector<std::string>,rtable_data_t> rtable_return_t;


struct rtable_t {
  
  rtable_t();

  std::vector<std::string> cols;
  
  // column-major
  rtable_data_t data;

  // all columns must have the same row count
  int nrows;

  std::string dump() const;
  
  void checkrows( int n );

  int ncols() const { return cols.size(); }

  // column index, or -1
  int col( const std::string & c ) const;

  // strings
  void add( const std::string & v , const std::vector<std::string> & x );  
  void add( const std::string & v , const std::vector<std::string> & x , const std::vector<bool> & m );

  // doubles
  void add( const std::string & v , const std::vector<double> & x );
  void add( const std::string & v , const std::vector<double> & x , const std::vector<bool> & m );

  // ints
  void add( const std::string & v , const std::vector<int> & x );
  void add( const std::string & v , const std::vector<int> & x , const std::vector<bool> & m );
  
};


struct rtables_t {

  rtables_t() { };
  
  // SUMMARY, ZONES, SEGMENTS for a set of activities
  explicit rtables_t( const std::vector<activity_summary_t> & s );

  void clear();
  
  std::vector<std::string> list() const;
    
  rtable_t table( const std::string & name ) const;

  rtable_return_t data( const std::string & name ) const; 
  
  void dump() const;
  
  std::map<std::string,rtable_t> tables;
  
};


namespace rtables
{
  // one row per activity
  rtable_t summary( const std::vector<activity_summary_t> & s );

  // one row per activity x metric x zone (available distributions only)
  rtable_t zones( const std::vector<activity_summary_t> & s );

  // one row per segment
  rtable_t segments( const std::vector<activity_summary_t> & s );

  // one row per period
  rtable_t rollup( const std::map<int64_t,rollup_t> & r );
}

#endif
