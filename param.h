
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


#ifndef __VELO_PARAM_H__
#define __VELO_PARAM_H__

#include <string>
#include <map>
#include <vector>
#include <sstream>

//
// key=value option sets, e.g. { "smooth=7" , "merge-gap=5" , "hr-th=155" }
//

struct param_t
{

 public:

  param_t() { } 

  // each token is 'key=value' or a bare 'key' flag
  param_t( const std::vector<std::string> & tokens );
  
  void add( const std::string & option , const std::string & value = "" ); 

  int size() const;
  
  void parse( const std::string & s );
  
  void clear();
  
  bool has(const std::string & s ) const;
  
  bool empty(const std::string & s ) const;
  
  // if ! has(X) return F, else return yesno(value(X))
  bool yesno(const std::string & s ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;
 
  std::string requires( const std::string & s , const bool uppercase = false ) const;
  
  int requires_int( const std::string & s ) const;
  
  double requires_dbl( const std::string & s ) const;

  // value if present, else the default
  double dbl( const std::string & s , const double def ) const
  { return has( s ) ? requires_dbl( s ) : def; }

  int integer( const std::string & s , const int def ) const
  { return has( s ) ? requires_int( s ) : def; }
  
  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  std::vector<int> intvector( const std::string & k , const std::string delim = "," ) const;

private:

  std::map<std::string,std::string> opt;

};


#endif
