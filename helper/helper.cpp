
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


#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <iomanip>
#include <cstdlib>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  const int n = s.size();
  int n2 = 0;
  for (int i=0; i<n; i++) { if ( ! ( s[i] == '"' || s[i] == q2 ) ) ++n2; } 
  if ( n2 == n ) return s;
  std::string r( n2 , ' ' );
  int j = 0;
  for	(int i=0; i<n; i++)
    {
      if ( ! ( s[i] == '"' || s[i] == q2 ) )
	{
	  r[j] = s[i];
	  ++j;
	}
    }
  return r;
}

void Helper::halt( const std::string & msg )
{
  // library code never exits: the caller decides what to do
  throw velo_error( msg );
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

bool Helper::realnum(double d)
{
  return std::isfinite( d );
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(uint64_t n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE 
  // versus all else  (including empty, i.e. 'var'  --> 'var=T' 
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (tolower(a[i]) != tolower(b[i]))
      return false;
  return true;
}


std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{
  // a quote character that never appears: i.e. no quoting
  return quoted_parse( item , s , '\0' , '\0' , empty );
}


std::vector<std::string> Helper::quoted_parse(const std::string & item , const std::string & s , const char q , const char q2, bool empty )
{

  std::vector<std::string> strs;  
  if ( item.size() == 0 ) return strs;
  int p=0;
  
  bool in_quote = false;
  
  for (int j=0; j<item.size(); j++)
    {	        
      
      const char c = item[j];
      
      if ( q != '\0' && ( c == '"' || c == q || c == q2 ) ) in_quote = ! in_quote;
      
      if ( (!in_quote) && s.find( c ) != std::string::npos ) 
	{ 	      
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(item.substr(p,j-p)); 
	      p=j+1; 
	    }
	}	  
    }
  
  if ( empty && p == item.size() ) 
    strs.push_back( "." );
  else if ( p < item.size() )
    strs.push_back( item.substr(p) );
  
  return strs;
}


std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  // handles \n, \r and \r\n line endings
  t.clear();
  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();
  for(;;) {
    int c = sb->sbumpc();
    switch (c) {
    case '\n':
      return is;
    case '\r':
      if(sb->sgetc() == '\n')
	sb->sbumpc();
      return is;
    case std::streambuf::traits_type::eof():
      if(t.empty())
	is.setstate(std::ios::eofbit);
      return is;
    default:
      t += (char)c;
    }
  }
}


std::string Helper::timestring( double sec )
{
  if ( sec < 0 ) sec = 0;
  const long s = std::lround( sec );
  const long h = s / 3600;
  const long m = ( s % 3600 ) / 60;
  std::stringstream ss;
  ss << std::setfill( '0' ) 
     << std::setw(2) << h << ":" 
     << std::setw(2) << m << ":"
     << std::setw(2) << s % 60;
  return ss.str();
}
