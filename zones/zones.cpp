
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


#include "zones/zones.h"

#include "stream/stream.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"
#include "miscmath/miscmath.h"

#include <set>
#include <cmath>
#include <sstream>

extern logger_t logger;


//
// zone_set_t
//

zone_set_t::zone_set_t( const std::map<metric_t,std::vector<zone_t> > & z ) : z(z)
{
  validate();
}

void zone_set_t::validate() const
{
  std::map<metric_t,std::vector<zone_t> >::const_iterator zz = z.begin();
  while ( zz != z.end() )
    {
      validate( zz->first , zz->second );
      ++zz;
    }
}

void zone_set_t::validate( metric_t m , const std::vector<zone_t> & zones )
{
  const std::string label = globals::metric( m );
  
  if ( zones.size() == 0 )
    throw invalid_zone_config_error( "no zones defined for " + label );

  std::set<std::string> names;
  
  for (int i=0; i<(int)zones.size(); i++)
    {
      const zone_t & zone = zones[i];

      if ( zone.name == "" )
	throw invalid_zone_config_error( "unnamed zone for " + label );

      if ( names.find( zone.name ) != names.end() )
	throw invalid_zone_config_error( "duplicate zone " + zone.name + " for " + label );
      names.insert( zone.name );
      
      if ( ! ( Helper::realnum( zone.lwr ) && Helper::realnum( zone.upr ) ) )
	throw invalid_zone_config_error( "non-finite bound for zone " + zone.name );
      
      if ( zone.lwr > zone.upr )
	throw invalid_zone_config_error( "zone " + zone.name + " has lower bound above upper bound" );

      if ( i == 0 ) continue;

      const zone_t & prior = zones[i-1];
      
      if ( zone.lwr < prior.lwr )
	throw invalid_zone_config_error( label + " zones not sorted: " + zone.name + " comes after " + prior.name );

      // exactly adjacent bounds are allowed (the lower zone takes the shared value)
      if ( prior.upr > zone.lwr )
	throw invalid_zone_config_error( label + " zones overlap: " + prior.name + " and " + zone.name );
    }
}


zone_set_t zone_set_t::read( std::istream & in )
{
  std::vector<std::string> lines;
  std::string line;
  while ( true )
    {
      Helper::safe_getline( in , line );
      if ( in.eof() || in.fail() ) break;
      lines.push_back( line );
    }
  return read( lines );
}

zone_set_t zone_set_t::read( const std::vector<std::string> & lines )
{
  std::map<metric_t,std::vector<zone_t> > z;

  for (int l=0; l<(int)lines.size(); l++)
    {
      const std::string line = Helper::lrtrim( lines[l] );
      if ( line == "" || line[0] == '%' ) continue;

      std::vector<std::string> tok = Helper::parse( line , " \t" );
      if ( tok.size() != 4 )
	throw invalid_zone_config_error( "expecting METRIC NAME LOWER UPPER: " + line );
      
      metric_t m;
      if ( ! globals::metric( tok[0] , &m ) )
	throw invalid_zone_config_error( "unrecognized zone metric: " + tok[0] );

      double lwr , upr;
      if ( ! ( Helper::str2dbl( tok[2] , &lwr ) && Helper::str2dbl( tok[3] , &upr ) ) )
	throw invalid_zone_config_error( "bad zone bounds: " + line );

      z[ m ].push_back( zone_t( tok[1] , lwr , upr ) );
    }

  return zone_set_t( z );
}


std::vector<zone_t> zone_set_t::default_hr( double max_hr )
{
  if ( ! ( max_hr > 0 ) )
    throw invalid_zone_config_error( "maximum heart rate must be positive" );

  const char * names[] = { "Z1 Easy" , "Z2 Endurance" , "Z3 Tempo" , "Z4 Threshold" , "Z5 Max" };
  const double edges[] = { 0 , 0.6 , 0.7 , 0.8 , 0.9 , 1.1 };

  std::vector<zone_t> r;
  for (int i=0; i<5; i++)
    r.push_back( zone_t( names[i] ,
			 (int)( max_hr * edges[i] + 1e-9 ) ,
			 (int)( max_hr * edges[i+1] + 1e-9 ) ) );
  return r;
}

std::vector<zone_t> zone_set_t::default_power( double ftp )
{
  if ( ! ( ftp > 0 ) )
    throw invalid_zone_config_error( "FTP must be positive" );

  const char * names[] = { "Z1 Recovery" , "Z2 Endurance" , "Z3 Tempo" , "Z4 Threshold" ,
			   "Z5 VO2max" , "Z6 Anaerobic" , "Z7 Neuromuscular" };
  const double edges[] = { 0 , 0.55 , 0.75 , 0.90 , 1.05 , 1.20 , 1.50 , 10.0 };

  std::vector<zone_t> r;
  for (int i=0; i<7; i++)
    r.push_back( zone_t( names[i] , ftp * edges[i] , ftp * edges[i+1] ) );
  return r;
}

zone_set_t zone_set_t::defaults( double max_hr , double ftp )
{
  std::map<metric_t,std::vector<zone_t> > z;
  z[ M_HR ] = default_hr( max_hr );
  z[ M_POWER ] = default_power( ftp );
  return zone_set_t( z );
}

const std::vector<zone_t> & zone_set_t::zones( metric_t m ) const
{
  static const std::vector<zone_t> none;
  std::map<metric_t,std::vector<zone_t> >::const_iterator zz = z.find( m );
  return zz == z.end() ? none : zz->second;
}

int zone_set_t::classify( metric_t m , double x ) const
{
  const std::vector<zone_t> & zs = zones( m );
  // first (i.e. lowest) zone wins on a shared bound
  for (int i=0; i<(int)zs.size(); i++)
    if ( zs[i].contains( x ) ) return i;
  return -1;
}


//
// zone_distribution_t
//

double zone_distribution_t::total() const
{
  return MiscMath::sum( secs );
}

void zone_distribution_t::percentages()
{
  const double t = total();
  pct.resize( secs.size() );
  for (int i=0; i<(int)secs.size(); i++)
    pct[i] = t > 0 ? 100.0 * secs[i] / t : 0 ;
}

zone_distribution_t zone_distribution_t::unavailable( metric_t m , const std::string & reason )
{
  zone_distribution_t d;
  d.metric = m;
  d.available = false;
  d.reason = reason;
  return d;
}

zone_distribution_t operator+( const zone_distribution_t & a , const zone_distribution_t & b )
{
  if ( a.metric != b.metric )
    throw invalid_zone_config_error( "cannot merge " + globals::metric( a.metric )
				     + " and " + globals::metric( b.metric ) + " zone distributions" );

  // a default-constructed (empty) distribution carries no reason
  if ( ! a.available && ! b.available )
    {
      if ( a.reason == "" ) return b;
      if ( b.reason == "" ) return a;
      return a.reason <= b.reason ? a : b;
    }
  
  if ( ! a.available ) return b;
  if ( ! b.available ) return a;

  if ( a.names != b.names )
    throw invalid_zone_config_error( "cannot merge " + globals::metric( a.metric )
				     + " distributions from different zone definitions" );
  
  zone_distribution_t r = a;
  for (int i=0; i<(int)r.secs.size(); i++)
    {
      r.counts[i] += b.counts[i];
      r.secs[i] += b.secs[i];
    }
  r.unzoned += b.unzoned;
  r.unzoned_secs += b.unzoned_secs;
  r.percentages();
  return r;
}


//
// classification
//

zone_distribution_t zones::classify( const activity_stream_t & stream ,
				     metric_t m ,
				     const zone_set_t & zs )
{
  
  const field_t f = globals::metric_field( m );
  
  const channel_t & ch = stream[ f ];

  if ( ! ch.any() )
    throw missing_metric_error( "no " + globals::field( f ) + " data in activity " + stream.meta.id ,
				globals::field( f ) );
  
  const std::vector<zone_t> & zones = zs.zones( m );

  zone_distribution_t d;
  d.metric = m;
  d.available = true;
  
  const int nz = zones.size();
  d.counts.resize( nz , 0 );
  for (int i=0; i<nz; i++) d.names.push_back( zones[i].name );

  const int n = ch.size();
  for (int i=0; i<n; i++)
    {
      if ( ! ch.p[i] ) continue;
      const int z = zs.classify( m , ch.x[i] );
      if ( z == -1 ) ++d.unzoned;
      else ++d.counts[z];
    }

  // uniform spacing
  d.secs.resize( nz );
  for (int i=0; i<nz; i++)
    d.secs[i] = d.counts[i] * stream.interval;
  d.unzoned_secs = d.unzoned * stream.interval;
  
  if ( d.unzoned && globals::verbose )
    {
      std::stringstream ss;
      ss << "  " << d.unzoned << " " << globals::field( f ) << " samples outside all zones\n";
      logger << ss.str();
    }

  // nothing to take percentages of
  if ( d.total() == 0 )
    return zone_distribution_t::unavailable( m , "no " + globals::field( f ) + " samples in activity "
					     + stream.meta.id + " fall inside any " + globals::metric( m ) + " zone" );

  d.percentages();

  return d;
}


zone_distribution_t zones::distribution( const activity_stream_t & stream ,
					 metric_t m ,
					 const zone_set_t & zs )
{
  if ( ! zs.has( m ) )
    return zone_distribution_t::unavailable( m , "no " + globals::metric( m ) + " zones defined" );
  
  try
    {
      return classify( stream , m , zs );
    }
  catch ( const missing_metric_error & e )
    {
      return zone_distribution_t::unavailable( m , e.what() );
    }
}


std::map<double,int> zones::histogram( const activity_stream_t & stream ,
				       field_t f ,
				       double width ,
				       bool skip_zero )
{
  const channel_t & ch = stream[ f ];
  std::vector<bool> include = ch.p;
  if ( skip_zero )
    for (int i=0; i<(int)include.size(); i++)
      if ( include[i] && ch.x[i] == 0 ) include[i] = false;
  return MiscMath::histogram( ch.x , include , width );
}
