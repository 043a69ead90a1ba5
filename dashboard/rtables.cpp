
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


#include "dashboard/rtables.h"

#include "metrics/metrics.h"
#include "metrics/rollup.h"
#include "helper/logger.h"

extern logger_t logger;

rtable_t::rtable_t()
{
  nrows = -1;
}

std::string rtable_t::dump() const
{

  if ( nrows == -1 ) return "<empty>";
  
  std::stringstream ss;

  const int nc = cols.size();
  
  // header
  for (int j=0; j<nc; j++)
    {
      if ( j ) ss << "\t";
      ss << cols[j];
    }
  ss << "\n";
  
  // data
  for (int i=0;i<nrows;i++)
    {
      for (int j=0; j<nc; j++)
	{
	  if ( j ) ss << "\t";

	  const rtable_elem_t & e = data[ j ][ i ];

	  if ( std::holds_alternative<double>( e ) )
	    ss << std::get<double>( e ) ;
	  else if ( std::holds_alternative<int>( e ) )
	    ss << std::get<int>( e ) ;
	  else if ( std::holds_alternative<std::string>( e ) )
	    ss << std::get<std::string>( e ) ;
	  else
	    ss << ".";
	  
	}
      ss << "\n";
    } 
  
  return ss.str();
  
}


void rtable_t::checkrows( int n )
{
  if ( nrows == -1 )
    nrows = n;
  else if ( nrows != n )
    Helper::halt( "internal problem building an rtable_t" );    
}

int rtable_t::col( const std::string & c ) const
{
  for (int j=0; j<(int)cols.size(); j++)
    if ( cols[j] == c ) return j;
  return -1;
}

// all three element types go in the same way
template<typename T>
static void add_column( rtable_t * t , const std::string & v , const std::vector<T> & x , const std::vector<bool> & m )
{
  t->checkrows( x.size() );
  t->checkrows( m.size() );
  t->cols.push_back( v );
  std::vector<rtable_elem_t> d( t->nrows , std::monostate{} );
  for (int i=0;i<t->nrows;i++)
    if ( ! m[i] ) d[i] = x[i] ;
  t->data.push_back( d );
}

void rtable_t::add( const std::string & v , const std::vector<std::string> & x )
{
  add( v , x , std::vector<bool>( x.size() , false ) );
}

void rtable_t::add( const std::string & v , const std::vector<std::string> & x , const std::vector<bool> & m )
{
  add_column( this , v , x , m );
}

void rtable_t::add( const std::string & v , const std::vector<double> & x )
{
  add( v , x , std::vector<bool>( x.size() , false ) );
}

void rtable_t::add( const std::string & v , const std::vector<double> & x , const std::vector<bool> & m )
{
  add_column( this , v , x , m );
}

void rtable_t::add( const std::string & v , const std::vector<int> & x )
{
  add( v , x , std::vector<bool>( x.size() , false ) );
}

void rtable_t::add( const std::string & v , const std::vector<int> & x , const std::vector<bool> & m )
{
  add_column( this , v , x , m );
}


//
// rtables_t
//

rtables_t::rtables_t( const std::vector<activity_summary_t> & s )
{
  tables[ "SUMMARY" ] = rtables::summary( s );
  tables[ "ZONES" ] = rtables::zones( s );
  tables[ "SEGMENTS" ] = rtables::segments( s );
}

void rtables_t::clear()
{
  tables.clear();
}

std::vector<std::string> rtables_t::list() const
{
  std::vector<std::string> r;
  std::map<std::string,rtable_t>::const_iterator tt = tables.begin();
  while ( tt != tables.end() )
    {
      r.push_back( tt->first );
      ++tt;
    }
  return r;
}

rtable_t rtables_t::table( const std::string & name ) const
{
  std::map<std::string,rtable_t>::const_iterator tt = tables.find( name );
  if ( tt == tables.end() ) return rtable_t();
  return tt->second;
}

rtable_return_t rtables_t::data( const std::string & name ) const
{
  std::map<std::string,rtable_t>::const_iterator tt = tables.find( name );
  if ( tt == tables.end() ) return rtable_return_t();
  return std::make_tuple( tt->second.cols , tt->second.data );
}

void rtables_t::dump() const
{
  std::map<std::string,rtable_t>::const_iterator tt = tables.begin();
  while ( tt != tables.end() )
    {
      logger << tt->first + "\n" + tt->second.dump() + "\n";
      ++tt;
    }
}


//
// per-activity tables
//

rtable_t rtables::summary( const std::vector<activity_summary_t> & s )
{
  const int n = s.size();

  std::vector<std::string> id( n ), type( n ), date( n );
  std::vector<double> dist( n ), moving( n ), elapsed( n ), gain( n ), loss( n ),
    avg_hr( n ), max_hr( n ), avg_pwr( n ), max_pwr( n ), np( n ), ftp( n ),
    avg_spd( n ), max_spd( n ), avg_cad( n ), load( n ), hr_z( n ), pwr_z( n );
  std::vector<int> nsamples( n ), nclimb( n ), neffort( n );
  
  std::vector<bool> no_dist( n ), no_alt( n ), no_hr( n ), no_pwr( n ), no_np( n ),
    no_ftp( n ), no_spd( n ), no_cad( n ), no_load( n );
  
  for (int i=0; i<n; i++)
    {
      const activity_summary_t & a = s[i];
      id[i] = a.meta.id;
      type[i] = a.meta.type;
      date[i] = rollup::date( a.meta.start );
      nsamples[i] = a.n;
      moving[i] = a.moving_time;
      elapsed[i] = a.elapsed;
      dist[i] = a.distance;        no_dist[i] = ! a.has_distance;
      gain[i] = a.elev_gain;
      loss[i] = a.elev_loss;       no_alt[i] = ! a.has_altitude;
      avg_hr[i] = a.avg_hr;
      max_hr[i] = a.max_hr;        no_hr[i] = ! a.has_hr;
      avg_pwr[i] = a.avg_power;
      max_pwr[i] = a.max_power;    no_pwr[i] = ! a.has_power;
      np[i] = a.np;                no_np[i] = ! a.has_np;
      ftp[i] = a.ftp;              no_ftp[i] = ! a.has_ftp;
      avg_spd[i] = a.avg_speed;
      max_spd[i] = a.max_speed;    no_spd[i] = ! a.has_speed;
      avg_cad[i] = a.avg_cadence;  no_cad[i] = ! a.has_cadence;
      load[i] = a.load;            no_load[i] = ! a.has_load;
      nclimb[i] = a.n_segments( CLIMB );
      neffort[i] = a.n_segments( EFFORT );
    }

  rtable_t t;
  t.add( globals::id_strat , id );
  t.add( "TYPE" , type );
  t.add( "DATE" , date );
  t.add( "NS" , nsamples );
  t.add( "DIST" , dist , no_dist );
  t.add( "MOVING" , moving );
  t.add( "ELAPSED" , elapsed );
  t.add( "ELEV_GAIN" , gain , no_alt );
  t.add( "ELEV_LOSS" , loss , no_alt );
  t.add( "AVG_HR" , avg_hr , no_hr );
  t.add( "MAX_HR" , max_hr , no_hr );
  t.add( "AVG_POWER" , avg_pwr , no_pwr );
  t.add( "MAX_POWER" , max_pwr , no_pwr );
  t.add( "NP" , np , no_np );
  t.add( "FTP" , ftp , no_ftp );
  t.add( "AVG_SPEED" , avg_spd , no_spd );
  t.add( "MAX_SPEED" , max_spd , no_spd );
  t.add( "AVG_CAD" , avg_cad , no_cad );
  t.add( "LOAD" , load , no_load );
  t.add( "N_CLIMB" , nclimb );
  t.add( "N_EFFORT" , neffort );
  return t;
}


rtable_t rtables::zones( const std::vector<activity_summary_t> & s )
{
  std::vector<std::string> id, metric, zone;
  std::vector<double> secs, pct;
  std::vector<int> cnt;
  
  for (int i=0; i<(int)s.size(); i++)
    {
      const zone_distribution_t * d[2] = { &s[i].hr_zones , &s[i].power_zones };
      for (int m=0; m<2; m++)
	{
	  if ( ! d[m]->available ) continue;
	  for (int z=0; z<(int)d[m]->names.size(); z++)
	    {
	      id.push_back( s[i].meta.id );
	      metric.push_back( globals::metric( d[m]->metric ) );
	      zone.push_back( d[m]->names[z] );
	      cnt.push_back( d[m]->counts[z] );
	      secs.push_back( d[m]->secs[z] );
	      pct.push_back( d[m]->pct[z] );
	    }
	}
    }

  rtable_t t;
  t.add( globals::id_strat , id );
  t.add( globals::metric_strat , metric );
  t.add( globals::zone_strat , zone );
  t.add( "N" , cnt );
  t.add( "SECS" , secs );
  t.add( "PCT" , pct );
  return t;
}


rtable_t rtables::segments( const std::vector<activity_summary_t> & s )
{
  std::vector<std::string> id, kind;
  std::vector<int> seg, start, stop;
  std::vector<double> start_sec, dur, avg_hr, max_hr, avg_pwr, max_pwr, spd, grade, gain, vam, dist;
  std::vector<bool> no_hr, no_pwr, no_spd, no_grade, no_alt, no_dist;

  for (int i=0; i<(int)s.size(); i++)
    for (int j=0; j<(int)s[i].segments.size(); j++)
      {
	const segment_t & g = s[i].segments[j];
	id.push_back( s[i].meta.id );
	seg.push_back( j + 1 );
	kind.push_back( globals::kind( g.kind ) );
	start.push_back( g.tp.start );
	stop.push_back( g.tp.stop );
	start_sec.push_back( g.start_sec );
	dur.push_back( g.dur );
	avg_hr.push_back( g.avg_hr );     max_hr.push_back( g.max_hr );   no_hr.push_back( ! g.has_hr );
	avg_pwr.push_back( g.avg_power ); max_pwr.push_back( g.max_power ); no_pwr.push_back( ! g.has_power );
	spd.push_back( g.avg_speed );     no_spd.push_back( ! g.has_speed );
	grade.push_back( g.avg_grade );   no_grade.push_back( ! g.has_grade );
	gain.push_back( g.elev_gain );
	vam.push_back( g.vam );           no_alt.push_back( ! g.has_altitude );
	dist.push_back( g.distance );     no_dist.push_back( ! g.has_distance );
      }

  rtable_t t;
  t.add( globals::id_strat , id );
  t.add( globals::segment_strat , seg );
  t.add( "KIND" , kind );
  t.add( "START" , start );
  t.add( "STOP" , stop );
  t.add( "START_SEC" , start_sec );
  t.add( "DUR" , dur );
  t.add( "AVG_HR" , avg_hr , no_hr );
  t.add( "MAX_HR" , max_hr , no_hr );
  t.add( "AVG_POWER" , avg_pwr , no_pwr );
  t.add( "MAX_POWER" , max_pwr , no_pwr );
  t.add( "AVG_SPEED" , spd , no_spd );
  t.add( "AVG_GRADE" , grade , no_grade );
  t.add( "ELEV_GAIN" , gain , no_alt );
  t.add( "VAM" , vam , no_alt );
  t.add( "DIST" , dist , no_dist );
  return t;
}


rtable_t rtables::rollup( const std::map<int64_t,rollup_t> & r )
{
  std::vector<std::string> period;
  std::vector<int> n, nclimb, neffort;
  std::vector<double> dist, moving, gain, load, avg_hr;
  std::vector<bool> no_hr;
  
  std::map<int64_t,rollup_t>::const_iterator rr = r.begin();
  while ( rr != r.end() )
    {
      const rollup_t & p = rr->second;
      period.push_back( rollup::date( rr->first ) );
      n.push_back( p.n );
      dist.push_back( p.distance );
      moving.push_back( p.moving_time );
      gain.push_back( p.elev_gain );
      load.push_back( p.load );
      avg_hr.push_back( p.avg_hr() );
      no_hr.push_back( ! p.has_hr() );
      nclimb.push_back( p.n_climb );
      neffort.push_back( p.n_effort );
      ++rr;
    }

  rtable_t t;
  t.add( globals::period_strat , period );
  t.add( "N" , n );
  t.add( "DIST" , dist );
  t.add( "MOVING" , moving );
  t.add( "ELEV_GAIN" , gain );
  t.add( "LOAD" , load );
  t.add( "AVG_HR" , avg_hr , no_hr );
  t.add( "N_CLIMB" , nclimb );
  t.add( "N_EFFORT" , neffort );
  return t;
}
