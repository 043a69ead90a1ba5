
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


#include "stream/stream.h"

#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"
#include "miscmath/miscmath.h"

#include <algorithm>
#include <cmath>

extern logger_t logger;


raw_field_t raw_field_t::latlng( const std::vector<std::pair<double,double> > & ll )
{
  raw_field_t r;
  r.name = "latlng";
  const int n = ll.size();
  r.values.resize( n );
  r.values2.resize( n );
  for (int i=0; i<n; i++)
    {
      r.values[i] = ll[i].first;
      r.values2[i] = ll[i].second;
    }
  return r;
}


//
// channel_t
//

int channel_t::count() const
{
  int c = 0;
  for (int i=0; i<(int)p.size(); i++)
    if ( p[i] ) ++c;
  return c;
}

bool channel_t::any() const
{
  for (int i=0; i<(int)p.size(); i++)
    if ( p[i] ) return true;
  return false;
}

bool channel_t::all() const
{
  if ( p.size() == 0 ) return false;
  for (int i=0; i<(int)p.size(); i++)
    if ( ! p[i] ) return false;
  return true;
}

std::vector<double> channel_t::present_values() const
{
  std::vector<double> r;
  for (int i=0; i<(int)x.size(); i++)
    if ( p[i] ) r.push_back( x[i] );
  return r;
}


//
// activity_stream_t
//

std::map<field_t,int> activity_stream_t::counts() const
{
  std::map<field_t,int> r;
  for (int f=0; f<F_NONE; f++)
    r[ (field_t)f ] = channels[f].count();
  return r;
}

std::string activity_stream_t::summary() const
{
  std::stringstream ss;
  ss << size() << " samples, span " << Helper::timestring( span() )
     << ", interval " << interval << "s; present:";

  for (int f=0; f<F_NONE; f++)
    {
      const int c = channels[f].count();
      if ( c ) ss << " " << globals::field( (field_t)f ) << "=" << c;
    }
  if ( derived_grade ) ss << " (derived grade)";
  return ss.str();
}


//
// align_param_t
//

align_param_t::align_param_t()
{
  min_samples = 30;
  axis = AXIS_TIME;
  hold = -1;
  derive_grade = true;
}

align_param_t::align_param_t( const param_t & param )
{
  *this = align_param_t();
  
  min_samples = param.integer( "min-samples" , min_samples );

  if ( param.has( "axis" ) )
    {
      const std::string a = param.value( "axis" );
      if      ( a == "time" )    axis = AXIS_TIME;
      else if ( a == "union" )   axis = AXIS_UNION;
      else if ( a == "densest" ) axis = AXIS_DENSEST;
      else throw invalid_param_error( "axis should be time, union or densest: " + a );
    }

  hold = param.dbl( "hold" , hold );

  if ( param.has( "derive-grade" ) )
    derive_grade = param.yesno( "derive-grade" );
  
  validate();
}

void align_param_t::validate() const
{
  if ( min_samples < 2 )
    throw invalid_param_error( "min-samples must be at least 2" );
}


//
// stream_aligner_t
//

void stream_aligner_t::check_basis( const std::string & label , const std::vector<double> & tp )
{
  const int n = tp.size();
  for (int i=0; i<n; i++)
    {
      if ( ! Helper::realnum( tp[i] ) )
	throw invalid_stream_error( "non-finite time-point in " + label );
      if ( i && tp[i] <= tp[i-1] )
	throw invalid_stream_error( "time-points not strictly increasing in "
				    + label + " at sample " + Helper::int2str( i ) );
    }
}


std::vector<double> stream_aligner_t::axis( const std::vector<const std::vector<double>*> & bases ,
					    const std::vector<double> * time ) const
{
  
  if ( par.axis == AXIS_TIME && time != NULL )
    return *time;

  if ( par.axis == AXIS_DENSEST )
    {
      const std::vector<double> * best = NULL;
      for (int b=0; b<(int)bases.size(); b++)
	if ( best == NULL || bases[b]->size() > best->size() )
	  best = bases[b];
      return best == NULL ? std::vector<double>() : *best;
    }

  // union
  std::vector<double> u;
  for (int b=0; b<(int)bases.size(); b++)
    u.insert( u.end() , bases[b]->begin() , bases[b]->end() );
  std::sort( u.begin() , u.end() );
  u.erase( std::unique( u.begin() , u.end() ) , u.end() );
  return u;
}


channel_t stream_aligner_t::hold( const std::vector<double> & values ,
				  const std::vector<bool> & present , 
				  const std::vector<double> & basis ,
				  const std::vector<double> & axis ,
				  double hold )
{
  
  const double EPS = 1e-9;
  
  const int na = axis.size();
  const int nb = basis.size();

  channel_t ch( na );

  if ( nb == 0 ) return ch;
  
  for (int i=0; i<na; i++)
    {
      const double t = axis[i];
      
      // outside the native range
      if ( t < basis[0] - EPS || t > basis[nb-1] + EPS ) continue;

      // last native point at or before t
      int j = std::upper_bound( basis.begin() , basis.end() , t + EPS ) - basis.begin() - 1;
      if ( j < 0 ) continue;
      
      if ( t - basis[j] > hold + EPS ) continue;

      if ( present.size() != 0 && ! present[j] ) continue;

      if ( ! Helper::realnum( values[j] ) ) continue;
      
      ch.set( i , values[j] );
    }
  
  return ch;
}


channel_t stream_aligner_t::grade( const channel_t & altitude , const channel_t & distance )
{
  const int n = altitude.size();
  channel_t g( n );
  int last = -1;
  for (int i=0; i<n; i++)
    {
      if ( ! ( altitude.p[i] && distance.p[i] ) ) continue;
      if ( last != -1 )
	{
	  const double dd = distance.x[i] - distance.x[last];
	  if ( dd > 0 )
	    g.set( i , 100.0 * ( altitude.x[i] - altitude.x[last] ) / dd );
	}
      last = i;
    }
  return g;
}


activity_stream_t stream_aligner_t::align( const activity_meta_t & meta ,
					   const std::vector<raw_field_t> & fields ) const
{

  //
  // find the time field, if any
  //

  const raw_field_t * time = NULL;
  
  for (int f=0; f<(int)fields.size(); f++)
    if ( fields[f].name == "time" )
      {
	if ( time != NULL ) throw invalid_stream_error( "more than one time field" );
	time = &fields[f];
      }
  
  if ( time != NULL )
    check_basis( "time" , time->values );
  
  
  //
  // resolve each value field to a channel and a time basis
  //

  struct source_t
  {
    field_t field;
    const raw_field_t * raw;
    const std::vector<double> * values;
    std::vector<double> basis;
  };

  std::vector<source_t> sources;
  
  for (int f=0; f<(int)fields.size(); f++)
    {
      const raw_field_t & raw = fields[f];

      if ( &raw == time ) continue;
      
      std::vector<field_t> targets;
      std::vector<const std::vector<double>*> values;

      if ( raw.name == "latlng" )
	{
	  if ( raw.values2.size() != raw.values.size() )
	    throw invalid_stream_error( "latlng has unpaired coordinates" );
	  targets.push_back( F_LAT ); values.push_back( &raw.values );
	  targets.push_back( F_LNG ); values.push_back( &raw.values2 );
	}
      else
	{
	  field_t ft = globals::field( raw.name );
	  if ( ft == F_NONE )
	    {
	      Helper::warn( "ignoring unknown stream field " + raw.name );
	      continue;
	    }
	  targets.push_back( ft );
	  values.push_back( &raw.values );
	}

      if ( raw.present.size() != 0 && raw.present.size() != raw.values.size() )
	throw invalid_stream_error( "presence mask and values differ in length for " + raw.name );
      
      std::vector<double> basis;

      if ( raw.has_own_time() )
	{
	  if ( raw.tp.size() != raw.values.size() )
	    throw invalid_stream_error( "time-points and values differ in length for " + raw.name );
	  check_basis( raw.name , raw.tp );
	  basis = raw.tp;
	}
      else if ( time != NULL )
	{
	  // index-aligned with 'time': a shorter field is absent past its end
	  int n = raw.values.size();
	  if ( n > (int)time->values.size() )
	    {
	      Helper::warn( raw.name + " has more samples than time, truncating" );
	      n = time->values.size();
	    }
	  basis.assign( time->values.begin() , time->values.begin() + n );
	}
      else
	{
	  // no time basis anywhere: assume 1 Hz from zero
	  basis.resize( raw.values.size() );
	  for (int i=0; i<(int)basis.size(); i++) basis[i] = i;
	}

      for (int t=0; t<(int)targets.size(); t++)
	{
	  source_t s;
	  s.field = targets[t];
	  s.raw = &raw;
	  s.values = values[t];
	  s.basis = basis;
	  sources.push_back( s );
	}
    }


  //
  // canonical axis
  //

  std::vector<const std::vector<double>*> bases;
  if ( time != NULL ) bases.push_back( &time->values );
  for (int s=0; s<(int)sources.size(); s++)
    bases.push_back( &sources[s].basis );

  activity_stream_t stream;
  stream.meta = meta;
  stream.tp = axis( bases , time == NULL ? NULL : &time->values );

  const int n = stream.tp.size();
  
  if ( n < par.min_samples )
    throw insufficient_data_error( "activity " + meta.id + " has " + Helper::int2str( n )
				   + " samples, requires at least " + Helper::int2str( par.min_samples ) ,
				   n , par.min_samples );

  stream.interval = MiscMath::median( MiscMath::diff( stream.tp ) );

  // every channel spans the axis; unsupplied fields are wholly absent
  for (int f=0; f<F_NONE; f++)
    stream.channels[f] = channel_t( n );

  
  //
  // map each field onto the axis
  //

  std::vector<bool> filled( F_NONE , false );
  
  for (int s=0; s<(int)sources.size(); s++)
    {
      const source_t & src = sources[s];
      
      double tol = par.hold;
      if ( tol < 0 )
	tol = src.basis.size() < 2 ? 0 : MiscMath::median( MiscMath::diff( src.basis ) );
      
      if ( filled[ src.field ] )
	Helper::warn( "more than one source for " + globals::field( src.field ) + ", using " + src.raw->name );
      
      stream.channels[ src.field ] = hold( *src.values , src.raw->present , src.basis , stream.tp , tol );
      filled[ src.field ] = true;
    }

  
  //
  // derived grade
  //

  if ( par.derive_grade && ! stream.has( F_GRADE ) && stream.has( F_ALTITUDE ) && stream.has( F_DISTANCE ) )
    {
      stream.channels[ F_GRADE ] = grade( stream[ F_ALTITUDE ] , stream[ F_DISTANCE ] );
      stream.derived_grade = stream.has( F_GRADE );
    }

  if ( globals::verbose )
    logger << "  aligned " + meta.id + ": " + stream.summary() + "\n";
  
  return stream;
}
