//    --------------------------------------------------------------------
//
//    This file is part of rerp.
//
//    rerp is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    rerp is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with rerp. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "rerp/trials.h"
#include "rerp/errors.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>
#include <iomanip>
#include <limits>

extern logger_t logger;


bool pred_value_t::numeric( double * x ) const
{
  if ( is_num ) { *x = num; return true; }
  return Helper::str2dbl( str , x );
}

std::string pred_value_t::level() const
{
  if ( ! is_num ) return str;

  // shortest form that reads back as the same number
  std::string s;
  for (int dp=6; dp<=17; dp++)
    {
      std::stringstream ss;
      ss << std::setprecision( dp ) << num;
      s = ss.str();
      double x;
      if ( Helper::str2dbl( s , &x ) && x == num ) break;
    }
  return s;
}

bool pred_value_t::operator==( const pred_value_t & rhs ) const
{
  if ( is_num != rhs.is_num ) return false;
  return is_num ? num == rhs.num : str == rhs.str;
}


void trials_t::add( const trial_t & trial )
{
  if ( trial.X.rows() != nc() || trial.X.cols() != nt() )
    throw design_error( "trial " + Helper::int2str( size() + 1 )
			+ " has " + Helper::int2str( (int)trial.X.rows() ) + " x " + Helper::int2str( (int)trial.X.cols() )
			+ " samples, expecting " + Helper::int2str( nc() ) + " channels x " + Helper::int2str( nt() ) + " timepoints" );
  trials.push_back( trial );
}


Eigen::VectorXd trials_t::response( const int ch , const int t ) const
{
  const int n = trials.size();
  Eigen::VectorXd y( n );
  for (int i=0; i<n; i++) y[i] = trials[i].X( ch , t );
  return y;
}

int trials_t::channel( const std::string & label ) const
{
  for (int c=0; c<channels.size(); c++)
    if ( channels[c] == label ) return c;
  return -1;
}

int trials_t::timepoint( const double ms ) const
{
  for (int t=0; t<time.size(); t++)
    if ( time[t] >= ms ) return t;
  return time.size();
}

std::set<std::string> trials_t::levels( const std::string & name ) const
{
  std::set<std::string> s;
  for (int i=0; i<trials.size(); i++)
    {
      std::map<std::string,pred_value_t>::const_iterator pp = trials[i].preds.find( name );
      if ( pp != trials[i].preds.end() ) { s.insert( pp->second.level() ); continue; }
      std::map<std::string,std::string>::const_iterator dd = trials[i].desc.find( name );
      if ( dd != trials[i].desc.end() ) s.insert( dd->second );
    }
  return s;
}

std::vector<int> trials_t::rows( const std::string & desc , const std::string & level ) const
{
  std::vector<int> r;
  for (int i=0; i<trials.size(); i++)
    {
      std::map<std::string,std::string>::const_iterator dd = trials[i].desc.find( desc );
      if ( dd != trials[i].desc.end() && dd->second == level ) r.push_back( i );
    }
  return r;
}

trials_t trials_t::subset( const std::vector<int> & rows ) const
{
  trials_t s( channels , time );
  for (int i=0; i<rows.size(); i++)
    s.trials.push_back( trials[ rows[i] ] );
  return s;
}

trials_t trials_t::with_voltages( const std::vector<Eigen::MatrixXd> & V ) const
{
  if ( V.size() != trials.size() )
    throw design_error( "expecting voltages for " + Helper::int2str( size() ) + " trials" );
  trials_t s( channels , time );
  for (int i=0; i<trials.size(); i++)
    {
      trial_t trial = trials[i];
      trial.X = V[i];
      s.add( trial );
    }
  return s;
}

void trials_t::rename_predictor( const std::string & from , const std::string & to )
{
  for (int i=0; i<trials.size(); i++)
    {
      std::map<std::string,pred_value_t>::iterator pp = trials[i].preds.find( from );
      if ( pp == trials[i].preds.end() ) continue;
      pred_value_t v = pp->second;
      trials[i].preds.erase( pp );
      trials[i].preds[ to ] = v;
    }
}

void trials_t::rename_level( const std::string & name , const std::string & from , const std::string & to )
{
  for (int i=0; i<trials.size(); i++)
    {
      std::map<std::string,pred_value_t>::iterator pp = trials[i].preds.find( name );
      if ( pp != trials[i].preds.end() && ! pp->second.is_num && pp->second.str == from )
	pp->second.str = to;

      std::map<std::string,std::string>::iterator dd = trials[i].desc.find( name );
      if ( dd != trials[i].desc.end() && dd->second == from )
	dd->second = to;
    }
}

int trials_t::missing() const
{
  int m = 0;
  for (int i=0; i<trials.size(); i++)
    m += ( trials[i].X.array() != trials[i].X.array() ).count();
  return m;
}


void trials_t::read( const std::string & filename , const table_spec_t & spec )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not open " + filename );

  std::ifstream IN1( f.c_str() , std::ios::in );

  std::string line;
  Helper::safe_getline( IN1 , line );
  std::vector<std::string> hdr = Helper::char_split( line , globals::table_delimiter );

  std::map<std::string,int> col;
  for (int j=0; j<hdr.size(); j++)
    col[ Helper::unquote( Helper::lrtrim( hdr[j] ) ) ] = j;

  std::vector<std::string> needed;
  needed.push_back( spec.time );
  needed.insert( needed.end() , spec.keys.begin() , spec.keys.end() );
  needed.insert( needed.end() , spec.channels.begin() , spec.channels.end() );
  needed.insert( needed.end() , spec.preds.begin() , spec.preds.end() );
  needed.insert( needed.end() , spec.desc.begin() , spec.desc.end() );

  for (int j=0; j<needed.size(); j++)
    if ( col.find( needed[j] ) == col.end() )
      Helper::halt( "could not find column " + needed[j] + " in " + filename );

  if ( spec.keys.size() == 0 )
    Helper::halt( "no trial key columns specified" );

  if ( spec.channels.size() == 0 )
    Helper::halt( "no channel columns specified" );

  //
  // rows -> trials
  //

  const double NaN = std::numeric_limits<double>::quiet_NaN();

  std::vector<std::string> keyorder;
  std::map<std::string,trial_t> trial;
  std::map<std::string,std::map<double,std::vector<double> > > samples;
  std::set<double> timestamps;

  int rowcnt = 0;

  while ( ! IN1.eof() )
    {
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      if ( line == "" ) continue;

      ++rowcnt;

      std::vector<std::string> tok = Helper::char_split( line , globals::table_delimiter );
      if ( tok.size() != hdr.size() )
	Helper::halt( "row " + Helper::int2str( rowcnt ) + " has " + Helper::int2str( (int)tok.size() )
		      + " fields, expecting " + Helper::int2str( (int)hdr.size() ) );

      std::string key;
      for (int k=0; k<spec.keys.size(); k++)
	key += ( k ? "|" : "" ) + tok[ col[ spec.keys[k] ] ];

      double ms;
      if ( ! Helper::str2dbl( tok[ col[ spec.time ] ] , &ms ) )
	Helper::halt( "bad " + spec.time + " value on row " + Helper::int2str( rowcnt ) );

      timestamps.insert( ms );

      std::vector<double> v( spec.channels.size() );
      for (int c=0; c<spec.channels.size(); c++)
	{
	  const std::string & s = tok[ col[ spec.channels[c] ] ];
	  if ( s == globals::missing_value_label ) v[c] = NaN;
	  else if ( ! Helper::str2dbl( s , &v[c] ) )
	    Helper::halt( "bad " + spec.channels[c] + " value on row " + Helper::int2str( rowcnt ) + ": " + s );
	}

      if ( samples[ key ].find( ms ) != samples[ key ].end() )
	Helper::halt( "duplicate " + spec.time + " " + tok[ col[ spec.time ] ] + " for trial " + key );
      samples[ key ][ ms ] = v;

      //
      // per-trial fields: first row defines, later rows must agree
      //

      const bool first = trial.find( key ) == trial.end();
      trial_t & tr = trial[ key ];
      if ( first ) keyorder.push_back( key );

      for (int k=0; k<spec.keys.size(); k++)
	tr.desc[ spec.keys[k] ] = tok[ col[ spec.keys[k] ] ];

      for (int k=0; k<spec.desc.size(); k++)
	{
	  const std::string & s = tok[ col[ spec.desc[k] ] ];
	  if ( ! first && tr.desc[ spec.desc[k] ] != s )
	    throw design_error( "descriptor " + spec.desc[k] + " varies within trial " + key );
	  tr.desc[ spec.desc[k] ] = s;
	}

      for (int k=0; k<spec.preds.size(); k++)
	{
	  const std::string & s = tok[ col[ spec.preds[k] ] ];
	  if ( s == globals::missing_value_label )
	    throw design_error( "missing value for predictor " + spec.preds[k] + " in trial " + key );
	  double x;
	  pred_value_t pv = Helper::str2dbl( s , &x ) ? pred_value_t( x ) : pred_value_t( s );
	  if ( ! first && tr.preds[ spec.preds[k] ] != pv )
	    throw design_error( "predictor " + spec.preds[k] + " varies within trial " + key );
	  tr.preds[ spec.preds[k] ] = pv;
	}
    }

  IN1.close();

  //
  // common time axis: union of all timestamps
  //

  channels = spec.channels;
  time.assign( timestamps.begin() , timestamps.end() );
  trials.clear();

  std::map<double,int> tidx;
  for (int t=0; t<time.size(); t++) tidx[ time[t] ] = t;

  for (int i=0; i<keyorder.size(); i++)
    {
      trial_t & tr = trial[ keyorder[i] ];
      tr.X = Eigen::MatrixXd::Constant( nc() , nt() , NaN );
      const std::map<double,std::vector<double> > & s = samples[ keyorder[i] ];
      std::map<double,std::vector<double> >::const_iterator ss = s.begin();
      while ( ss != s.end() )
	{
	  const int t = tidx[ ss->first ];
	  for (int c=0; c<nc(); c++) tr.X( c , t ) = ss->second[c];
	  ++ss;
	}
      add( tr );
    }

  logger << "  read " << rowcnt << " rows from " << filename << ": "
	 << size() << " trials, " << nc() << " channels, " << nt() << " timepoints";
  const int m = missing();
  if ( m ) logger << ", " << m << " missing samples";
  logger << "\n";

}
