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

#include "rerp/summary.h"
#include "rerp/errors.h"

#include "stats/statistics.h"
#include "helper/helper.h"

#include <limits>



std::string rerp::group_key( const trial_t & trial , const std::vector<std::string> & by )
{
  std::string key;
  for (int k=0; k<by.size(); k++)
    {
      std::string v;
      std::map<std::string,pred_value_t>::const_iterator pp = trial.preds.find( by[k] );
      std::map<std::string,std::string>::const_iterator dd = trial.desc.find( by[k] );
      if ( pp != trial.preds.end() ) v = pp->second.level();
      else if ( dd != trial.desc.end() ) v = dd->second;
      else throw design_error( "no predictor or descriptor " + by[k] + " for summary" );
      key += ( k ? "," : "" ) + by[k] + "=" + v;
    }
  return key == "" ? "." : key;
}


// cell-wise mean and SEM over matrices, skipping NaN

static void cell_stats( const std::vector<const Eigen::MatrixXd*> & m ,
			const int nr , const int nc ,
			Eigen::MatrixXd * mean ,
			Eigen::MatrixXd * sem )
{
  const double NaN = std::numeric_limits<double>::quiet_NaN();
  mean->resize( nr , nc );
  sem->resize( nr , nc );
  std::vector<double> x;
  for (int r=0; r<nr; r++)
    for (int c=0; c<nc; c++)
      {
	x.clear();
	for (int k=0; k<m.size(); k++)
	  if ( Helper::realnum( (*m[k])(r,c) ) ) x.push_back( (*m[k])(r,c) );
	(*mean)(r,c) = x.size() ? Statistics::mean( x ) : NaN ;
	(*sem)(r,c) = Statistics::sem( x );
      }
}


erp_summary_t rerp::summarize( const trials_t & trials ,
			       const std::vector<std::string> & by ,
			       const std::string & within )
{

  erp_summary_t s;
  s.by = by;
  s.within = within;

  // key -> unit -> trials
  std::map<std::string,std::map<std::string,std::vector<int> > > groups;

  for (int i=0; i<trials.size(); i++)
    {
      const std::string key = group_key( trials[i] , by );
      std::string unit = Helper::int2str( i );
      if ( within != "" )
	{
	  std::vector<std::string> w( 1 , within );
	  unit = group_key( trials[i] , w );
	}
      groups[ key ][ unit ].push_back( i );
    }

  std::map<std::string,std::map<std::string,std::vector<int> > >::const_iterator gg = groups.begin();
  while ( gg != groups.end() )
    {
      std::vector<Eigen::MatrixXd> units;

      std::map<std::string,std::vector<int> >::const_iterator uu = gg->second.begin();
      while ( uu != gg->second.end() )
	{
	  if ( within == "" )
	    units.push_back( trials[ uu->second[0] ].X );
	  else
	    {
	      // first stage: average this unit's trials
	      std::vector<const Eigen::MatrixXd*> m;
	      for (int k=0; k<uu->second.size(); k++) m.push_back( &trials[ uu->second[k] ].X );
	      Eigen::MatrixXd mu, se;
	      cell_stats( m , trials.nc() , trials.nt() , &mu , &se );
	      units.push_back( mu );
	    }
	  ++uu;
	}

      std::vector<const Eigen::MatrixXd*> m;
      for (int k=0; k<units.size(); k++) m.push_back( &units[k] );
      cell_stats( m , trials.nc() , trials.nt() , &s.mean[ gg->first ] , &s.sem[ gg->first ] );
      s.n[ gg->first ] = units.size();
      ++gg;
    }

  return s;
}


coef_summary_t rerp::coef_summary( const std::map<std::string,group_fit_t> & groups )
{

  if ( groups.size() == 0 )
    throw rerp_error( "no groups to summarize" );

  const rerp_fit_t & f0 = groups.begin()->second.fit;

  coef_summary_t s;
  s.terms = f0.terms;
  s.channels = f0.channels;
  s.time = f0.time;
  s.ngroups = groups.size();

  std::map<std::string,group_fit_t>::const_iterator gg = groups.begin();
  while ( gg != groups.end() )
    {
      const rerp_fit_t & f = gg->second.fit;
      if ( f.terms != s.terms || f.nc != f0.nc || f.nt != f0.nt )
	throw rerp_error( "group " + gg->first + " was fitted with different terms (" + Helper::stringize( f.terms ) + ")" );
      ++gg;
    }

  for (int j=0; j<s.terms.size(); j++)
    {
      // one channel x timepoint matrix of this coefficient per group
      std::vector<Eigen::MatrixXd> b;
      gg = groups.begin();
      while ( gg != groups.end() )
	{
	  const rerp_fit_t & f = gg->second.fit;
	  Eigen::MatrixXd m( f.nc , f.nt );
	  for (int ch=0; ch<f.nc; ch++)
	    m.row( ch ) = f.beta( ch ).row( j );
	  b.push_back( m );
	  ++gg;
	}

      std::vector<const Eigen::MatrixXd*> m;
      for (int k=0; k<b.size(); k++) m.push_back( &b[k] );
      cell_stats( m , f0.nc , f0.nt , &s.mean[ s.terms[j] ] , &s.sem[ s.terms[j] ] );
    }

  return s;
}


std::vector<win_avg_t> rerp::window_averages( const trials_t & trials ,
					      const double start_ms ,
					      const double stop_ms ,
					      const std::vector<std::string> & by )
{

  std::vector<int> tps;
  for (int t=0; t<trials.nt(); t++)
    if ( trials.time[t] >= start_ms && trials.time[t] < stop_ms ) tps.push_back( t );

  if ( tps.size() == 0 )
    throw empty_window_error( "no timepoints in " + Helper::dbl2str( start_ms ) + " to " + Helper::dbl2str( stop_ms ) + " ms" );

  // key -> channel -> per-trial window means
  std::map<std::string,std::vector<std::vector<double> > > vals;

  for (int i=0; i<trials.size(); i++)
    {
      std::vector<std::vector<double> > & v = vals[ group_key( trials[i] , by ) ];
      if ( v.size() == 0 ) v.resize( trials.nc() );
      for (int ch=0; ch<trials.nc(); ch++)
	{
	  std::vector<double> x;
	  for (int k=0; k<tps.size(); k++)
	    if ( Helper::realnum( trials[i].X( ch , tps[k] ) ) ) x.push_back( trials[i].X( ch , tps[k] ) );
	  if ( x.size() ) v[ch].push_back( Statistics::mean( x ) );
	}
    }

  std::vector<win_avg_t> res;
  std::map<std::string,std::vector<std::vector<double> > >::const_iterator vv = vals.begin();
  while ( vv != vals.end() )
    {
      for (int ch=0; ch<trials.nc(); ch++)
	{
	  win_avg_t a;
	  a.key = vv->first;
	  a.ch = ch;
	  a.n = vv->second[ch].size();
	  a.mean = Statistics::mean( vv->second[ch] );
	  res.push_back( a );
	}
      ++vv;
    }

  return res;
}
