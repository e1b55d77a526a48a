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

#include "rerp/winstats.h"
#include "rerp/errors.h"

#include "stats/statistics.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"
#include "param.h"

#include <cmath>
#include <limits>

extern logger_t logger;


correction_t correction_type( const std::string & s )
{
  const std::string u = Helper::toupper( s );
  if ( u == "NONE" ) return ADJ_NONE;
  if ( u == "BONF" || u == "BONFERRONI" ) return ADJ_BONFERRONI;
  if ( u == "HOLM" ) return ADJ_HOLM;
  if ( u == "FDR" || u == "BH" || u == "FDR_BH" ) return ADJ_FDR_BH;
  if ( u == "BY" || u == "FDR_BY" ) return ADJ_FDR_BY;
  throw rerp_error( "unknown correction method " + s + " (none, bonf, holm, fdr, by)" );
}

std::string correction_label( const correction_t adj )
{
  if ( adj == ADJ_NONE ) return "NONE";
  if ( adj == ADJ_BONFERRONI ) return "BONF";
  if ( adj == ADJ_HOLM ) return "HOLM";
  if ( adj == ADJ_FDR_BH ) return "FDR_BH";
  return "FDR_BY";
}


void winstats_opts_t::set( const param_t & param )
{
  if ( param.has( "adj" ) )
    adj = correction_type( param.value( "adj" ) );

  if ( param.has( "alpha" ) )
    {
      alpha = param.requires_dbl( "alpha" );
      if ( alpha <= 0 || alpha >= 1 ) Helper::halt( "alpha must be between 0 and 1" );
    }

  if ( param.has( "per-channel" ) )
    per_channel = param.yesno( "per-channel" );
}


window_t window_t::ms( const std::string & label ,
		       const std::vector<double> & time ,
		       const double start_ms ,
		       const double stop_ms ,
		       const std::vector<int> & channels )
{
  window_t w( label , 0 , -1 , channels );
  bool first = true;
  for (int t=0; t<time.size(); t++)
    {
      if ( time[t] < start_ms || time[t] >= stop_ms ) continue;
      if ( first ) { w.start = t; first = false; }
      w.stop = t;
    }
  return w;
}


contrast_t contrast_t::difference( const design_t & design ,
				   const condition_t & a ,
				   const condition_t & b ,
				   const std::string & label )
{
  Eigen::VectorXd d = design.encode( a.preds ) - design.encode( b.preds );
  contrast_t c( label != "" ? label : a.label + "-" + b.label );
  for (int j=0; j<d.size(); j++)
    if ( d[j] != 0 ) c.weights[ design.terms[j] ] = d[j];
  return c;
}

Eigen::VectorXd contrast_t::vector( const design_t & design ) const
{
  Eigen::VectorXd c = Eigen::VectorXd::Zero( design.cols() );
  std::map<std::string,double>::const_iterator ww = weights.begin();
  while ( ww != weights.end() )
    {
      const int j = design.column( ww->first );
      if ( j == -1 )
	throw undefined_contrast_error( "contrast " + label + " references term " + ww->first + " not in the design" );
      c[j] = ww->second;
      ++ww;
    }
  if ( c.isZero( 0 ) )
    throw undefined_contrast_error( "contrast " + label + " has no non-zero weights" );
  return c;
}


// test of the mean of c'b over a set of (channel, timepoint) fits. Each
// trial's residual is averaged over the fits it entered; every trial with
// at least one residual is kept. With no exclusions this is the OLS test of
// the cell-averaged response.

struct cell_test_t {
  double est, se, t, p;
  int df, n;
};

static cell_test_t cell_test( const rerp_fit_t & fit ,
			      const std::vector<std::pair<int,int> > & cells ,
			      const Eigen::VectorXd & c ,
			      const std::string & label )
{

  const int n = fit.n;
  const int p = fit.np;
  const int nc = cells.size();

  cell_test_t r;

  r.est = 0;
  for (int k=0; k<nc; k++)
    r.est += c.dot( fit( cells[k].first , cells[k].second ).beta );
  r.est /= (double)nc;

  std::vector<int> rows;
  Eigen::VectorXd rbar = Eigen::VectorXd::Zero( n );
  int nr = 0;
  for (int i=0; i<n; i++)
    {
      double s = 0;
      int m = 0;
      for (int k=0; k<nc; k++)
	{
	  const double e = fit( cells[k].first , cells[k].second ).resid[i];
	  if ( ! Helper::realnum( e ) ) continue;
	  s += e;
	  ++m;
	}
      if ( m == 0 ) continue;
      rows.push_back( i );
      rbar[ nr++ ] = s / (double)m;
    }
  rbar.conservativeResize( nr );

  r.n = nr;
  r.df = nr - p;

  // the rows are a superset of any single fit's rows, so only a fit table
  // not produced by regress() can get here
  if ( r.df <= 0 )
    throw rerp_error( label + ": only " + Helper::int2str( nr ) + " trials with data" );

  double vc;
  if ( nr == n )
    vc = c.dot( fit.ols->VX * c );
  else
    {
      ols_t w = fit.ols->reduced( rows , label );
      vc = c.dot( w.VX * c );
    }

  const double s2 = rbar.squaredNorm() / (double)r.df;

  r.se = sqrt( s2 * vc );
  r.t = r.est / r.se;
  r.p = Statistics::t_prob( r.t , r.df );

  return r;
}


std::vector<window_stat_t> rerp::window_stats( const rerp_fit_t & fit ,
					       const design_t & design ,
					       const std::vector<window_t> & windows ,
					       const std::vector<contrast_t> & contrasts ,
					       const winstats_opts_t & opts )
{

  if ( design.terms != fit.terms )
    throw rerp_error( "design does not match the fitted terms" );

  //
  // validate inputs up front
  //

  for (int w=0; w<windows.size(); w++)
    {
      const window_t & win = windows[w];
      if ( win.size() == 0 )
	throw empty_window_error( "window " + win.label + " contains no timepoints" );
      if ( win.start < 0 || win.stop >= fit.nt )
	throw empty_window_error( "window " + win.label + " timepoints "
				  + Helper::int2str( win.start ) + "-" + Helper::int2str( win.stop )
				  + " outside 0-" + Helper::int2str( fit.nt - 1 ) );
      if ( win.channels.size() == 0 )
	throw empty_window_error( "window " + win.label + " has no channels" );
      for (int k=0; k<win.channels.size(); k++)
	if ( win.channels[k] < 0 || win.channels[k] >= fit.nc )
	  throw empty_window_error( "window " + win.label + " channel index "
				    + Helper::int2str( win.channels[k] ) + " out of range" );
      for (int k=0; k<win.channels.size(); k++)
	for (int t=win.start; t<=win.stop; t++)
	  if ( ! fit.complete( win.channels[k] , t ) )
	    throw rerp_error( "window " + win.label + " includes timepoints that were not fitted" );
    }

  std::vector<Eigen::VectorXd> cvec;
  for (int c=0; c<contrasts.size(); c++)
    cvec.push_back( contrasts[c].vector( design ) );

  //
  // tests
  //

  std::vector<window_stat_t> res;

  for (int w=0; w<windows.size(); w++)
    {
      const window_t & win = windows[w];

      // channel sets: pooled, or one per channel
      std::vector<std::vector<int> > chsets;
      if ( opts.per_channel )
	for (int k=0; k<win.channels.size(); k++)
	  chsets.push_back( std::vector<int>( 1 , win.channels[k] ) );
      else
	chsets.push_back( win.channels );

      for (int c=0; c<contrasts.size(); c++)
	for (int s=0; s<chsets.size(); s++)
	  {
	    const std::vector<int> & chs = chsets[s];

	    window_stat_t ws;
	    ws.window = win.label;
	    ws.contrast = contrasts[c].label;
	    ws.ch = opts.per_channel ? chs[0] : -1;
	    ws.start = win.start;
	    ws.stop = win.stop;

	    const std::string label = globals::window_strat + "=" + win.label + " "
	      + globals::contrast_strat + "=" + contrasts[c].label
	      + ( opts.per_channel ? " " + globals::signal_strat + "=" + fit.channels[ chs[0] ] : "" );

	    std::vector<std::pair<int,int> > all;

	    for (int t=win.start; t<=win.stop; t++)
	      {
		std::vector<std::pair<int,int> > cells;
		for (int k=0; k<chs.size(); k++)
		  cells.push_back( std::make_pair( chs[k] , t ) );
		all.insert( all.end() , cells.begin() , cells.end() );

		cell_test_t ct = cell_test( fit , cells , cvec[c] ,
					    label + " " + globals::time_strat + "=" + Helper::dbl2str( fit.time[t] ) );
		point_stat_t pt;
		pt.t = t;
		pt.est = ct.est;
		pt.se = ct.se;
		pt.tstat = ct.t;
		pt.p = ct.p;
		ws.points.push_back( pt );
	      }

	    cell_test_t wt = cell_test( fit , all , cvec[c] , label );
	    ws.mean = wt.est;
	    ws.se = wt.se;
	    ws.t = wt.t;
	    ws.df = wt.df;
	    ws.n = wt.n;
	    ws.p = wt.p;

	    res.push_back( ws );
	  }
    }

  //
  // multiple-comparison correction over the whole family
  //

  Eigen::VectorXd pv( res.size() );
  for (int i=0; i<res.size(); i++) pv[i] = res[i].p;

  Eigen::MatrixXd adj = Statistics::p_adjust( pv );

  for (int i=0; i<res.size(); i++)
    {
      if ( res[i].p < 0 ) { res[i].p_adj = -9; res[i].sig = false; continue; }
      if ( opts.adj == ADJ_NONE ) res[i].p_adj = res[i].p;
      else if ( opts.adj == ADJ_BONFERRONI ) res[i].p_adj = adj(i,0);
      else if ( opts.adj == ADJ_HOLM ) res[i].p_adj = adj(i,1);
      else if ( opts.adj == ADJ_FDR_BH ) res[i].p_adj = adj(i,2);
      else res[i].p_adj = adj(i,3);
      res[i].sig = res[i].p_adj < opts.alpha;
    }

  int nsig = 0;
  for (int i=0; i<res.size(); i++) if ( res[i].sig ) ++nsig;

  logger << "  " << res.size() << " window tests (" << correction_label( opts.adj )
	 << " correction, alpha " << opts.alpha << "): " << nsig << " significant\n";

  return res;
}
