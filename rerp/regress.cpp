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

#include "rerp/regress.h"
#include "rerp/pool.h"
#include "rerp/errors.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"
#include "param.h"

#include <exception>
#include <future>
#include <limits>

extern logger_t logger;


void rerp_opts_t::set( const param_t & param )
{
  if ( param.has( "threads" ) )
    {
      nthreads = param.requires_int( "threads" );
      if ( nthreads < 0 ) Helper::halt( "threads must be 0 (all cores) or positive" );
    }

  if ( param.has( "cond-th" ) )
    {
      max_condition = param.requires_dbl( "cond-th" );
      if ( ! ( max_condition > 1 ) ) Helper::halt( "cond-th must be greater than 1" );
    }
}


bool rerp_fit_t::complete() const
{
  return ncomplete() == coef.size();
}

int rerp_fit_t::ncomplete() const
{
  int c = 0;
  for (int i=0; i<coef.size(); i++)
    if ( coef[i].complete ) ++c;
  return c;
}

Eigen::MatrixXd rerp_fit_t::beta( const int ch ) const
{
  Eigen::MatrixXd B = Eigen::MatrixXd::Constant( np , nt , std::numeric_limits<double>::quiet_NaN() );
  for (int t=0; t<nt; t++)
    if ( complete( ch , t ) ) B.col(t) = (*this)( ch , t ).beta;
  return B;
}

int rerp_fit_t::term( const std::string & label ) const
{
  for (int j=0; j<terms.size(); j++)
    if ( terms[j] == label ) return j;
  return -1;
}

std::vector<exclusion_t> rerp_fit_t::exclusions() const
{
  std::vector<exclusion_t> ex;
  for (int ch=0; ch<nc; ch++)
    for (int t=0; t<nt; t++)
      {
	const coef_t & c = (*this)( ch , t );
	if ( c.excluded.size() == 0 ) continue;
	exclusion_t e;
	e.ch = ch;
	e.t = t;
	e.trials = c.excluded;
	ex.push_back( e );
      }
  return ex;
}


rerp_fit_t rerp::regress( const trials_t & trials ,
			  const design_t & design ,
			  const rerp_opts_t & opts ,
			  const rerp_fit_t * previous )
{

  if ( trials.size() != design.rows() )
    throw design_error( "design has " + Helper::int2str( design.rows() ) + " rows but there are "
			+ Helper::int2str( trials.size() ) + " trials" );

  rerp_fit_t fit;
  fit.channels = trials.channels;
  fit.time = trials.time;
  fit.terms = design.terms;
  fit.nc = trials.nc();
  fit.nt = trials.nt();
  fit.np = design.cols();
  fit.n = trials.size();

  //
  // a single decomposition, shared by every fit
  //

  if ( previous != NULL )
    {
      if ( previous->nc != fit.nc || previous->nt != fit.nt || previous->terms != fit.terms
	   || previous->ols == NULL
	   || previous->ols->X.rows() != design.X.rows() || previous->ols->X.cols() != design.X.cols()
	   || previous->ols->X != design.X )
	throw rerp_error( "cannot resume: previous estimates were made on a different design or trial table" );
      fit.ols = previous->ols;
      fit.coef = previous->coef;
    }
  else
    {
      fit.ols = std::make_shared<const ols_t>( design.X , opts.max_condition );
      fit.coef.resize( fit.nc * fit.nt );
    }

  std::shared_ptr<const ols_t> ols = fit.ols;

  // timepoints with at least one missing estimate
  std::vector<int> todo;
  for (int t=0; t<fit.nt; t++)
    for (int ch=0; ch<fit.nc; ch++)
      if ( ! fit.complete( ch , t ) ) { todo.push_back( t ); break; }

  if ( previous != NULL )
    logger << "  resuming: " << fit.ncomplete() << " of " << fit.coef.size() << " estimates already complete\n";

  logger << "  fitting " << todo.size() << " timepoints x " << fit.nc << " channels, "
	 << fit.n << " trials, " << fit.np << " terms (condition number "
	 << Helper::dbl2str( ols->condition , 4 ) << ")\n";

  //
  // fan out over timepoints; each task fills its own slots
  //

  std::atomic<bool> failed( false );

  std::vector<std::future<void> > results;

  pool_t pool( opts.nthreads );

  for (int k=0; k<todo.size(); k++)
    {
      const int t = todo[k];
      results.push_back( pool.enqueue( [&fit,&trials,&failed,ols,&opts,t]() {
	    if ( failed ) return;
	    if ( opts.cancel != NULL && opts.cancel->cancelled() ) return;
	    try
	      {
		for (int ch=0; ch<fit.nc; ch++)
		  {
		    if ( fit.complete( ch , t ) ) continue;
		    const std::string label = globals::signal_strat + "=" + fit.channels[ch] + " "
		      + globals::time_strat + "=" + Helper::dbl2str( fit.time[t] );
		    fit.coef[ ch * fit.nt + t ] = ols->fit( trials.response( ch , t ) , label );
		  }
	      }
	    catch ( ... )
	      {
		// stop remaining tasks; the error reaches the caller via the future
		failed = true;
		throw;
	      }
	  } ) );
    }

  // wait for all tasks, keeping the first error
  std::exception_ptr err;
  for (int k=0; k<results.size(); k++)
    {
      try { results[k].get(); }
      catch ( ... )
	{
	  if ( ! err ) err = std::current_exception();
	  failed = true;
	}
    }

  pool.shutdown();

  if ( err )
    {
      if ( opts.partial != NULL )
	{
	  fit.cancelled = true;
	  *opts.partial = fit;
	  logger << "  stopped on error: " << fit.ncomplete() << " of " << fit.coef.size()
		 << " estimates complete and kept\n";
	}
      std::rethrow_exception( err );
    }

  fit.cancelled = ! fit.complete();

  if ( fit.cancelled )
    logger << "  cancelled: " << fit.ncomplete() << " of " << fit.coef.size() << " estimates complete\n";

  //
  // missing data summary
  //

  std::vector<exclusion_t> ex = fit.exclusions();
  if ( ex.size() )
    {
      int tot = 0;
      for (int i=0; i<ex.size(); i++) tot += ex[i].trials.size();
      Helper::warn( "excluded trials with missing data in " + Helper::int2str( (int)ex.size() )
		    + " fits (" + Helper::int2str( tot ) + " trial-fits in total)" );
      if ( globals::verbose )
	for (int i=0; i<ex.size(); i++)
	  logger << "   " << globals::signal_strat << "=" << fit.channels[ ex[i].ch ]
		 << " " << globals::time_strat << "=" << fit.time[ ex[i].t ]
		 << " : " << ex[i].trials.size() << " trial(s)\n";
    }

  return fit;
}


std::map<std::string,group_fit_t> rerp::regress_by_group( const trials_t & trials ,
							  const model_spec_t & spec ,
							  const std::string & descriptor ,
							  const rerp_opts_t & opts )
{
  std::map<std::string,group_fit_t> res;

  std::set<std::string> lvls = trials.levels( descriptor );

  if ( lvls.size() == 0 )
    throw design_error( "no levels of " + descriptor + " found" );

  std::set<std::string>::const_iterator ll = lvls.begin();
  while ( ll != lvls.end() )
    {
      logger << "  " << globals::group_strat << ": " << descriptor << "=" << *ll << "\n";
      group_fit_t & g = res[ *ll ];
      g.level = *ll;
      g.trials = trials.subset( trials.rows( descriptor , *ll ) );
      g.design = design_t::build( g.trials , spec );
      g.fit = regress( g.trials , g.design , opts );
      ++ll;
    }

  return res;
}


// design row of one trial, with some predictors held fixed

static Eigen::VectorXd trial_row( const trials_t & trials ,
				  const design_t & design ,
				  const int i ,
				  const std::map<std::string,pred_value_t> & overrides )
{
  if ( overrides.size() == 0 )
    return design.X.row(i).transpose();

  std::map<std::string,pred_value_t> values;
  for (int j=0; j<design.coding.size(); j++)
    {
      const std::string & nm = design.coding[j].name;
      std::map<std::string,pred_value_t>::const_iterator oo = overrides.find( nm );
      values[ nm ] = oo != overrides.end() ? oo->second : trials[i].preds.find( nm )->second;
    }
  return design.encode( values );
}


trials_t rerp::predict( const trials_t & trials ,
			const design_t & design ,
			const rerp_fit_t & fit ,
			const std::map<std::string,pred_value_t> & overrides )
{

  if ( trials.size() != design.rows() || trials.nc() != fit.nc || trials.nt() != fit.nt )
    throw design_error( "trials do not match the fitted model" );

  std::map<std::string,pred_value_t>::const_iterator oo = overrides.begin();
  while ( oo != overrides.end() )
    {
      bool found = false;
      for (int j=0; j<design.coding.size(); j++)
	if ( design.coding[j].name == oo->first ) found = true;
      if ( ! found )
	throw unsupported_condition_error( "predictor " + oo->first + " is not in the model" );
      ++oo;
    }

  std::vector<Eigen::MatrixXd> B( fit.nc );
  for (int ch=0; ch<fit.nc; ch++) B[ch] = fit.beta( ch );

  std::vector<Eigen::MatrixXd> V( trials.size() );

  for (int i=0; i<trials.size(); i++)
    {
      Eigen::VectorXd x = trial_row( trials , design , i , overrides );
      V[i].resize( fit.nc , fit.nt );
      for (int ch=0; ch<fit.nc; ch++)
	V[i].row(ch) = x.transpose() * B[ch];
    }

  return trials.with_voltages( V );
}


trials_t rerp::residuals( const trials_t & trials ,
			  const design_t & design ,
			  const rerp_fit_t & fit ,
			  const std::map<std::string,pred_value_t> & overrides )
{
  trials_t yhat = predict( trials , design , fit , overrides );

  std::vector<Eigen::MatrixXd> V( trials.size() );
  for (int i=0; i<trials.size(); i++)
    V[i] = trials[i].X - yhat[i].X;

  return trials.with_voltages( V );
}
