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

#ifndef __RERP_REGRESS_H__
#define __RERP_REGRESS_H__

#include <Eigen/Dense>

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <map>

#include "rerp/trials.h"
#include "rerp/design.h"
#include "rerp/ols.h"

struct param_t;

// checked between timepoints by the workers

struct cancel_t {

  cancel_t() : flag( false ) { }

  void cancel() { flag = true; }

  void reset() { flag = false; }

  bool cancelled() const { return flag; }

 private:

  std::atomic<bool> flag;

};


struct rerp_fit_t;

struct rerp_opts_t {

  rerp_opts_t() : nthreads( 0 ) , max_condition( 1e8 ) , cancel( NULL ) , partial( NULL ) { }

  // 0 : hardware concurrency
  int nthreads;

  double max_condition;

  // optional, not owned
  cancel_t * cancel;

  // optional, not owned: if a fit fails, receives the estimates completed
  // so far (to pass back as 'previous') before the error is rethrown
  rerp_fit_t * partial;

  // threads=N cond-th=X
  void set( const param_t & param );

};


struct exclusion_t {
  int ch;
  int t;
  std::vector<int> trials;
};


// estimates for every (channel, timepoint)

struct rerp_fit_t {

  rerp_fit_t() : nc( 0 ) , nt( 0 ) , np( 0 ) , n( 0 ) , cancelled( false ) { }

  std::vector<std::string> channels;
  std::vector<double> time;
  std::vector<std::string> terms;

  int nc, nt, np, n;

  // shared read-only decomposition of the full design
  std::shared_ptr<const ols_t> ols;

  // ch * nt + t
  std::vector<coef_t> coef;

  // run was stopped before all slots were filled
  bool cancelled;

  const coef_t & operator()( const int ch , const int t ) const { return coef[ ch * nt + t ]; }

  bool complete( const int ch , const int t ) const { return coef[ ch * nt + t ].complete; }

  bool complete() const;

  int ncomplete() const;

  // p x nt coefficients for one channel; NaN where not fitted
  Eigen::MatrixXd beta( const int ch ) const;

  // -1 if absent
  int term( const std::string & label ) const;

  // every fit that dropped trials for missing data
  std::vector<exclusion_t> exclusions() const;

};


// per-group fits (e.g. per Subject)

struct group_fit_t {
  std::string level;
  trials_t trials;
  design_t design;
  rerp_fit_t fit;
};


namespace rerp {

  // fit every (channel, timepoint); with 'previous', slots already complete
  // there are copied and only the rest are fitted
  rerp_fit_t regress( const trials_t & trials ,
		      const design_t & design ,
		      const rerp_opts_t & opts ,
		      const rerp_fit_t * previous = NULL );

  // build a design and fit separately within each level of a descriptor
  std::map<std::string,group_fit_t> regress_by_group( const trials_t & trials ,
						      const model_spec_t & spec ,
						      const std::string & descriptor ,
						      const rerp_opts_t & opts );

  // fitted voltages per trial, optionally with predictors held at fixed raw values
  trials_t predict( const trials_t & trials ,
		    const design_t & design ,
		    const rerp_fit_t & fit ,
		    const std::map<std::string,pred_value_t> & overrides = std::map<std::string,pred_value_t>() );

  // observed - fitted
  trials_t residuals( const trials_t & trials ,
		      const design_t & design ,
		      const rerp_fit_t & fit ,
		      const std::map<std::string,pred_value_t> & overrides = std::map<std::string,pred_value_t>() );

}

#endif
