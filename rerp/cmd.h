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

#ifndef __RERP_CMD_H__
#define __RERP_CMD_H__

#include <iostream>
#include <string>
#include <map>
#include <vector>

#include "rerp/trials.h"
#include "rerp/design.h"
#include "rerp/regress.h"
#include "rerp/reconstruct.h"
#include "rerp/winstats.h"
#include "rerp/summary.h"

struct param_t;

namespace rerp {

  // fit a long-format table: data=, ch=, keys=, cat=, ref=, cont=, ...
  void run_wrapper( param_t & param );

  // synthetic two-condition experiment: ntrials=, ntp=, effect=, from=, to=, seed=
  void simulate_wrapper( param_t & param );

  // model specification from cat=, ref=, levels=, cont=, center=, zscore=, invert=, inter=
  model_spec_t model_spec( const param_t & param );

  // categorical predictors at their reference level, continuous ones at the
  // raw value that encodes to zero
  condition_t reference_condition( const design_t & design , const std::string & label = "" );

  // zero=pred[:value] : a bare pred is held at the value that encodes to
  // zero (its reference level, or its centre); pred:value gives a raw value
  std::map<std::string,pred_value_t> zero_overrides( const param_t & param , const design_t & design );

  // tab-delimited result tables
  void print_coefs( std::ostream & out , const rerp_fit_t & fit , const std::string & group = "" );
  void print_waveforms( std::ostream & out , const std::vector<waveform_t> & w );
  void print_winstats( std::ostream & out , const rerp_fit_t & fit , const std::vector<window_stat_t> & s , const bool points );
  void print_summary( std::ostream & out , const trials_t & trials , const erp_summary_t & s , const std::string & type );
  void print_coef_summary( std::ostream & out , const coef_summary_t & s );

}

#endif
