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

#ifndef __RERP_SIMULATE_H__
#define __RERP_SIMULATE_H__

#include "rerp/trials.h"

struct param_t;

// two-condition synthetic experiment: condition A (reference) and B,
// B carrying an extra 'effect' on timepoints from..to (inclusive)

struct sim_spec_t {

  sim_spec_t()
    : ntrials( 100 ) , ntp( 50 ) , nch( 1 ) , nsubj( 1 ) ,
      effect( 2 ) , from( 10 ) , to( 30 ) ,
      base( 3 ) , slope( 0 ) , noise( 1 ) , missing( 0 ) ,
      step( 4 ) , seed( 1 ) { }

  int ntrials;
  int ntp;
  int nch;
  int nsubj;

  double effect;
  int from, to;

  // amplitude of the condition-A waveform (one sine cycle over the epoch)
  double base;

  // uV per unit of the continuous predictor 'cloze' (uniform 0..1)
  double slope;

  // sd of additive Gaussian noise
  double noise;

  // proportion of samples set missing
  double missing;

  // ms per timepoint
  double step;

  long unsigned seed;

  // ntrials=.. ntp=.. nch=.. nsubj=.. effect=.. from=.. to=.. base=.. slope=.. noise=.. missing=.. seed=..
  void set( const param_t & param );

};


namespace rerp {

  // predictors: Condition (A/B) and cloze; descriptors: Subject, ItemNum
  trials_t simulate( const sim_spec_t & spec );

  // noise-free voltage of a condition at timepoint t (cloze = 0)
  double simulated_erp( const sim_spec_t & spec , const bool b , const int t );

}

#endif
