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

#ifndef __RERP_RECONSTRUCT_H__
#define __RERP_RECONSTRUCT_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <map>

#include "rerp/trials.h"
#include "rerp/design.h"
#include "rerp/regress.h"

// a raw value for every predictor in the model

struct condition_t {

  condition_t() { }

  explicit condition_t( const std::string & label ) : label( label ) { }

  std::string label;

  std::map<std::string,pred_value_t> preds;

  condition_t & set( const std::string & name , const std::string & level ) { preds[ name ] = pred_value_t( level ); return *this; }

  condition_t & set( const std::string & name , const double x ) { preds[ name ] = pred_value_t( x ); return *this; }

};


struct waveform_t {

  std::string label;

  std::string channel;

  std::vector<double> time;

  // NaN where the estimate is not available
  Eigen::VectorXd v;

};


namespace rerp {

  // model prediction for 'condition' at every timepoint of one channel;
  // throws unsupported_condition_error
  waveform_t reconstruct( const rerp_fit_t & fit ,
			  const design_t & design ,
			  const condition_t & condition ,
			  const int ch );

  // all channels
  std::vector<waveform_t> reconstruct( const rerp_fit_t & fit ,
				       const design_t & design ,
				       const condition_t & condition );

}

#endif
