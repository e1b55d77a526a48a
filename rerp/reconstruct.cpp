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

#include "rerp/reconstruct.h"
#include "rerp/errors.h"

#include "helper/helper.h"

#include <limits>


waveform_t rerp::reconstruct( const rerp_fit_t & fit ,
			      const design_t & design ,
			      const condition_t & condition ,
			      const int ch )
{

  if ( ch < 0 || ch >= fit.nc )
    throw rerp_error( "channel index " + Helper::int2str( ch ) + " out of range" );

  if ( design.terms != fit.terms )
    throw rerp_error( "design does not match the fitted terms" );

  // applies the fitted coding; throws unsupported_condition_error
  Eigen::VectorXd x = design.encode( condition.preds );

  waveform_t w;
  w.label = condition.label;
  w.channel = fit.channels[ ch ];
  w.time = fit.time;
  w.v = Eigen::VectorXd::Constant( fit.nt , std::numeric_limits<double>::quiet_NaN() );

  for (int t=0; t<fit.nt; t++)
    if ( fit.complete( ch , t ) )
      w.v[t] = x.dot( fit( ch , t ).beta );

  return w;
}


std::vector<waveform_t> rerp::reconstruct( const rerp_fit_t & fit ,
					   const design_t & design ,
					   const condition_t & condition )
{
  std::vector<waveform_t> w;
  for (int ch=0; ch<fit.nc; ch++)
    w.push_back( reconstruct( fit , design , condition , ch ) );
  return w;
}
