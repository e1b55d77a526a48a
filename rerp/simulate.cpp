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

#include "rerp/simulate.h"

#include "miscmath/crandom.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <cmath>
#include <limits>

extern logger_t logger;


void sim_spec_t::set( const param_t & param )
{
  if ( param.has( "ntrials" ) ) ntrials = param.requires_int( "ntrials" );
  if ( param.has( "ntp" ) ) ntp = param.requires_int( "ntp" );
  if ( param.has( "nch" ) ) nch = param.requires_int( "nch" );
  if ( param.has( "nsubj" ) ) nsubj = param.requires_int( "nsubj" );
  if ( param.has( "effect" ) ) effect = param.requires_dbl( "effect" );
  if ( param.has( "from" ) ) from = param.requires_int( "from" );
  if ( param.has( "to" ) ) to = param.requires_int( "to" );
  if ( param.has( "base" ) ) base = param.requires_dbl( "base" );
  if ( param.has( "slope" ) ) slope = param.requires_dbl( "slope" );
  if ( param.has( "noise" ) ) noise = param.requires_dbl( "noise" );
  if ( param.has( "missing" ) ) missing = param.requires_dbl( "missing" );
  if ( param.has( "seed" ) ) seed = param.requires_int( "seed" );

  if ( ntrials < 2 || ntp < 1 || nch < 1 || nsubj < 1 )
    Helper::halt( "bad simulation size: need ntrials >= 2, ntp, nch and nsubj >= 1" );

  if ( noise < 0 || missing < 0 || missing >= 1 )
    Helper::halt( "bad simulation noise or missing proportion" );
}


double rerp::simulated_erp( const sim_spec_t & spec , const bool b , const int t )
{
  const double v = spec.base * sin( 2.0 * M_PI * t / (double)spec.ntp );
  return b && t >= spec.from && t <= spec.to ? v + spec.effect : v ;
}


trials_t rerp::simulate( const sim_spec_t & spec )
{

  CRandom::srand( spec.seed );

  std::vector<std::string> channels;
  for (int c=0; c<spec.nch; c++)
    channels.push_back( spec.nch == 1 ? "Cz" : "CH" + Helper::int2str( c+1 ) );

  std::vector<double> time( spec.ntp );
  for (int t=0; t<spec.ntp; t++) time[t] = t * spec.step;

  trials_t trials( channels , time );

  // balanced conditions, random order
  std::vector<int> order( spec.ntrials );
  CRandom::random_draw( order );

  for (int i=0; i<spec.ntrials; i++)
    {
      const bool b = order[i] % 2 == 1;
      const double cloze = CRandom::rand();

      Eigen::MatrixXd X( spec.nch , spec.ntp );
      for (int c=0; c<spec.nch; c++)
	for (int t=0; t<spec.ntp; t++)
	  {
	    X(c,t) = simulated_erp( spec , b , t ) + spec.slope * cloze + CRandom::rnorm( 0 , spec.noise );
	    if ( spec.missing > 0 && CRandom::rand() < spec.missing )
	      X(c,t) = std::numeric_limits<double>::quiet_NaN();
	  }

      trial_t trial( X );
      trial.pred( "Condition" , b ? "B" : "A" );
      trial.pred( "cloze" , cloze );
      trial.descriptor( "Subject" , "S" + Helper::int2str( i % spec.nsubj + 1 ) );
      trial.descriptor( "ItemNum" , Helper::int2str( i + 1 ) );
      trials.add( trial );
    }

  logger << "  simulated " << spec.ntrials << " trials, " << spec.nch << " channel(s), "
	 << spec.ntp << " timepoints; effect " << spec.effect << " on timepoints "
	 << spec.from << "-" << spec.to << "\n";

  return trials;
}
