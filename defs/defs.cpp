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

#include "defs/defs.h"
#include "miscmath/crandom.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <ctime>
#include <stdexcept>

extern logger_t logger;

std::string globals::version;
std::string globals::date;

int globals::retcode;

std::string globals::missing_value_label;
char globals::table_delimiter;

std::string globals::time_strat;
std::string globals::signal_strat;
std::string globals::term_strat;
std::string globals::cond_strat;
std::string globals::window_strat;
std::string globals::contrast_strat;
std::string globals::group_strat;


bool globals::bail_on_fail;

param_t globals::param;

void (*globals::bail_function) ( const std::string & );


bool globals::silent;
bool globals::verbose;
bool globals::cache_log;
bool globals::api_mode;


void api_bail_function( const std::string & msg )
{
  throw( std::runtime_error( msg ) );
}

void globals::api()
{
  silent = true;
  api_mode = true;
  bail_function = &api_bail_function;
  bail_on_fail = false;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.4.1";

  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Set up RNG
  //

  CRandom::srand( time(0) );

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  bail_on_fail = true;

  //
  // Output
  //

  silent = false;

  verbose = false;

  cache_log = false;

  api_mode = false;

  //
  // Input tables
  //

  missing_value_label = "NA";

  table_delimiter = '\t';

  //
  // Output stratifiers
  //

  time_strat     = "T";
  signal_strat   = "CH";
  term_strat     = "TERM";
  cond_strat     = "COND";
  window_strat   = "WIN";
  contrast_strat = "CON";
  group_strat    = "GRP";

}
