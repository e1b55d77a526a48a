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

#ifndef __RERP_DEFS_H__
#define __RERP_DEFS_H__

#include <string>
#include <set>

#include "param.h"

struct globals
{

  static std::string version;
  static std::string date;

  // return code for the driver
  static int retcode;

  // label of missing values in input tables
  static std::string missing_value_label;

  // column delimiter for input tables
  static char table_delimiter;

  // output common stratifier labels
  static std::string time_strat;
  static std::string signal_strat;
  static std::string term_strat;
  static std::string cond_strat;
  static std::string window_strat;
  static std::string contrast_strat;
  static std::string group_strat;

  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // if T, no logging to the console
  static bool silent;

  // if LOG verbose?
  static bool verbose;

  // cache logger output (retrieved by logger.print_buffer())
  static bool cache_log;

  // embedded (library) mode
  static bool api_mode;

  // generic global parameters
  static param_t param;

  static bool bail_on_fail;

  // global functions: primary initiation of all globals
  void init_defs();

  // library mode: quiet, and halt() throws rather than exits
  void api();

};

#endif
