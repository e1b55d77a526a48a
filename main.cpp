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
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"
#include "rerp/cmd.h"
#include "rerp/errors.h"

#include <Eigen/Dense>
#include <boost/version.hpp>

#include <cstring>
#include <fstream>
#include <iostream>
#include <new>
#include <sstream>

//
// global resources
//

extern globals global;

extern logger_t logger;

std::string rerp_version();

void NoMem();

void include_param_file( const std::string & paramfile );


int main(int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << rerp_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "Boost v"
		<< BOOST_VERSION / 100000 << "."
		<< BOOST_VERSION / 100 % 1000 << "."
		<< BOOST_VERSION % 100 << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = rerp_version() +
    "primary usage: rerp data=file.tsv ch=c1,c2 keys=k1,k2 [time=Timestamp] [@param-file]\n"
    "                    [cat=p1 ref=lvl] [cont=p2] [center=p2|zscore=p2] [invert=p2:anchor] [inter=p1:p2]\n"
    "                    [window=LABEL:start:stop] [contrast=pred:a:b] [term=T]\n"
    "                    [adj=fdr|holm|bonf|by|none] [alpha=0.05] [threads=N] [cond-th=1e8]\n"
    "                    [by=Subject] [summary] [within=Subject] [estimate] [resid] [zero=pred]\n"
    "       rerp simulate [ntrials=100] [ntp=50] [effect=2] [from=10] [to=30] [seed=1]\n";

  //
  // degenerate command line?
  //

  if ( argc == 1 )
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }


  //
  // options: key=value, -flag, or @param-file
  //

  bool simulate = false;

  for (int i=1; i<argc; i++)
    {

      if ( i == 1 && strcmp( argv[i] , "simulate" ) == 0 )
	{
	  simulate = true;
	  continue;
	}

      if ( strcmp( argv[i] , "-h" ) == 0 || strcmp( argv[i] , "--help" ) == 0 )
	{
	  std::cerr << usage_msg;
	  std::exit(0);
	}

      if ( strcmp( argv[i] , "--log" ) == 0 )
	{
	  if ( i + 1 >= argc )
	    Helper::halt( "expecting a log file name after --log" );
	  logger.write_log( argv[ ++i ] );
	  continue;
	}

      if ( argv[i][0] == '@' )
	{
	  include_param_file( argv[i] );
	  continue;
	}

      if ( argv[i][0] == '-' )
	{
	  std::string f = argv[i];
	  globals::param.add( f.substr(1) );
	  continue;
	}

      globals::param.parse( argv[i] );
    }

  // swap in any @{file} includes
  globals::param.update();

  if ( globals::param.has( "silent" ) && globals::param.yesno( "silent" ) )
    globals::silent = true;

  if ( globals::param.has( "verbose" ) )
    globals::verbose = globals::param.yesno( "verbose" );

  if ( globals::param.has( "missing" ) && ! simulate )
    globals::missing_value_label = globals::param.value( "missing" );

  if ( globals::param.has( "delim" ) )
    {
      const std::string d = globals::param.value( "delim" );
      if ( d == "tab" ) globals::table_delimiter = '\t';
      else if ( d == "comma" ) globals::table_delimiter = ',';
      else if ( d == "space" ) globals::table_delimiter = ' ';
      else Helper::halt( "delim should be tab, comma or space" );
    }

  logger.banner( globals::version , globals::date );

  logger << "  options:\n" << globals::param.dump( "    " ) << "\n";


  //
  // run; modelling errors end the run as any other halt
  //

  try
    {
      if ( simulate )
	rerp::simulate_wrapper( globals::param );
      else
	rerp::run_wrapper( globals::param );
    }
  catch ( rerp_error & e )
    {
      Helper::halt( e.what() );
    }

  std::exit( globals::retcode );

}


std::string rerp_version()
{
  std::stringstream ss;
  ss << "rerp version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "rerp build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* You need fewer trials or a bigger computer...     *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}


//
// @param-file: one key=value (or key<tab>value) per line; '%' starts a comment
//

void include_param_file( const std::string & paramfile )
{

  const std::string f = Helper::expand( paramfile.substr(1) );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not open " + paramfile.substr(1) );

  std::ifstream INP( f.c_str() , std::ios::in );

  while ( ! INP.eof() )
    {
      std::string line;
      Helper::safe_getline( INP , line );
      if ( INP.eof() && line == "" ) break;
      line = Helper::lrtrim( line );
      if ( line == "" || line[0] == '%' ) continue;

      std::vector<std::string> tok = Helper::quoted_parse( line , "\t=" );
      if ( tok.size() == 1 )
	globals::param.add( tok[0] );
      else if ( tok.size() == 2 )
	globals::param.add( tok[0] , tok[1] );
      else
	Helper::halt( "bad line in " + paramfile.substr(1) + ": " + line );
    }

  INP.close();

}
