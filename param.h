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

#ifndef __RERP_PARAM_H__
#define __RERP_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>
#include <sstream>

//
// Helper to parse command syntax: key=value options
//

struct param_t
{

 public:

  void add( const std::string & option , const std::string & value = "" );

  int size() const;

  void parse( const std::string & s );

  // swap in any @{includes}
  void update();

  void clear();

  bool has(const std::string & s ) const;

  bool empty(const std::string & s ) const;

  bool yesno(const std::string & s ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;

  std::string requires( const std::string & s , const bool uppercase = false ) const;

  int requires_int( const std::string & s ) const;

  double requires_dbl( const std::string & s ) const;

  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  std::set<std::string> strset( const std::string & k , const std::string delim = "," , const bool uppercase = false ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string delim = "," , const bool uppercase = false ) const;

  std::vector<double> dblvector( const std::string & k , const std::string delim = "," ) const;

private:

  std::map<std::string,std::string> opt;

};


#endif
