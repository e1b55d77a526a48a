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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  const int n = s.size();
  int n2 = 0;
  for (int i=0; i<n; i++) { if ( ! ( s[i] == '"' || s[i] == q2 ) ) ++n2; }
  if ( n2 == n ) return s;
  std::string r( n2 , ' ' );
  int j = 0;
  for	(int i=0; i<n; i++)
    {
      if ( ! ( s[i] == '"' || s[i] == q2 ) )
	{
	  r[j] = s[i];
	  ++j;
	}
    }
  return r;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv("HOME");
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}

void Helper::halt( const std::string & msg )
{

  // some other code handles the exit, e.g. library mode
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  // do not kill the process?
  if ( ! globals::bail_on_fail ) return;

  // switch logger off , i.e. as we don't want close-out msg
  logger.off();

  // generic bail function (not using logger)
  std::cerr << "error : " << msg << "\n";

  std::exit(1);
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

bool Helper::realnum(double d)
{
  double zero = 0;
  if (d != d || d == 1/zero || d == -1/zero)
    return false;
  else
    return true;
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(uint64_t n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else  (including empty, i.e. 'var'  --> 'var=T'
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

std::vector<std::string> Helper::parse(const std::string & item, const char s , bool empty )
{
  return Helper::char_split( item , s , empty );
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{
  if ( s.size() == 1 ) return Helper::char_split( item , s[0] , empty );
  if ( s.size() == 2 ) return Helper::char_split( item , s[0] , s[1] , empty );
  Helper::halt("silly internal error in parse/char_split");
  std::vector<std::string> dummy;
  return dummy;
}

std::vector<std::string> Helper::quoted_parse(const std::string & item , const char s , const char q , const char q2, bool empty )
{
  return Helper::quoted_char_split( item , s , q, q2, empty );
}

std::vector<std::string> Helper::quoted_parse(const std::string & item , const std::string & s , const char q , const char q2, bool empty )
{
  if ( s.size() == 1 ) return Helper::quoted_char_split( item , s[0] , q, q2, empty );
  if ( s.size() == 2 ) return Helper::quoted_char_split( item , s[0] , s[1] , q, q2, empty );
  Helper::halt("silly internal error in parse/char_split");
  std::vector<std::string> dummy;
  return dummy;
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{
  return Helper::char_split( s , c , c , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , bool empty )
{
  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c || s[j] == c2 )
	{
	  if ( j == p ) // empty slot?
	    {
	      if (empty) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}

std::vector<std::string> Helper::quoted_char_split( const std::string & s , const char c , const char q , const char q2, bool empty )
{
  return Helper::quoted_char_split( s , c , c , q , q2 , empty );
}

std::vector<std::string> Helper::quoted_char_split( const std::string & s , const char c , const char c2 , const char q , const char q2 , bool empty )
{

  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  bool in_quote = false;

  for (int j=0; j<s.size(); j++)
    {

      if ( s[j] == '"' || s[j] == q || s[j] == q2 ) in_quote = ! in_quote;

      if ( (!in_quote) && ( s[j] == c || s[j] == c2 ) )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}


// https://stackoverflow.com/questions/6089231/getting-std-ifstream-to-handle-lf-cr-and-crlf

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {

      int c = sb->sbumpc();

      switch (c)
	{
	case '\n':
	  return is;

	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

 	case EOF :
 	  // Also handle the case when the last line has no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;

	default:
	  t += (char)c;
	}
    }
}


bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }
  return false;
}


bool Helper::swap_in_includes( std::string * t ,
			       const std::string & delim )
{

  bool changed = false;

  // includes must be in the form @{include}

  std::string s;

  for (int i=0;i<t->size();i++)
    {

      if ( (*t)[i] != '@' ) { s = s + (*t)[i]; continue; }
      ++i;
      changed = true;

      if ( i == t->size() ) Helper::halt( "badly formed @{include}:" + *t );
      if ( (*t)[i] != '{' ) Helper::halt( "badly formed @{include}:" + *t );

      std::string filename;
      while (1)
	{
	  ++i;
	  if ( i == t->size() ) Helper::halt( "badly formed @{include}" );
	  if ( (*t)[i] != '}' ) filename += (*t)[i];
	  else break;
	}

      if ( ! Helper::fileExists( filename ) )
	Helper::halt( "could not find @{include} file: " + filename );

      std::string insert;
      std::ifstream IN( filename.c_str() , std::ios::in );
      while ( ! IN.eof() )
	{
	  std::string item;
	  if ( ! ( IN >> item ) ) break;
	  if ( insert != "" ) insert += delim ;
	  insert += item;
	}
      IN.close();
      s += insert;
    }

  *t = s;

  return changed;
}
