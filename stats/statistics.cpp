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

#include "stats/statistics.h"
#include "helper/helper.h"

#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <limits>


double Statistics::t_cdf( double x , double df )
{
  boost::math::students_t dist( df );
  return boost::math::cdf( dist , x );
}

double Statistics::t_prob( double T , double df )
{

  if ( ! Helper::realnum(T) ) return -9;

  if ( ! ( df > 0 ) || ! Helper::realnum( df ) ) return -9;

  T = fabs(T);

  // upper tail, then two-sided
  boost::math::students_t dist( df );
  const double q = boost::math::cdf( boost::math::complement( dist , T ) );
  return 2 * q;

}


double Statistics::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return std::numeric_limits<double>::quiet_NaN();
  double s = 0;
  for (int i=0; i<n; i++) s += x[i];
  return s / (double)n;
}

double Statistics::variance( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n < 2 ) return std::numeric_limits<double>::quiet_NaN();
  const double m = mean( x );
  double ss = 0;
  for (int i=0; i<n; i++) ss += ( x[i] - m ) * ( x[i] - m );
  return ss / (double)( n - 1 );
}

double Statistics::sem( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n < 2 ) return std::numeric_limits<double>::quiet_NaN();
  return sqrt( variance( x ) / (double)n );
}


Eigen::MatrixXd Statistics::p_adjust( const Eigen::VectorXd & p )
{

  // 4 corrected values: Bonf, Holm, BH, BY

  // Benjamini, Y., and Hochberg, Y. (1995). Controlling the false
  // discovery rate: a practical and powerful approach to multiple
  // testing. Journal of the Royal Statistical Society Series B, 57,
  // 289-300.

  // Benjamini, Y., and Yekutieli, D. (2001). The control of the false
  // discovery rate in multiple testing under dependency. Annals of
  // Statistics 29, 1165-1188.

  if ( p.size() == 0 )
    return Eigen::MatrixXd::Zero(0,4);

  struct pair_t {
    double p;
    int l;
    bool operator< (const pair_t & p2) const
    {
      if ( p < p2.p ) return true;
      if ( p > p2.p ) return false;
      return l < p2.l;
    }
  };

  std::vector<pair_t> sp;

  const int npv = p.size();

  for (int l=0; l<npv; l++)
    {
      if ( p[l] >= 0 && Helper::realnum( p[l] ) )
	{
	  pair_t pt;
	  pt.p = p[l];
	  pt.l = l;
	  sp.push_back(pt);
	}
    }

  // sort p-values
  std::sort(sp.begin(),sp.end());

  double t = (double)sp.size();
  int ti = sp.size();

  Eigen::VectorXd pv_holm = Eigen::VectorXd::Zero( ti );
  Eigen::VectorXd pv_BH = Eigen::VectorXd::Zero( ti );
  Eigen::VectorXd pv_BY = Eigen::VectorXd::Zero( ti );

  if ( ti == 1 )
    {
      pv_holm[0] = pv_BH[0] = pv_BY[0] = sp[0].p;
    }
  else if ( ti > 1 )
    {
      // Holm
      pv_holm[0] = sp[0].p*t > 1 ? 1 : sp[0].p*t;
      for (int i=1;i<ti;i++)
	{
	  double x = (ti-i)*sp[i].p < 1 ? (ti-i)*sp[i].p : 1;
	  pv_holm[i] = pv_holm[i-1] > x ? pv_holm[i-1] : x;
	}

      // BH
      pv_BH[ti-1] = sp[ti-1].p;
      for (int i=ti-2;i>=0;i--)
	{
	  double x = (t/(double)(i+1))*sp[i].p < 1 ? (t/(double)(i+1))*sp[i].p : 1 ;
	  pv_BH[i] = pv_BH[i+1] < x ? pv_BH[i+1] : x;
	}

      // BY
      double a = 0;
      for (double i=1; i<=t; i++)
	a += 1/i;
      pv_BY[ti-1] = a * sp[ti-1].p < 1 ? a * sp[ti-1].p : 1 ;
      for (int i=ti-2;i>=0;i--)
	{
	  double x = ((t*a)/(double)(i+1))*sp[i].p < 1 ? ((t*a)/(double)(i+1))*sp[i].p : 1 ;
	  pv_BY[i] = pv_BY[i+1] < x ? pv_BY[i+1] : x;
	}

    }

  //
  // update original p-value list
  //

  Eigen::MatrixXd res = Eigen::MatrixXd::Constant( npv , 4 , -9 );

  for (int l=0; l<ti; l++)
    {
      const int idx = sp[l].l;
      res(idx,0) = sp[l].p*t > 1 ? 1 : sp[l].p*t;
      res(idx,1) = pv_holm[l];
      res(idx,2) = pv_BH[l];
      res(idx,3) = pv_BY[l];
    }

  return res;
}
