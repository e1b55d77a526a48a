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

#ifndef __RERP_STATISTICS_H__
#define __RERP_STATISTICS_H__

#include <Eigen/Dense>

#include <vector>

namespace Statistics {

  // two-sided p-value for a Student t statistic; -9 if undefined
  double t_prob( double x, double df );

  // P( T <= x ) for Student t with df degrees of freedom
  double t_cdf( double x , double df );

  double mean( const std::vector<double> & );
  double variance( const std::vector<double> & );

  // standard error of the mean (n-1 denominator); NaN if n < 2
  double sem( const std::vector<double> & );

  // multiple-testing adjustment: returns n x 4 matrix of adjusted p-values,
  // cols = Bonferroni, Holm, Benjamini-Hochberg, Benjamini-Yekutieli;
  // invalid inputs (p < 0) are skipped and returned as -9
  Eigen::MatrixXd p_adjust( const Eigen::VectorXd & p );

}

#endif
