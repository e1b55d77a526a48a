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

#ifndef __RERP_OLS_H__
#define __RERP_OLS_H__

#include <Eigen/Dense>

#include <vector>
#include <string>

// least-squares estimate at one (channel, timepoint)

struct coef_t {

  coef_t() : rss( 0 ) , sigma2( 0 ) , df( 0 ) , complete( false ) { }

  Eigen::VectorXd beta;

  double rss;

  // rss / df
  double sigma2;

  int df;

  // observed - fitted, one per trial; NaN for excluded trials
  Eigen::VectorXd resid;

  // trials dropped for missing voltages
  std::vector<int> excluded;

  bool complete;

  int n() const { return resid.size() - excluded.size(); }

};


// one decomposition of the design, shared by all fits

struct ols_t {

  // throws design_error (n <= p, singular), ill_conditioned_error;
  // 'label' prefixes error messages
  ols_t( const Eigen::MatrixXd & X ,
	 const double max_condition = 1e8 ,
	 const std::string & label = "" );

  Eigen::MatrixXd X;

  // ( X'X )^-1 X'
  Eigen::MatrixXd pinv;

  // ( X'X )^-1
  Eigen::MatrixXd VX;

  double condition;

  double max_condition;

  int n() const { return X.rows(); }
  int p() const { return X.cols(); }

  // NaN entries of y are excluded, refitting on a row-reduced design
  coef_t fit( const Eigen::VectorXd & y , const std::string & label = "" ) const;

  // decomposition of the rows kept
  ols_t reduced( const std::vector<int> & rows , const std::string & label = "" ) const;

  // X'X b - X'y : zero at the least-squares solution
  Eigen::VectorXd normal_residual( const Eigen::VectorXd & beta , const Eigen::VectorXd & y ) const;

  // largest / smallest singular value
  static double condition_number( const Eigen::MatrixXd & X );

};

#endif
