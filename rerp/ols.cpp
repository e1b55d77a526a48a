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

#include "rerp/ols.h"
#include "rerp/errors.h"

#include "helper/helper.h"

#include <limits>


ols_t::ols_t( const Eigen::MatrixXd & X ,
	      const double max_condition ,
	      const std::string & label )
  : X( X ) , max_condition( max_condition )
{

  const std::string pfx = label == "" ? "" : label + ": " ;

  const int n = X.rows();
  const int p = X.cols();

  if ( n <= p )
    throw design_error( pfx + Helper::int2str( n ) + " trials for " + Helper::int2str( p )
			+ " terms leaves no residual degrees of freedom" );

  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr( X );
  qr.setThreshold( 1e-10 );
  if ( qr.rank() < p )
    throw design_error( pfx + "design matrix is rank deficient (rank "
			+ Helper::int2str( (int)qr.rank() ) + " < " + Helper::int2str( p ) + " terms)" );

  condition = condition_number( X );

  if ( ! Helper::realnum( condition ) )
    throw design_error( pfx + "design matrix is singular" );

  if ( condition > max_condition )
    throw ill_conditioned_error( pfx + "condition number " + Helper::dbl2str( condition )
				 + " exceeds " + Helper::dbl2str( max_condition ) );

  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cqr( X );
  pinv = cqr.pseudoInverse();

  VX = ( X.transpose() * X ).inverse();

}


double ols_t::condition_number( const Eigen::MatrixXd & X )
{
  Eigen::JacobiSVD<Eigen::MatrixXd> svd( X );
  const Eigen::VectorXd & sv = svd.singularValues();
  const double smin = sv[ sv.size() - 1 ];
  if ( ! ( smin > 0 ) ) return std::numeric_limits<double>::infinity();
  return sv[0] / smin;
}


ols_t ols_t::reduced( const std::vector<int> & rows , const std::string & label ) const
{
  Eigen::MatrixXd R( rows.size() , X.cols() );
  for (int i=0; i<rows.size(); i++)
    R.row(i) = X.row( rows[i] );
  return ols_t( R , max_condition , label );
}


coef_t ols_t::fit( const Eigen::VectorXd & y , const std::string & label ) const
{

  const int n = X.rows();
  const int p = X.cols();

  coef_t c;

  std::vector<int> rows;
  for (int i=0; i<n; i++)
    {
      if ( Helper::realnum( y[i] ) ) rows.push_back( i );
      else c.excluded.push_back( i );
    }

  c.resid = Eigen::VectorXd::Constant( n , std::numeric_limits<double>::quiet_NaN() );

  if ( c.excluded.size() == 0 )
    {
      c.beta = pinv * y;
      c.resid = y - X * c.beta;
    }
  else
    {
      // row-reduced design for this fit only
      ols_t r = reduced( rows , label == "" ? "after excluding missing trials" : label + ", after excluding missing trials" );
      Eigen::VectorXd yr( rows.size() );
      for (int i=0; i<rows.size(); i++) yr[i] = y[ rows[i] ];
      c.beta = r.pinv * yr;
      Eigen::VectorXd e = yr - r.X * c.beta;
      for (int i=0; i<rows.size(); i++) c.resid[ rows[i] ] = e[i];
    }

  c.df = rows.size() - p;

  c.rss = 0;
  for (int i=0; i<rows.size(); i++)
    c.rss += c.resid[ rows[i] ] * c.resid[ rows[i] ];

  c.sigma2 = c.rss / (double)c.df;

  c.complete = true;

  return c;
}


Eigen::VectorXd ols_t::normal_residual( const Eigen::VectorXd & beta , const Eigen::VectorXd & y ) const
{
  return X.transpose() * X * beta - X.transpose() * y;
}
