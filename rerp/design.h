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

#ifndef __RERP_DESIGN_H__
#define __RERP_DESIGN_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <map>
#include <set>

#include "rerp/trials.h"

enum pred_role_t { CATEGORICAL , CONTINUOUS };

enum pred_transform_t { TRANSFORM_NONE , TRANSFORM_CENTER , TRANSFORM_ZSCORE };


struct predictor_spec_t {

  predictor_spec_t()
    : role( CONTINUOUS ) , transform( TRANSFORM_NONE ) , reflect( false ) , anchor( 0 ) { }

  std::string name;

  pred_role_t role;

  // categorical: treatment coding against 'reference'; optional fixed level order
  std::string reference;
  std::vector<std::string> levels;

  // continuous: optional reflection (anchor - x), then NONE / CENTER / ZSCORE
  pred_transform_t transform;
  bool reflect;
  double anchor;

  static predictor_spec_t categorical( const std::string & name ,
				       const std::string & reference ,
				       const std::vector<std::string> & levels = std::vector<std::string>() );

  static predictor_spec_t continuous( const std::string & name ,
				      pred_transform_t transform = TRANSFORM_NONE );

  // reflect values around 'anchor' before any other transform
  predictor_spec_t & invert( const double a ) { reflect = true; anchor = a; return *this; }

};


struct model_spec_t {

  std::vector<predictor_spec_t> preds;

  // each term names two or more predictors
  std::vector<std::vector<std::string> > interactions;

  model_spec_t & add( const predictor_spec_t & p );

  model_spec_t & interaction( const std::vector<std::string> & terms );

  model_spec_t & interaction( const std::string & a , const std::string & b );

  // NULL if not in the model
  const predictor_spec_t * find( const std::string & name ) const;

};


// the encoding applied to one predictor, as fitted

struct pred_coding_t {

  pred_coding_t()
    : role( CONTINUOUS ) , reflect( false ) , anchor( 0 ) , center( 0 ) , scale( 1 ) { }

  std::string name;
  pred_role_t role;

  // categorical
  std::string reference;
  std::vector<std::string> levels;   // non-reference levels, in column order
  std::set<std::string> fitted;      // all levels seen when fitting, incl. reference

  // continuous: ( ( reflect ? anchor - x : x ) - center ) / scale
  bool reflect;
  double anchor;
  double center;
  double scale;

  int ncols() const { return role == CATEGORICAL ? levels.size() : 1 ; }

  std::vector<std::string> columns() const;

  // encoded columns for one raw value; throws unsupported_condition_error
  Eigen::VectorXd encode( const pred_value_t & v ) const;

};


struct design_t {

  design_t() { }

  // build the n x p design; throws design_error
  static design_t build( const trials_t & trials , const model_spec_t & spec );

  // n x p, intercept first
  Eigen::MatrixXd X;

  // column labels
  std::vector<std::string> terms;

  // per-predictor encodings, in model order
  std::vector<pred_coding_t> coding;

  // interaction terms, as indices into coding
  std::vector<std::vector<int> > interactions;

  int rows() const { return X.rows(); }
  int cols() const { return X.cols(); }

  // -1 if not a column
  int column( const std::string & term ) const;

  // term vector for a raw predictor assignment (every model predictor
  // must be given, no others); throws unsupported_condition_error
  Eigen::VectorXd encode( const std::map<std::string,pred_value_t> & values ) const;

  static const std::string intercept;

 private:

  // names of columns that are linear combinations of earlier columns
  std::vector<std::string> collinear() const;

};

#endif
