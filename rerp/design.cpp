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

#include "rerp/design.h"
#include "rerp/errors.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;

const std::string design_t::intercept = "(Intercept)";


predictor_spec_t predictor_spec_t::categorical( const std::string & name ,
						const std::string & reference ,
						const std::vector<std::string> & levels )
{
  predictor_spec_t p;
  p.name = name;
  p.role = CATEGORICAL;
  p.reference = reference;
  p.levels = levels;
  return p;
}

predictor_spec_t predictor_spec_t::continuous( const std::string & name ,
					       pred_transform_t transform )
{
  predictor_spec_t p;
  p.name = name;
  p.role = CONTINUOUS;
  p.transform = transform;
  return p;
}


model_spec_t & model_spec_t::add( const predictor_spec_t & p )
{
  if ( find( p.name ) != NULL )
    throw design_error( "predictor " + p.name + " specified more than once" );
  preds.push_back( p );
  return *this;
}

model_spec_t & model_spec_t::interaction( const std::vector<std::string> & terms )
{
  interactions.push_back( terms );
  return *this;
}

model_spec_t & model_spec_t::interaction( const std::string & a , const std::string & b )
{
  std::vector<std::string> t;
  t.push_back( a );
  t.push_back( b );
  return interaction( t );
}

const predictor_spec_t * model_spec_t::find( const std::string & name ) const
{
  for (int i=0; i<preds.size(); i++)
    if ( preds[i].name == name ) return &preds[i];
  return NULL;
}


std::vector<std::string> pred_coding_t::columns() const
{
  std::vector<std::string> c;
  if ( role == CONTINUOUS )
    c.push_back( name );
  else
    for (int l=0; l<levels.size(); l++)
      c.push_back( name + "[" + levels[l] + "]" );
  return c;
}

Eigen::VectorXd pred_coding_t::encode( const pred_value_t & v ) const
{

  if ( role == CONTINUOUS )
    {
      double x;
      if ( ! v.numeric( &x ) )
	throw unsupported_condition_error( "non-numeric value " + v.level() + " for continuous predictor " + name );
      if ( ! Helper::realnum( x ) )
	throw unsupported_condition_error( "non-finite value for continuous predictor " + name );
      if ( reflect ) x = anchor - x;
      Eigen::VectorXd e( 1 );
      e[0] = ( x - center ) / scale;
      return e;
    }

  const std::string lvl = v.level();

  if ( fitted.find( lvl ) == fitted.end() )
    throw unsupported_condition_error( "level " + lvl + " of predictor " + name + " not present in the fitted design" );

  // treatment coding: reference is all zeros
  Eigen::VectorXd e = Eigen::VectorXd::Zero( levels.size() );
  for (int l=0; l<levels.size(); l++)
    if ( levels[l] == lvl ) e[l] = 1;
  return e;
}


// product columns of one interaction term, first component outermost

static void interaction_columns( const std::vector<Eigen::VectorXd> & parts ,
				 Eigen::VectorXd * cols )
{
  Eigen::VectorXd cur = parts[0];
  for (int k=1; k<parts.size(); k++)
    {
      const Eigen::VectorXd & nxt = parts[k];
      Eigen::VectorXd res( cur.size() * nxt.size() );
      int j = 0;
      for (int a=0; a<cur.size(); a++)
	for (int b=0; b<nxt.size(); b++)
	  res[j++] = cur[a] * nxt[b];
      cur = res;
    }
  *cols = cur;
}

static std::vector<std::string> interaction_labels( const std::vector<std::vector<std::string> > & parts )
{
  std::vector<std::string> cur = parts[0];
  for (int k=1; k<parts.size(); k++)
    {
      std::vector<std::string> res;
      for (int a=0; a<cur.size(); a++)
	for (int b=0; b<parts[k].size(); b++)
	  res.push_back( cur[a] + ":" + parts[k][b] );
      cur = res;
    }
  return cur;
}


design_t design_t::build( const trials_t & trials , const model_spec_t & spec )
{

  design_t d;

  const int n = trials.size();

  if ( n == 0 )
    throw design_error( "no trials" );

  //
  // predictor encodings
  //

  std::map<std::string,int> pidx;

  for (int j=0; j<spec.preds.size(); j++)
    {
      const predictor_spec_t & ps = spec.preds[j];

      if ( ps.name == "" )
	throw design_error( "unnamed predictor" );

      if ( pidx.find( ps.name ) != pidx.end() )
	throw design_error( "predictor " + ps.name + " specified more than once" );

      for (int i=0; i<n; i++)
	if ( ! trials[i].has_pred( ps.name ) )
	  throw design_error( "predictor " + ps.name + " not present for trial " + Helper::int2str( i+1 ) );

      pred_coding_t pc;
      pc.name = ps.name;
      pc.role = ps.role;

      if ( ps.role == CATEGORICAL )
	{
	  if ( ps.reference == "" )
	    throw design_error( "no reference level given for categorical predictor " + ps.name );

	  std::set<std::string> obs;
	  for (int i=0; i<n; i++)
	    obs.insert( trials[i].preds.find( ps.name )->second.level() );

	  if ( obs.find( ps.reference ) == obs.end() )
	    throw design_error( "reference level " + ps.reference + " of predictor " + ps.name + " not present in the data" );

	  std::vector<std::string> order;
	  if ( ps.levels.size() )
	    {
	      std::set<std::string> declared( ps.levels.begin() , ps.levels.end() );
	      std::set<std::string>::const_iterator oo = obs.begin();
	      while ( oo != obs.end() )
		{
		  if ( declared.find( *oo ) == declared.end() )
		    throw design_error( "level " + *oo + " of predictor " + ps.name + " not in the declared levels" );
		  ++oo;
		}
	      order = ps.levels;
	    }
	  else
	    order.assign( obs.begin() , obs.end() );

	  pc.reference = ps.reference;
	  pc.fitted = obs;
	  for (int l=0; l<order.size(); l++)
	    if ( order[l] != ps.reference ) pc.levels.push_back( order[l] );
	}
      else
	{
	  std::vector<double> x( n );
	  for (int i=0; i<n; i++)
	    {
	      const pred_value_t & v = trials[i].preds.find( ps.name )->second;
	      if ( ! v.numeric( &x[i] ) )
		throw design_error( "non-numeric value " + v.level() + " for continuous predictor "
				    + ps.name + " in trial " + Helper::int2str( i+1 ) );
	      if ( ! Helper::realnum( x[i] ) )
		throw design_error( "non-finite value for continuous predictor "
				    + ps.name + " in trial " + Helper::int2str( i+1 ) );
	      if ( ps.reflect ) x[i] = ps.anchor - x[i];
	    }

	  pc.reflect = ps.reflect;
	  pc.anchor = ps.anchor;

	  if ( ps.transform != TRANSFORM_NONE )
	    {
	      double s = 0;
	      for (int i=0; i<n; i++) s += x[i];
	      pc.center = s / (double)n;
	    }

	  if ( ps.transform == TRANSFORM_ZSCORE )
	    {
	      double ss = 0;
	      for (int i=0; i<n; i++) ss += ( x[i] - pc.center ) * ( x[i] - pc.center );
	      const double sd = n > 1 ? sqrt( ss / (double)( n - 1 ) ) : 0 ;
	      if ( ! ( sd > 0 ) )
		throw design_error( "cannot z-score predictor " + ps.name + ": zero variance" );
	      pc.scale = sd;
	    }
	}

      pidx[ ps.name ] = d.coding.size();
      d.coding.push_back( pc );
    }

  for (int k=0; k<spec.interactions.size(); k++)
    {
      const std::vector<std::string> & term = spec.interactions[k];
      if ( term.size() < 2 )
	throw design_error( "interaction term needs two or more predictors: " + Helper::stringize( term , ":" ) );
      std::vector<int> idx;
      for (int j=0; j<term.size(); j++)
	{
	  if ( pidx.find( term[j] ) == pidx.end() )
	    throw design_error( "interaction " + Helper::stringize( term , ":" ) + " names predictor " + term[j] + " not in the model" );
	  idx.push_back( pidx[ term[j] ] );
	}
      d.interactions.push_back( idx );
    }

  //
  // column labels
  //

  d.terms.push_back( intercept );

  for (int j=0; j<d.coding.size(); j++)
    {
      std::vector<std::string> c = d.coding[j].columns();
      d.terms.insert( d.terms.end() , c.begin() , c.end() );
    }

  for (int k=0; k<d.interactions.size(); k++)
    {
      std::vector<std::vector<std::string> > parts;
      for (int j=0; j<d.interactions[k].size(); j++)
	parts.push_back( d.coding[ d.interactions[k][j] ].columns() );
      std::vector<std::string> c = interaction_labels( parts );
      d.terms.insert( d.terms.end() , c.begin() , c.end() );
    }

  std::set<std::string> uniq( d.terms.begin() , d.terms.end() );
  if ( uniq.size() != d.terms.size() )
    throw design_error( "duplicate term labels: " + Helper::stringize( d.terms ) );

  //
  // rows
  //

  const int p = d.terms.size();

  d.X.resize( n , p );

  for (int i=0; i<n; i++)
    {
      std::map<std::string,pred_value_t> values;
      for (int j=0; j<d.coding.size(); j++)
	values[ d.coding[j].name ] = trials[i].preds.find( d.coding[j].name )->second;
      d.X.row(i) = d.encode( values ).transpose();
    }

  //
  // identifiability
  //

  if ( n < p )
    throw design_error( "fewer trials (" + Helper::int2str( n ) + ") than terms (" + Helper::int2str( p ) + ")" );

  std::vector<std::string> bad = d.collinear();
  if ( bad.size() )
    throw design_error( "design is rank deficient; collinear with earlier columns: " + Helper::stringize( bad ) );

  logger << "  design: " << n << " trials x " << p << " terms ("
	 << Helper::stringize( d.terms , ", " ) << ")\n";

  return d;
}


std::vector<std::string> design_t::collinear() const
{
  std::vector<std::string> bad;
  std::vector<int> kept;

  for (int j=0; j<X.cols(); j++)
    {
      Eigen::MatrixXd S( X.rows() , kept.size() + 1 );
      for (int k=0; k<kept.size(); k++) S.col(k) = X.col( kept[k] );
      S.col( kept.size() ) = X.col(j);

      Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr( S );
      qr.setThreshold( 1e-10 );

      if ( qr.rank() < S.cols() )
	bad.push_back( terms[j] );
      else
	kept.push_back( j );
    }
  return bad;
}


int design_t::column( const std::string & term ) const
{
  for (int j=0; j<terms.size(); j++)
    if ( terms[j] == term ) return j;
  return -1;
}


Eigen::VectorXd design_t::encode( const std::map<std::string,pred_value_t> & values ) const
{

  std::map<std::string,pred_value_t>::const_iterator vv = values.begin();
  while ( vv != values.end() )
    {
      bool found = false;
      for (int j=0; j<coding.size(); j++)
	if ( coding[j].name == vv->first ) { found = true; break; }
      if ( ! found )
	throw unsupported_condition_error( "predictor " + vv->first + " is not in the model" );
      ++vv;
    }

  std::vector<Eigen::VectorXd> enc( coding.size() );
  int p = 1;
  for (int j=0; j<coding.size(); j++)
    {
      vv = values.find( coding[j].name );
      if ( vv == values.end() )
	throw unsupported_condition_error( "no value given for predictor " + coding[j].name );
      enc[j] = coding[j].encode( vv->second );
      p += enc[j].size();
    }

  std::vector<Eigen::VectorXd> inter( interactions.size() );
  for (int k=0; k<interactions.size(); k++)
    {
      std::vector<Eigen::VectorXd> parts;
      for (int j=0; j<interactions[k].size(); j++)
	parts.push_back( enc[ interactions[k][j] ] );
      interaction_columns( parts , &inter[k] );
      p += inter[k].size();
    }

  Eigen::VectorXd x( p );
  int c = 0;
  x[c++] = 1;
  for (int j=0; j<enc.size(); j++)
    {
      x.segment( c , enc[j].size() ) = enc[j];
      c += enc[j].size();
    }
  for (int k=0; k<inter.size(); k++)
    {
      x.segment( c , inter[k].size() ) = inter[k];
      c += inter[k].size();
    }
  return x;
}
