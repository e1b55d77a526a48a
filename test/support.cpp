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

#include <catch2/catch.hpp>

#include "rerp.h"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

TEST_CASE( "Student t p-values" )
{
  REQUIRE( Statistics::t_prob( 2.228139 , 10 ) == Approx( 0.05 ).epsilon( 1e-4 ) );
  REQUIRE( Statistics::t_prob( -2.228139 , 10 ) == Approx( 0.05 ).epsilon( 1e-4 ) );
  REQUIRE( Statistics::t_prob( 0 , 5 ) == Approx( 1.0 ) );
  REQUIRE( Statistics::t_cdf( 0 , 7 ) == Approx( 0.5 ) );
  REQUIRE( Statistics::t_prob( 1 , 0 ) == -9 );
  REQUIRE( Statistics::t_prob( std::numeric_limits<double>::quiet_NaN() , 10 ) == -9 );
}

TEST_CASE( "multiple-testing adjustment" )
{
  Eigen::VectorXd p( 5 );
  p << 0.03 , 0.01 , 0.05 , 0.02 , 0.04 ;

  Eigen::MatrixXd a = Statistics::p_adjust( p );
  REQUIRE( a.rows() == 5 );
  REQUIRE( a.cols() == 4 );

  // Bonferroni
  REQUIRE( a(1,0) == Approx( 0.05 ) );
  REQUIRE( a(0,0) == Approx( 0.15 ) );

  // Holm
  REQUIRE( a(1,1) == Approx( 0.05 ) );
  REQUIRE( a(3,1) == Approx( 0.08 ) );
  REQUIRE( a(0,1) == Approx( 0.09 ) );
  REQUIRE( a(2,1) == Approx( 0.09 ) );

  // Benjamini-Hochberg
  for (int i=0; i<5; i++) REQUIRE( a(i,2) == Approx( 0.05 ) );

  // Benjamini-Yekutieli
  const double c = 1 + 1/2.0 + 1/3.0 + 1/4.0 + 1/5.0;
  for (int i=0; i<5; i++) REQUIRE( a(i,3) == Approx( 0.05 * c ) );

  // invalid entries are passed through
  Eigen::VectorXd q( 3 );
  q << 0.01 , -9 , 0.02 ;
  Eigen::MatrixXd b = Statistics::p_adjust( q );
  REQUIRE( b(1,0) == -9 );
  REQUIRE( b(0,0) == Approx( 0.02 ) );
}

TEST_CASE( "summary statistics" )
{
  std::vector<double> x;
  x.push_back( 1 ); x.push_back( 2 ); x.push_back( 3 ); x.push_back( 6 );
  REQUIRE( Statistics::mean( x ) == 3 );
  REQUIRE( Statistics::variance( x ) == Approx( 14.0 / 3.0 ) );
  REQUIRE( Statistics::sem( x ) == Approx( sqrt( 14.0 / 12.0 ) ) );
  REQUIRE( ! Helper::realnum( Statistics::sem( std::vector<double>( 1 , 1.0 ) ) ) );
}

TEST_CASE( "options" )
{
  param_t param;
  param.parse( "ch=Fz,Cz,Pz" );
  param.parse( "threads=4" );
  param.parse( "points" );
  param.parse( "summary=N" );
  param.parse( "cat=Condition" );
  param.parse( "cat+=Region" );
  param.parse( "alpha=x" );

  REQUIRE( param.has( "ch" ) );
  REQUIRE( param.strvector( "ch" ).size() == 3 );
  REQUIRE( param.strvector( "ch" )[2] == "Pz" );
  REQUIRE( param.requires_int( "threads" ) == 4 );
  REQUIRE( param.yesno( "points" ) );
  REQUIRE( ! param.yesno( "summary" ) );
  REQUIRE( ! param.yesno( "estimate" ) );
  REQUIRE( param.value( "cat" ) == "Condition,Region" );

  // halt() throws in library mode
  REQUIRE_THROWS_AS( param.requires( "data" ) , std::runtime_error );
  REQUIRE_THROWS_AS( param.requires_dbl( "alpha" ) , std::runtime_error );

  rerp_opts_t opts;
  opts.set( param );
  REQUIRE( opts.nthreads == 4 );
  REQUIRE( opts.max_condition == 1e8 );

  param_t p2;
  p2.parse( "adj=holm" );
  p2.parse( "alpha=0.01" );
  p2.parse( "per-channel" );
  winstats_opts_t wo;
  wo.set( p2 );
  REQUIRE( wo.adj == ADJ_HOLM );
  REQUIRE( wo.alpha == 0.01 );
  REQUIRE( wo.per_channel );
}

TEST_CASE( "model specification from options" )
{
  param_t param;
  param.parse( "cat=Condition" );
  param.parse( "ref=baseline" );
  param.parse( "levels=Condition:baseline:implausible:anomalous" );
  param.parse( "cont=cloze,plaus" );
  param.parse( "zscore=cloze" );
  param.parse( "invert=plaus:7" );
  param.parse( "inter=Condition:cloze" );

  model_spec_t spec = rerp::model_spec( param );
  REQUIRE( spec.preds.size() == 3 );
  REQUIRE( spec.find( "Condition" )->reference == "baseline" );
  REQUIRE( spec.find( "Condition" )->levels.size() == 3 );
  REQUIRE( spec.find( "cloze" )->transform == TRANSFORM_ZSCORE );
  REQUIRE( spec.find( "plaus" )->reflect );
  REQUIRE( spec.find( "plaus" )->anchor == 7 );
  REQUIRE( spec.interactions.size() == 1 );
  REQUIRE( spec.find( "frequency" ) == NULL );
}

TEST_CASE( "string helpers" )
{
  double d;
  int i;
  REQUIRE( Helper::str2dbl( "2.5" , &d ) );
  REQUIRE( d == 2.5 );
  REQUIRE( ! Helper::str2dbl( "2.5x" , &d ) );
  REQUIRE( Helper::str2int( "-3" , &i ) );
  REQUIRE( i == -3 );
  REQUIRE( Helper::parse( "a:b:c" , ":" ).size() == 3 );
  REQUIRE( Helper::char_split( "a\t\tb" , '\t' ).size() == 3 );
}

TEST_CASE( "random numbers are reproducible" )
{
  CRandom::srand( 5 );
  const double a = CRandom::rnorm();
  std::vector<int> p1( 10 );
  CRandom::random_draw( p1 );

  CRandom::srand( 5 );
  REQUIRE( CRandom::rnorm() == a );
  std::vector<int> p2( 10 );
  CRandom::random_draw( p2 );
  REQUIRE( p1 == p2 );

  std::vector<int> s = p1;
  std::sort( s.begin() , s.end() );
  for (int k=0; k<10; k++) REQUIRE( s[k] == k );
}

TEST_CASE( "worker pool runs every task and keeps errors" )
{
  std::atomic<int> n( 0 );
  std::vector<std::future<void> > f;
  {
    pool_t pool( 3 );
    REQUIRE( pool.size() == 3 );
    for (int k=0; k<50; k++)
      f.push_back( pool.enqueue( [&n]() { ++n; } ) );
    f.push_back( pool.enqueue( []() { throw design_error( "in task" ); } ) );
  }
  REQUIRE( n == 50 );
  for (int k=0; k<50; k++) REQUIRE_NOTHROW( f[k].get() );
  REQUIRE_THROWS_AS( f[50].get() , design_error );
}


static std::string write_table( const std::string & text )
{
  const std::string f = "rerp_test_table.tsv";
  std::ofstream O( f.c_str() , std::ios::out );
  O << text;
  O.close();
  return f;
}

TEST_CASE( "long-format tables" )
{
  std::string f = write_table( "Subject\tItemNum\tTimestamp\tCondition\tcloze\tFz\tCz\n"
			       "S1\t1\t0\tbaseline\t0.5\t1.0\t2.0\n"
			       "S1\t1\t4\tbaseline\t0.5\t1.5\tNA\n"
			       "S1\t2\t0\tanomalous\t0.1\t-1.0\t0.0\n"
			       "S1\t2\t4\tanomalous\t0.1\t-2.0\t0.5\n"
			       "S2\t1\t4\tbaseline\t0.7\t3.0\t3.5\n"
			       "S2\t1\t0\tbaseline\t0.7\t2.0\t2.5\n" );

  table_spec_t ts;
  ts.keys.push_back( "Subject" );
  ts.keys.push_back( "ItemNum" );
  ts.channels.push_back( "Fz" );
  ts.channels.push_back( "Cz" );
  ts.preds.push_back( "Condition" );
  ts.preds.push_back( "cloze" );

  trials_t trials;
  trials.read( f , ts );

  REQUIRE( trials.size() == 3 );
  REQUIRE( trials.nc() == 2 );
  REQUIRE( trials.nt() == 2 );
  REQUIRE( trials.time[1] == 4 );
  REQUIRE( trials.channel( "Cz" ) == 1 );
  REQUIRE( trials.timepoint( 3 ) == 1 );
  REQUIRE( trials.missing() == 1 );

  REQUIRE( ! trials[0].preds.find( "Condition" )->second.is_num );
  REQUIRE( trials[0].preds.find( "cloze" )->second.is_num );
  REQUIRE( trials[0].desc.find( "Subject" )->second == "S1" );

  // rows out of time order are placed on the time axis
  REQUIRE( trials[2].X(0,0) == 2.0 );
  REQUIRE( trials[2].X(0,1) == 3.0 );
  REQUIRE( ! Helper::realnum( trials[0].X(1,1) ) );

  std::set<std::string> lv = trials.levels( "Condition" );
  REQUIRE( lv.size() == 2 );
  REQUIRE( trials.rows( "Subject" , "S1" ).size() == 2 );

  trials.rename_level( "Condition" , "anomalous" , "implausible" );
  REQUIRE( trials[1].preds.find( "Condition" )->second.str == "implausible" );

  trials.rename_predictor( "cloze" , "predictability" );
  REQUIRE( trials[1].has_pred( "predictability" ) );
  REQUIRE( ! trials[1].has_pred( "cloze" ) );

  std::remove( f.c_str() );
}

TEST_CASE( "malformed tables" )
{
  table_spec_t ts;
  ts.keys.push_back( "ItemNum" );
  ts.channels.push_back( "Fz" );
  ts.preds.push_back( "Condition" );

  SECTION( "predictor varies within a trial" )
    {
      std::string f = write_table( "ItemNum\tTimestamp\tCondition\tFz\n"
				   "1\t0\tA\t1\n"
				   "1\t4\tB\t1\n" );
      trials_t trials;
      REQUIRE_THROWS_AS( trials.read( f , ts ) , design_error );
      std::remove( f.c_str() );
    }

  SECTION( "missing column" )
    {
      std::string f = write_table( "ItemNum\tTimestamp\tFz\n"
				   "1\t0\t1\n" );
      trials_t trials;
      REQUIRE_THROWS_AS( trials.read( f , ts ) , std::runtime_error );
      std::remove( f.c_str() );
    }

  SECTION( "no such file" )
    {
      trials_t trials;
      REQUIRE_THROWS_AS( trials.read( "no-such-file.tsv" , ts ) , std::runtime_error );
    }
}

TEST_CASE( "grouped ERP summaries" )
{
  std::vector<std::string> ch( 1 , "Cz" );
  std::vector<double> time;
  time.push_back( 0 ); time.push_back( 4 ); time.push_back( 8 );
  trials_t trials( ch , time );

  // S1: A trials 1 and 3 ; S2: A trial 8 ; B trials 0 in both
  const double va[] = { 1 , 3 , 8 };
  const char * sa[] = { "S1" , "S1" , "S2" };
  for (int i=0; i<3; i++)
    {
      trial_t t( Eigen::MatrixXd::Constant( 1 , 3 , va[i] ) );
      t.pred( "Condition" , "A" ).descriptor( "Subject" , sa[i] );
      trials.add( t );
    }
  for (int i=0; i<2; i++)
    {
      trial_t t( Eigen::MatrixXd::Zero( 1 , 3 ) );
      t.pred( "Condition" , "B" ).descriptor( "Subject" , i ? "S2" : "S1" );
      trials.add( t );
    }

  std::vector<std::string> by( 1 , "Condition" );

  SECTION( "single stage" )
    {
      erp_summary_t s = rerp::summarize( trials , by );
      REQUIRE( s.n[ "Condition=A" ] == 3 );
      REQUIRE( s.mean[ "Condition=A" ](0,1) == Approx( 4.0 ) );
      REQUIRE( s.sem[ "Condition=A" ](0,1) == Approx( sqrt( 13.0 / 3.0 ) ) );
      REQUIRE( s.mean[ "Condition=B" ](0,2) == 0 );
    }

  SECTION( "within subject first" )
    {
      erp_summary_t s = rerp::summarize( trials , by , "Subject" );
      REQUIRE( s.n[ "Condition=A" ] == 2 );
      // subject means 2 and 8
      REQUIRE( s.mean[ "Condition=A" ](0,0) == Approx( 5.0 ) );
      REQUIRE( s.sem[ "Condition=A" ](0,0) == Approx( 3.0 ) );
    }

  SECTION( "window averages" )
    {
      std::vector<win_avg_t> a = rerp::window_averages( trials , 4 , 100 , by );
      REQUIRE( a.size() == 2 );
      REQUIRE( a[0].key == "Condition=A" );
      REQUIRE( a[0].n == 3 );
      REQUIRE( a[0].mean == Approx( 4.0 ) );
      REQUIRE_THROWS_AS( rerp::window_averages( trials , 100 , 200 , by ) , empty_window_error );
    }

  SECTION( "unknown grouping" )
    {
      REQUIRE_THROWS_AS( rerp::summarize( trials , std::vector<std::string>( 1 , "Region" ) ) , design_error );
    }
}


// capture std::cout for the driver tables

struct cout_capture_t {
  cout_capture_t() : old( std::cout.rdbuf( ss.rdbuf() ) ) { }
  ~cout_capture_t() { std::cout.rdbuf( old ); }
  std::string str() const { return ss.str(); }
  std::stringstream ss;
  std::streambuf * old;
};

TEST_CASE( "simulate command" )
{
  param_t param;
  param.parse( "ntrials=60" );
  param.parse( "ntp=20" );
  param.parse( "from=5" );
  param.parse( "to=12" );
  param.parse( "effect=3" );
  param.parse( "points" );

  std::string out;
  {
    cout_capture_t cap;
    rerp::simulate_wrapper( param );
    out = cap.str();
  }

  REQUIRE( out.find( "WIN\tCON\tCH\tSTART" ) != std::string::npos );
  REQUIRE( out.find( "EFFECT\tB-A\t.\t20\t48" ) != std::string::npos );
  REQUIRE( out.find( "PRE\tB-A" ) != std::string::npos );
  REQUIRE( out.find( "COND\tCH\tT\tV" ) != std::string::npos );
}

// numeric field 'col' of the first output row that starts with 'prefix'
static double field( const std::string & out , const std::string & prefix , const int col )
{
  std::stringstream ss( out );
  std::string line;
  while ( std::getline( ss , line ) )
    {
      if ( line.compare( 0 , prefix.size() , prefix ) != 0 ) continue;
      std::vector<std::string> tok = Helper::char_split( line , '\t' );
      double x;
      if ( col < tok.size() && Helper::str2dbl( tok[col] , &x ) ) return x;
    }
  return std::numeric_limits<double>::quiet_NaN();
}

TEST_CASE( "fitting a table from options" )
{
  // 24 trials, 2 timepoints, condition B 2 uV above A
  std::stringstream tab;
  tab << "Subject\tItemNum\tTimestamp\tCondition\tcloze\tCz\n";
  CRandom::srand( 3 );
  for (int i=0; i<24; i++)
    for (int t=0; t<2; t++)
      tab << "S" << ( i % 2 + 1 ) << "\t" << i << "\t" << t * 4 << "\t"
	  << ( i % 3 ? "A" : "B" ) << "\t" << 0.1 * ( i % 4 ) << "\t"
	  << ( i % 3 ? 0.0 : 2.0 ) + CRandom::rnorm( 0 , 0.5 ) << "\n";

  std::string f = write_table( tab.str() );

  param_t param;
  param.parse( "data=" + f );
  param.parse( "ch=Cz" );
  param.parse( "keys=Subject,ItemNum" );
  param.parse( "cat=Condition" );
  param.parse( "ref=A" );
  param.parse( "cont=cloze" );
  param.parse( "center=cloze" );
  param.parse( "window=ALL:0:100" );
  param.parse( "contrast=Condition:B:A" );
  param.parse( "term=cloze" );
  param.parse( "summary" );
  param.parse( "estimate" );
  param.parse( "zero=cloze" );
  param.parse( "avg=0:8" );

  std::string out;
  {
    cout_capture_t cap;
    rerp::run_wrapper( param );
    out = cap.str();
  }

  REQUIRE( out.find( "CH\tT\tTERM\tB\tN\tDF\tSIGMA2" ) != std::string::npos );
  REQUIRE( out.find( "Condition[B]" ) != std::string::npos );
  REQUIRE( out.find( "Condition=B\tCz\t0" ) != std::string::npos );
  REQUIRE( out.find( "ALL\tCondition:B-A" ) != std::string::npos );
  REQUIRE( out.find( "ALL\tcloze" ) != std::string::npos );
  REQUIRE( out.find( "OBS\tCondition=A" ) != std::string::npos );
  REQUIRE( out.find( "EST\tCondition=B" ) != std::string::npos );

  // with cloze held at its centre, A trials are predicted by the intercept
  for (int t=0; t<2; t++)
    {
      const std::string tp = Helper::int2str( t * 4 );
      const double est = field( out , "EST\tCondition=A\tCz\t" + tp + "\t" , 5 );
      const double ref = field( out , "reference\tCz\t" + tp + "\t" , 3 );
      REQUIRE( Helper::realnum( est ) );
      REQUIRE( Helper::realnum( ref ) );
      REQUIRE( est == Approx( ref ).margin( 1e-4 ) );
    }

  param.parse( "by=Subject" );
  {
    cout_capture_t cap;
    rerp::run_wrapper( param );
    out = cap.str();
  }
  REQUIRE( out.find( "Subject=S2\tCz" ) != std::string::npos );
  REQUIRE( out.find( "TERM\tCH\tT\tNGRP\tMEAN\tSEM" ) != std::string::npos );

  std::remove( f.c_str() );
}

TEST_CASE( "zero= holds a predictor at its encoded zero" )
{
  sim_spec_t ss;
  ss.ntrials = 60;
  ss.ntp = 6;
  ss.slope = 3;
  trials_t trials = rerp::simulate( ss );

  model_spec_t spec;
  spec.add( predictor_spec_t::categorical( "Condition" , "A" ) );
  predictor_spec_t cz = predictor_spec_t::continuous( "cloze" , TRANSFORM_ZSCORE );
  cz.invert( 1.0 );
  spec.add( cz );

  design_t design = design_t::build( trials , spec );
  rerp_fit_t fit = rerp::regress( trials , design , rerp_opts_t() );

  param_t param;
  param.parse( "zero=cloze" );
  std::map<std::string,pred_value_t> ov = rerp::zero_overrides( param , design );
  REQUIRE( ov.size() == 1 );

  // the held value encodes to zero
  std::map<std::string,pred_value_t> v;
  v[ "Condition" ] = pred_value_t( "A" );
  v[ "cloze" ] = ov[ "cloze" ];
  REQUIRE( design.encode( v )[ design.column( "cloze" ) ] == Approx( 0 ).margin( 1e-12 ) );

  // so each trial's prediction is its condition's waveform at the cloze zero
  trials_t yhat = rerp::predict( trials , design , fit , ov );
  waveform_t wa = rerp::reconstruct( fit , design , rerp::reference_condition( design , "A" ) , 0 );
  condition_t b = rerp::reference_condition( design , "B" );
  b.set( "Condition" , "B" );
  waveform_t wb = rerp::reconstruct( fit , design , b , 0 );

  for (int i=0; i<trials.size(); i++)
    {
      const bool isb = trials[i].preds.find( "Condition" )->second.str == "B";
      const waveform_t & w = isb ? wb : wa;
      for (int t=0; t<trials.nt(); t++)
	REQUIRE( yhat[i].X( 0 , t ) == Approx( w.v[t] ).margin( 1e-9 ) );
    }

  // an explicit raw value is used as given
  param_t p2;
  p2.parse( "zero=cloze:0.25" );
  REQUIRE( rerp::zero_overrides( p2 , design )[ "cloze" ].num == 0.25 );

  param_t p3;
  p3.parse( "zero=rating" );
  REQUIRE_THROWS( rerp::zero_overrides( p3 , design ) );
}
