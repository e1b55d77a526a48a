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

static model_spec_t condition_model()
{
  model_spec_t spec;
  spec.add( predictor_spec_t::categorical( "Condition" , "A" ) );
  return spec;
}

static std::vector<int> all_channels( const trials_t & trials )
{
  std::vector<int> chs;
  for (int c=0; c<trials.nc(); c++) chs.push_back( c );
  return chs;
}


TEST_CASE( "a 2 uV effect in 10-30 is detected" )
{
  sim_spec_t ss;    // 100 trials, 50 timepoints, +2 uV on 10..30
  trials_t trials = rerp::simulate( ss );
  design_t design = design_t::build( trials , condition_model() );
  rerp_fit_t fit = rerp::regress( trials , design , rerp_opts_t() );

  std::vector<window_t> wins;
  wins.push_back( window_t( "EFFECT" , 10 , 30 , all_channels( trials ) ) );
  wins.push_back( window_t( "PRE" , 0 , 9 , all_channels( trials ) ) );

  std::vector<contrast_t> cons;
  cons.push_back( contrast_t( "B-A" ).weight( "Condition[B]" , 1 ) );

  std::vector<window_stat_t> s = rerp::window_stats( fit , design , wins , cons );

  REQUIRE( s.size() == 2 );
  REQUIRE( s[0].window == "EFFECT" );
  REQUIRE( s[0].points.size() == 21 );
  REQUIRE( s[0].mean == Approx( 2.0 ).margin( 0.3 ) );
  REQUIRE( s[0].df == 98 );
  REQUIRE( s[0].n == 100 );
  REQUIRE( s[0].sig );
  REQUIRE( s[0].p_adj < 0.001 );

  REQUIRE( fabs( s[1].mean ) < 0.5 );

  // every point in the effect window shows the effect
  for (int k=0; k<s[0].points.size(); k++)
    REQUIRE( s[0].points[k].est > 1 );
}

TEST_CASE( "window test equals OLS on the window-averaged response" )
{
  sim_spec_t ss;
  ss.ntrials = 60;
  ss.ntp = 20;
  ss.nch = 2;
  trials_t trials = rerp::simulate( ss );
  design_t design = design_t::build( trials , condition_model() );
  rerp_fit_t fit = rerp::regress( trials , design , rerp_opts_t() );

  std::vector<window_t> wins( 1 , window_t( "W" , 5 , 14 , all_channels( trials ) ) );
  std::vector<contrast_t> cons( 1 , contrast_t( "B" ).weight( "Condition[B]" , 1 ) );

  winstats_opts_t wo;
  wo.adj = ADJ_NONE;
  window_stat_t s = rerp::window_stats( fit , design , wins , cons , wo )[0];

  Eigen::VectorXd ybar = Eigen::VectorXd::Zero( trials.size() );
  for (int i=0; i<trials.size(); i++)
    {
      for (int ch=0; ch<2; ch++)
	for (int t=5; t<=14; t++) ybar[i] += trials[i].X( ch , t );
      ybar[i] /= 20.0;
    }

  ols_t ols( design.X );
  coef_t c = ols.fit( ybar );
  const double se = sqrt( c.sigma2 * ols.VX(1,1) );

  REQUIRE( s.mean == Approx( c.beta[1] ) );
  REQUIRE( s.se == Approx( se ) );
  REQUIRE( s.t == Approx( c.beta[1] / se ) );
  REQUIRE( s.df == c.df );
  REQUIRE( s.p == Approx( Statistics::t_prob( c.beta[1] / se , c.df ) ) );
  REQUIRE( s.p_adj == s.p );
}

TEST_CASE( "window tests with scattered missing samples" )
{
  sim_spec_t ss;
  ss.ntrials = 100;
  ss.ntp = 120;
  ss.from = 10;
  ss.to = 110;
  ss.missing = 0.05;
  trials_t trials = rerp::simulate( ss );
  REQUIRE( trials.missing() > 0 );

  design_t design = design_t::build( trials , condition_model() );
  rerp_fit_t fit = rerp::regress( trials , design , rerp_opts_t() );
  REQUIRE( fit.complete() );

  std::vector<window_t> wins( 1 , window_t( "EFFECT" , 10 , 110 , std::vector<int>( 1 , 0 ) ) );
  std::vector<contrast_t> cons( 1 , contrast_t( "B-A" ).weight( "Condition[B]" , 1 ) );

  window_stat_t s = rerp::window_stats( fit , design , wins , cons )[0];

  SECTION( "a long window keeps every trial with data" )
    {
      REQUIRE( s.n == 100 );
      REQUIRE( s.df == 98 );
      REQUIRE( Helper::realnum( s.p ) );
      REQUIRE( s.p >= 0 );
      REQUIRE( s.mean == Approx( 2.0 ).margin( 0.3 ) );
      REQUIRE( s.sig );
    }

  SECTION( "point statistics at a gappy timepoint are the OLS test without the gaps" )
    {
      int k = -1;
      for (int j=0; j<s.points.size(); j++)
	if ( fit( 0 , s.points[j].t ).excluded.size() ) { k = j; break; }
      REQUIRE( k != -1 );

      const point_stat_t & pt = s.points[k];
      Eigen::VectorXd y = trials.response( 0 , pt.t );

      std::vector<int> rows;
      for (int i=0; i<y.size(); i++) if ( Helper::realnum( y[i] ) ) rows.push_back( i );
      REQUIRE( rows.size() < 100 );

      Eigen::MatrixXd Xr( rows.size() , design.cols() );
      Eigen::VectorXd yr( rows.size() );
      for (int i=0; i<rows.size(); i++)
	{
	  Xr.row(i) = design.X.row( rows[i] );
	  yr[i] = y[ rows[i] ];
	}

      ols_t ols( Xr );
      coef_t c = ols.fit( yr );
      const double se = sqrt( c.sigma2 * ols.VX(1,1) );

      REQUIRE( pt.est == Approx( c.beta[1] ) );
      REQUIRE( pt.se == Approx( se ) );
      REQUIRE( pt.tstat == Approx( c.beta[1] / se ) );
      REQUIRE( pt.p == Approx( Statistics::t_prob( c.beta[1] / se , c.df ) ) );
    }
}

TEST_CASE( "null windows are calibrated" )
{
  const int nrep = 200;
  int hits = 0;

  for (int r=0; r<nrep; r++)
    {
      sim_spec_t ss;
      ss.ntrials = 40;
      ss.ntp = 10;
      ss.effect = 0;
      ss.seed = 1000 + r;
      trials_t trials = rerp::simulate( ss );
      design_t design = design_t::build( trials , condition_model() );
      rerp_opts_t opts;
      opts.nthreads = 1;
      rerp_fit_t fit = rerp::regress( trials , design , opts );

      std::vector<window_t> wins( 1 , window_t( "W" , 2 , 7 , all_channels( trials ) ) );
      std::vector<contrast_t> cons( 1 , contrast_t( "B-A" ).weight( "Condition[B]" , 1 ) );

      winstats_opts_t wo;
      wo.adj = ADJ_NONE;
      if ( rerp::window_stats( fit , design , wins , cons , wo )[0].p < 0.05 ) ++hits;
    }

  const double rate = hits / (double)nrep;
  REQUIRE( rate > 0.01 );
  REQUIRE( rate < 0.10 );
}

TEST_CASE( "window tests are corrected as one family" )
{
  sim_spec_t ss;
  ss.ntrials = 50;
  ss.ntp = 40;
  ss.nch = 3;
  trials_t trials = rerp::simulate( ss );
  design_t design = design_t::build( trials , condition_model() );
  rerp_fit_t fit = rerp::regress( trials , design , rerp_opts_t() );

  std::vector<window_t> wins;
  wins.push_back( window_t( "early" , 0 , 9 , all_channels( trials ) ) );
  wins.push_back( window_t( "mid" , 10 , 30 , all_channels( trials ) ) );

  std::vector<contrast_t> cons;
  cons.push_back( contrast_t( "B-A" ).weight( "Condition[B]" , 1 ) );
  cons.push_back( contrast_t( "A" ).weight( "(Intercept)" , 1 ) );

  winstats_opts_t none;
  none.adj = ADJ_NONE;
  none.per_channel = true;
  std::vector<window_stat_t> raw = rerp::window_stats( fit , design , wins , cons , none );

  // 2 windows x 2 contrasts x 3 channels
  REQUIRE( raw.size() == 12 );
  REQUIRE( raw[0].ch == 0 );
  REQUIRE( raw[2].ch == 2 );

  winstats_opts_t bonf = none;
  bonf.adj = ADJ_BONFERRONI;
  std::vector<window_stat_t> adj = rerp::window_stats( fit , design , wins , cons , bonf );

  for (int i=0; i<12; i++)
    {
      REQUIRE( raw[i].p_adj == raw[i].p );
      REQUIRE( adj[i].p == raw[i].p );
      REQUIRE( adj[i].p_adj == Approx( std::min( 1.0 , 12 * raw[i].p ) ) );
      REQUIRE( adj[i].sig == ( adj[i].p_adj < 0.05 ) );
    }

  winstats_opts_t fdr = none;
  fdr.adj = ADJ_FDR_BH;
  std::vector<window_stat_t> bh = rerp::window_stats( fit , design , wins , cons , fdr );
  for (int i=0; i<12; i++)
    {
      REQUIRE( bh[i].p_adj >= bh[i].p );
      REQUIRE( bh[i].p_adj <= adj[i].p_adj + 1e-12 );
    }
}

TEST_CASE( "contrasts from conditions" )
{
  sim_spec_t ss;
  ss.ntrials = 30;
  ss.ntp = 10;
  trials_t trials = rerp::simulate( ss );
  design_t design = design_t::build( trials , condition_model() );

  condition_t a( "A" ), b( "B" );
  a.set( "Condition" , "A" );
  b.set( "Condition" , "B" );

  contrast_t c = contrast_t::difference( design , b , a );
  REQUIRE( c.label == "B-A" );
  REQUIRE( c.weights.size() == 1 );
  REQUIRE( c.weights[ "Condition[B]" ] == 1 );

  Eigen::VectorXd v = c.vector( design );
  REQUIRE( v[0] == 0 );
  REQUIRE( v[1] == 1 );

  REQUIRE_THROWS_AS( contrast_t::difference( design , a , a ).vector( design ) , undefined_contrast_error );
}

TEST_CASE( "window and contrast errors" )
{
  sim_spec_t ss;
  ss.ntrials = 30;
  ss.ntp = 10;
  trials_t trials = rerp::simulate( ss );
  design_t design = design_t::build( trials , condition_model() );
  rerp_fit_t fit = rerp::regress( trials , design , rerp_opts_t() );

  std::vector<contrast_t> cons( 1 , contrast_t( "B-A" ).weight( "Condition[B]" , 1 ) );
  std::vector<window_t> ok( 1 , window_t( "W" , 2 , 4 , all_channels( trials ) ) );

  SECTION( "stop before start" )
    {
      std::vector<window_t> w( 1 , window_t( "W" , 5 , 4 , all_channels( trials ) ) );
      REQUIRE_THROWS_AS( rerp::window_stats( fit , design , w , cons ) , empty_window_error );
    }

  SECTION( "ms range with no samples" )
    {
      std::vector<window_t> w( 1 , window_t::ms( "late" , trials.time , 500 , 600 , all_channels( trials ) ) );
      REQUIRE_THROWS_AS( rerp::window_stats( fit , design , w , cons ) , empty_window_error );
      REQUIRE_THROWS_WITH( rerp::window_stats( fit , design , w , cons ) , Catch::Contains( "late" ) );
    }

  SECTION( "past the last timepoint" )
    {
      std::vector<window_t> w( 1 , window_t( "W" , 8 , 12 , all_channels( trials ) ) );
      REQUIRE_THROWS_AS( rerp::window_stats( fit , design , w , cons ) , empty_window_error );
    }

  SECTION( "no channels" )
    {
      std::vector<window_t> w( 1 , window_t( "W" , 2 , 4 , std::vector<int>() ) );
      REQUIRE_THROWS_AS( rerp::window_stats( fit , design , w , cons ) , empty_window_error );
    }

  SECTION( "unknown channel" )
    {
      std::vector<window_t> w( 1 , window_t( "W" , 2 , 4 , std::vector<int>( 1 , 3 ) ) );
      REQUIRE_THROWS_AS( rerp::window_stats( fit , design , w , cons ) , empty_window_error );
    }

  SECTION( "unknown term" )
    {
      std::vector<contrast_t> bad( 1 , contrast_t( "C-A" ).weight( "Condition[C]" , 1 ) );
      REQUIRE_THROWS_AS( rerp::window_stats( fit , design , ok , bad ) , undefined_contrast_error );
      REQUIRE_THROWS_WITH( rerp::window_stats( fit , design , ok , bad ) , Catch::Contains( "Condition[C]" ) );
    }

  SECTION( "unfitted timepoints" )
    {
      rerp_fit_t part = fit;
      part.coef[3] = coef_t();
      REQUIRE_THROWS_AS( rerp::window_stats( part , design , ok , cons ) , rerp_error );
    }
}

TEST_CASE( "ms windows are half-open" )
{
  std::vector<double> time;
  for (int t=0; t<10; t++) time.push_back( t * 4 );
  window_t w = window_t::ms( "W" , time , 8 , 20 , std::vector<int>( 1 , 0 ) );
  REQUIRE( w.start == 2 );
  REQUIRE( w.stop == 4 );
  REQUIRE( w.size() == 3 );
}

TEST_CASE( "correction methods by name" )
{
  REQUIRE( correction_type( "fdr" ) == ADJ_FDR_BH );
  REQUIRE( correction_type( "BONF" ) == ADJ_BONFERRONI );
  REQUIRE( correction_type( "holm" ) == ADJ_HOLM );
  REQUIRE( correction_type( "by" ) == ADJ_FDR_BY );
  REQUIRE( correction_type( "none" ) == ADJ_NONE );
  REQUIRE_THROWS_AS( correction_type( "tukey" ) , rerp_error );

  // default is FDR, never silently uncorrected
  winstats_opts_t wo;
  REQUIRE( wo.adj == ADJ_FDR_BH );
  REQUIRE( wo.alpha == 0.05 );
}
