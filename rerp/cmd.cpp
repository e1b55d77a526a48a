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

#include "rerp/cmd.h"
#include "rerp/simulate.h"
#include "rerp/errors.h"

#include "helper/helper.h"
#include "defs/defs.h"
#include "param.h"

#include <limits>



static std::string num( const double x )
{
  if ( ! Helper::realnum( x ) ) return globals::missing_value_label;
  std::stringstream ss;
  ss << x;
  return ss.str();
}


model_spec_t rerp::model_spec( const param_t & param )
{

  model_spec_t spec;

  std::vector<std::string> cat = param.strvector( "cat" );
  std::vector<std::string> ref = param.strvector( "ref" );

  if ( cat.size() != ref.size() )
    Helper::halt( "ref must give one reference level for each cat predictor" );

  // levels=pred:l1:l2:...
  std::map<std::string,std::vector<std::string> > levels;
  std::vector<std::string> lv = param.strvector( "levels" );
  for (int i=0; i<lv.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( lv[i] , ":" );
      if ( tok.size() < 2 ) Helper::halt( "bad levels specification: " + lv[i] );
      levels[ tok[0] ].assign( tok.begin() + 1 , tok.end() );
    }

  for (int i=0; i<cat.size(); i++)
    spec.add( predictor_spec_t::categorical( cat[i] , ref[i] , levels[ cat[i] ] ) );

  std::set<std::string> center = param.strset( "center" );
  std::set<std::string> zscore = param.strset( "zscore" );

  // invert=pred:anchor
  std::map<std::string,double> invert;
  std::vector<std::string> iv = param.strvector( "invert" );
  for (int i=0; i<iv.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( iv[i] , ":" );
      double a;
      if ( tok.size() != 2 || ! Helper::str2dbl( tok[1] , &a ) )
	Helper::halt( "bad invert specification (expecting pred:anchor): " + iv[i] );
      invert[ tok[0] ] = a;
    }

  std::vector<std::string> cont = param.strvector( "cont" );
  for (int i=0; i<cont.size(); i++)
    {
      pred_transform_t tr = TRANSFORM_NONE;
      if ( zscore.find( cont[i] ) != zscore.end() ) tr = TRANSFORM_ZSCORE;
      else if ( center.find( cont[i] ) != center.end() ) tr = TRANSFORM_CENTER;
      predictor_spec_t ps = predictor_spec_t::continuous( cont[i] , tr );
      if ( invert.find( cont[i] ) != invert.end() ) ps.invert( invert[ cont[i] ] );
      spec.add( ps );
    }

  std::vector<std::string> inter = param.strvector( "inter" );
  for (int i=0; i<inter.size(); i++)
    spec.interaction( Helper::parse( inter[i] , ":" ) );

  return spec;
}


condition_t rerp::reference_condition( const design_t & design , const std::string & label )
{
  condition_t c( label );
  for (int j=0; j<design.coding.size(); j++)
    {
      const pred_coding_t & pc = design.coding[j];
      if ( pc.role == CATEGORICAL )
	c.set( pc.name , pc.reference );
      else
	c.set( pc.name , pc.reflect ? pc.anchor - pc.center : pc.center );
    }
  return c;
}


std::map<std::string,pred_value_t> rerp::zero_overrides( const param_t & param , const design_t & design )
{
  std::map<std::string,pred_value_t> overrides;

  const condition_t zero = reference_condition( design );

  std::vector<std::string> zs = param.strvector( "zero" );
  for (int i=0; i<zs.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( zs[i] , ":" );
      if ( tok.size() < 1 || tok.size() > 2 )
	Helper::halt( "bad zero specification (expecting pred or pred:value): " + zs[i] );

      std::map<std::string,pred_value_t>::const_iterator zz = zero.preds.find( tok[0] );
      if ( zz == zero.preds.end() )
	Helper::halt( "zero names " + tok[0] + ", which is not a model predictor" );

      double x;
      if ( tok.size() == 1 ) overrides[ tok[0] ] = zz->second;
      else if ( Helper::str2dbl( tok[1] , &x ) ) overrides[ tok[0] ] = pred_value_t( x );
      else overrides[ tok[0] ] = pred_value_t( tok[1] );
    }

  return overrides;
}


void rerp::print_coefs( std::ostream & out , const rerp_fit_t & fit , const std::string & group )
{
  out << ( group != "" ? globals::group_strat + "\t" : "" )
      << globals::signal_strat << "\t" << globals::time_strat << "\t" << globals::term_strat
      << "\tB\tN\tDF\tSIGMA2\n";

  for (int ch=0; ch<fit.nc; ch++)
    for (int t=0; t<fit.nt; t++)
      {
	if ( ! fit.complete( ch , t ) ) continue;
	const coef_t & c = fit( ch , t );
	for (int j=0; j<fit.np; j++)
	  out << ( group != "" ? group + "\t" : "" )
	      << fit.channels[ch] << "\t" << fit.time[t] << "\t" << fit.terms[j] << "\t"
	      << num( c.beta[j] ) << "\t" << c.n() << "\t" << c.df << "\t" << num( c.sigma2 ) << "\n";
      }
}


void rerp::print_waveforms( std::ostream & out , const std::vector<waveform_t> & w )
{
  out << globals::cond_strat << "\t" << globals::signal_strat << "\t" << globals::time_strat << "\tV\n";
  for (int i=0; i<w.size(); i++)
    for (int t=0; t<w[i].v.size(); t++)
      out << w[i].label << "\t" << w[i].channel << "\t" << w[i].time[t] << "\t" << num( w[i].v[t] ) << "\n";
}


void rerp::print_winstats( std::ostream & out , const rerp_fit_t & fit , const std::vector<window_stat_t> & s , const bool points )
{
  out << globals::window_strat << "\t" << globals::contrast_strat << "\t" << globals::signal_strat
      << "\tSTART\tSTOP\tMEAN\tSE\tT\tDF\tN\tP\tPADJ\tSIG\n";

  for (int i=0; i<s.size(); i++)
    out << s[i].window << "\t" << s[i].contrast << "\t"
	<< ( s[i].ch == -1 ? "." : fit.channels[ s[i].ch ] ) << "\t"
	<< fit.time[ s[i].start ] << "\t" << fit.time[ s[i].stop ] << "\t"
	<< num( s[i].mean ) << "\t" << num( s[i].se ) << "\t" << num( s[i].t ) << "\t"
	<< s[i].df << "\t" << s[i].n << "\t"
	<< ( s[i].p < 0 ? globals::missing_value_label : num( s[i].p ) ) << "\t"
	<< ( s[i].p_adj < 0 ? globals::missing_value_label : num( s[i].p_adj ) ) << "\t"
	<< ( s[i].sig ? 1 : 0 ) << "\n";

  if ( ! points ) return;

  out << "\n" << globals::window_strat << "\t" << globals::contrast_strat << "\t" << globals::signal_strat
      << "\t" << globals::time_strat << "\tEST\tSE\tT\tP\n";

  for (int i=0; i<s.size(); i++)
    for (int k=0; k<s[i].points.size(); k++)
      {
	const point_stat_t & pt = s[i].points[k];
	out << s[i].window << "\t" << s[i].contrast << "\t"
	    << ( s[i].ch == -1 ? "." : fit.channels[ s[i].ch ] ) << "\t"
	    << fit.time[ pt.t ] << "\t" << num( pt.est ) << "\t" << num( pt.se ) << "\t"
	    << num( pt.tstat ) << "\t" << ( pt.p < 0 ? globals::missing_value_label : num( pt.p ) ) << "\n";
      }
}


void rerp::print_summary( std::ostream & out , const trials_t & trials , const erp_summary_t & s , const std::string & type )
{
  out << "TYPE\tKEY\t" << globals::signal_strat << "\t" << globals::time_strat << "\tN\tMEAN\tSEM\n";
  std::map<std::string,Eigen::MatrixXd>::const_iterator mm = s.mean.begin();
  while ( mm != s.mean.end() )
    {
      const Eigen::MatrixXd & se = s.sem.find( mm->first )->second;
      const int n = s.n.find( mm->first )->second;
      for (int ch=0; ch<trials.nc(); ch++)
	for (int t=0; t<trials.nt(); t++)
	  out << type << "\t" << mm->first << "\t" << trials.channels[ch] << "\t" << trials.time[t] << "\t"
	      << n << "\t" << num( mm->second(ch,t) ) << "\t" << num( se(ch,t) ) << "\n";
      ++mm;
    }
}


void rerp::print_coef_summary( std::ostream & out , const coef_summary_t & s )
{
  out << globals::term_strat << "\t" << globals::signal_strat << "\t" << globals::time_strat
      << "\tNGRP\tMEAN\tSEM\n";
  for (int j=0; j<s.terms.size(); j++)
    {
      const Eigen::MatrixXd & m = s.mean.find( s.terms[j] )->second;
      const Eigen::MatrixXd & se = s.sem.find( s.terms[j] )->second;
      for (int ch=0; ch<s.channels.size(); ch++)
	for (int t=0; t<s.time.size(); t++)
	  out << s.terms[j] << "\t" << s.channels[ch] << "\t" << s.time[t] << "\t"
	      << s.ngroups << "\t" << num( m(ch,t) ) << "\t" << num( se(ch,t) ) << "\n";
    }
}


// window=LABEL:start:stop (ms), over the channels in win-ch (default all)

static std::vector<window_t> windows( const param_t & param , const trials_t & trials )
{
  std::vector<int> chs;
  if ( param.has( "win-ch" ) )
    {
      std::vector<std::string> s = param.strvector( "win-ch" );
      for (int i=0; i<s.size(); i++)
	{
	  const int c = trials.channel( s[i] );
	  if ( c == -1 ) Helper::halt( "could not find channel " + s[i] );
	  chs.push_back( c );
	}
    }
  else
    for (int c=0; c<trials.nc(); c++) chs.push_back( c );

  std::vector<window_t> w;
  std::vector<std::string> s = param.strvector( "window" );
  for (int i=0; i<s.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( s[i] , ":" );
      double a, b;
      if ( tok.size() != 3 || ! Helper::str2dbl( tok[1] , &a ) || ! Helper::str2dbl( tok[2] , &b ) )
	Helper::halt( "bad window (expecting label:start:stop in ms): " + s[i] );
      w.push_back( window_t::ms( tok[0] , trials.time , a , b , chs ) );
    }
  return w;
}


// contrast=pred:a:b (condition a minus condition b, all else at reference)
// term=T1,T2 (single-term contrasts)

static std::vector<contrast_t> contrasts( const param_t & param , const design_t & design )
{
  std::vector<contrast_t> c;

  std::vector<std::string> s = param.strvector( "contrast" );
  for (int i=0; i<s.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( s[i] , ":" );
      if ( tok.size() != 3 )
	Helper::halt( "bad contrast (expecting pred:a:b): " + s[i] );

      condition_t a = rerp::reference_condition( design , tok[0] + "=" + tok[1] );
      condition_t b = rerp::reference_condition( design , tok[0] + "=" + tok[2] );

      double x;
      if ( Helper::str2dbl( tok[1] , &x ) ) a.set( tok[0] , x ); else a.set( tok[0] , tok[1] );
      if ( Helper::str2dbl( tok[2] , &x ) ) b.set( tok[0] , x ); else b.set( tok[0] , tok[2] );

      c.push_back( contrast_t::difference( design , a , b , tok[0] + ":" + tok[1] + "-" + tok[2] ) );
    }

  std::vector<std::string> t = param.strvector( "term" );
  for (int i=0; i<t.size(); i++)
    c.push_back( contrast_t( t[i] ).weight( t[i] , 1 ) );

  return c;
}


void rerp::run_wrapper( param_t & param )
{

  //
  // input
  //

  table_spec_t ts;
  ts.time = param.has( "time" ) ? param.value( "time" ) : "Timestamp" ;
  ts.keys = param.strvector( "keys" );
  ts.channels = param.strvector( "ch" );
  ts.desc = param.strvector( "desc" );

  std::vector<std::string> cat = param.strvector( "cat" );
  std::vector<std::string> cont = param.strvector( "cont" );
  ts.preds = cat;
  ts.preds.insert( ts.preds.end() , cont.begin() , cont.end() );

  // rename=from:to applies to predictor columns
  std::map<std::string,std::string> renames;
  std::vector<std::string> rn = param.strvector( "rename" );
  for (int i=0; i<rn.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( rn[i] , ":" );
      if ( tok.size() != 2 ) Helper::halt( "bad rename (expecting from:to): " + rn[i] );
      renames[ tok[1] ] = tok[0];
    }

  for (int i=0; i<ts.preds.size(); i++)
    if ( renames.find( ts.preds[i] ) != renames.end() )
      ts.preds[i] = renames[ ts.preds[i] ];

  trials_t trials;
  trials.read( param.requires( "data" ) , ts );

  std::map<std::string,std::string>::const_iterator rr = renames.begin();
  while ( rr != renames.end() )
    {
      trials.rename_predictor( rr->second , rr->first );
      ++rr;
    }

  // relabel=name:from:to
  std::vector<std::string> rl = param.strvector( "relabel" );
  for (int i=0; i<rl.size(); i++)
    {
      std::vector<std::string> tok = Helper::parse( rl[i] , ":" );
      if ( tok.size() != 3 ) Helper::halt( "bad relabel (expecting name:from:to): " + rl[i] );
      trials.rename_level( tok[0] , tok[1] , tok[2] );
    }

  model_spec_t spec = model_spec( param );

  rerp_opts_t opts;
  opts.set( param );

  winstats_opts_t wopts;
  wopts.set( param );

  //
  // observed ERPs
  //

  const std::string within = param.has( "within" ) ? param.value( "within" ) : "" ;

  if ( param.yesno( "summary" ) )
    print_summary( std::cout , trials , summarize( trials , cat , within ) , "OBS" );

  //
  // per-group fits
  //

  if ( param.has( "by" ) )
    {
      const std::string by = param.value( "by" );
      std::map<std::string,group_fit_t> groups = regress_by_group( trials , spec , by , opts );
      std::map<std::string,group_fit_t>::const_iterator gg = groups.begin();
      while ( gg != groups.end() )
	{
	  print_coefs( std::cout , gg->second.fit , by + "=" + gg->first );
	  ++gg;
	}
      print_coef_summary( std::cout , coef_summary( groups ) );
      return;
    }

  //
  // pooled fit
  //

  design_t design = design_t::build( trials , spec );

  rerp_fit_t fit = regress( trials , design , opts );

  print_coefs( std::cout , fit );

  // waveforms for each level of each categorical predictor
  std::vector<waveform_t> w;
  condition_t ref = reference_condition( design , "reference" );
  std::vector<waveform_t> w0 = reconstruct( fit , design , ref );
  w.insert( w.end() , w0.begin() , w0.end() );
  for (int j=0; j<design.coding.size(); j++)
    {
      const pred_coding_t & pc = design.coding[j];
      for (int l=0; l<pc.levels.size(); l++)
	{
	  condition_t c = ref;
	  c.label = pc.name + "=" + pc.levels[l];
	  c.set( pc.name , pc.levels[l] );
	  std::vector<waveform_t> wl = reconstruct( fit , design , c );
	  w.insert( w.end() , wl.begin() , wl.end() );
	}
    }
  print_waveforms( std::cout , w );

  //
  // model-based ERPs: estimate=Y, resid=Y, zero=pred:value holds predictors fixed
  //

  std::map<std::string,pred_value_t> overrides = zero_overrides( param , design );

  if ( param.yesno( "estimate" ) )
    print_summary( std::cout , trials , summarize( predict( trials , design , fit , overrides ) , cat , within ) , "EST" );

  if ( param.yesno( "resid" ) )
    print_summary( std::cout , trials , summarize( residuals( trials , design , fit , overrides ) , cat , within ) , "RES" );

  //
  // window statistics
  //

  if ( param.has( "window" ) )
    {
      std::vector<window_t> wins = windows( param , trials );
      std::vector<contrast_t> cons = contrasts( param , design );
      if ( cons.size() == 0 )
	Helper::halt( "window requires at least one contrast (contrast= or term=)" );
      print_winstats( std::cout , fit , window_stats( fit , design , wins , cons , wopts ) , param.yesno( "points" ) );
    }

  // window-mean voltages: avg=start:stop (ms)
  if ( param.has( "avg" ) )
    {
      std::vector<double> a = param.dblvector( "avg" , ":" );
      if ( a.size() != 2 ) Helper::halt( "bad avg (expecting start:stop in ms)" );
      std::vector<win_avg_t> av = window_averages( trials , a[0] , a[1] , cat );
      std::cout << "KEY\t" << globals::signal_strat << "\tN\tMEAN\n";
      for (int i=0; i<av.size(); i++)
	std::cout << av[i].key << "\t" << trials.channels[ av[i].ch ] << "\t" << av[i].n << "\t" << num( av[i].mean ) << "\n";
    }

}


void rerp::simulate_wrapper( param_t & param )
{

  sim_spec_t ss;
  ss.set( param );

  trials_t trials = simulate( ss );

  model_spec_t spec;
  spec.add( predictor_spec_t::categorical( "Condition" , "A" ) );
  if ( ss.slope != 0 ) spec.add( predictor_spec_t::continuous( "cloze" , TRANSFORM_CENTER ) );

  rerp_opts_t opts;
  opts.set( param );

  winstats_opts_t wopts;
  wopts.set( param );

  design_t design = design_t::build( trials , spec );

  rerp_fit_t fit = regress( trials , design , opts );

  condition_t a = reference_condition( design , "A" );
  condition_t b = reference_condition( design , "B" );
  b.set( "Condition" , "B" );

  std::vector<waveform_t> w = reconstruct( fit , design , a );
  std::vector<waveform_t> wb = reconstruct( fit , design , b );
  w.insert( w.end() , wb.begin() , wb.end() );
  print_waveforms( std::cout , w );

  std::vector<int> chs;
  for (int c=0; c<trials.nc(); c++) chs.push_back( c );

  std::vector<window_t> wins;
  wins.push_back( window_t( "EFFECT" , ss.from , ss.to , chs ) );
  if ( ss.from > 0 ) wins.push_back( window_t( "PRE" , 0 , ss.from - 1 , chs ) );
  if ( ss.to < ss.ntp - 1 ) wins.push_back( window_t( "POST" , ss.to + 1 , ss.ntp - 1 , chs ) );

  std::vector<contrast_t> cons( 1 , contrast_t::difference( design , b , a , "B-A" ) );

  print_winstats( std::cout , fit , window_stats( fit , design , wins , cons , wopts ) , param.yesno( "points" ) );

}
