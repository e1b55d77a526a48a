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

#ifndef __RERP_WINSTATS_H__
#define __RERP_WINSTATS_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <map>

#include "rerp/design.h"
#include "rerp/regress.h"
#include "rerp/reconstruct.h"

struct param_t;

enum correction_t { ADJ_NONE , ADJ_BONFERRONI , ADJ_HOLM , ADJ_FDR_BH , ADJ_FDR_BY };

// none, bonf, holm, fdr, by; throws rerp_error
correction_t correction_type( const std::string & s );

std::string correction_label( const correction_t adj );


struct window_t {

  window_t() : start( 0 ) , stop( -1 ) { }

  window_t( const std::string & label , const int start , const int stop , const std::vector<int> & channels )
    : label( label ) , start( start ) , stop( stop ) , channels( channels ) { }

  std::string label;

  // first and last timepoint, inclusive
  int start, stop;

  std::vector<int> channels;

  int size() const { return stop < start ? 0 : stop - start + 1; }

  // samples with start_ms <= time < stop_ms
  static window_t ms( const std::string & label ,
		      const std::vector<double> & time ,
		      const double start_ms ,
		      const double stop_ms ,
		      const std::vector<int> & channels );

};


struct contrast_t {

  contrast_t() { }

  explicit contrast_t( const std::string & label ) : label( label ) { }

  std::string label;

  // term label -> weight
  std::map<std::string,double> weights;

  contrast_t & weight( const std::string & term , const double w ) { weights[ term ] = w; return *this; }

  // term vector of condition a minus that of condition b
  static contrast_t difference( const design_t & design ,
				const condition_t & a ,
				const condition_t & b ,
				const std::string & label = "" );

  // throws undefined_contrast_error
  Eigen::VectorXd vector( const design_t & design ) const;

};


struct point_stat_t {
  int t;
  double est;
  double se;
  double tstat;
  double p;
};


struct window_stat_t {

  window_stat_t() : ch( -1 ) , start( 0 ) , stop( 0 ) , mean( 0 ) , se( 0 ) , t( 0 ) , df( 0 ) , n( 0 ) ,
		    p( -9 ) , p_adj( -9 ) , sig( false ) { }

  std::string window;
  std::string contrast;

  // -1 : pooled over the window's channels
  int ch;

  int start, stop;

  // contrast amplitude per timepoint
  std::vector<point_stat_t> points;

  double mean;
  double se;
  double t;
  int df;

  // trials entering the test
  int n;

  double p;
  double p_adj;
  bool sig;

};


struct winstats_opts_t {

  winstats_opts_t() : adj( ADJ_FDR_BH ) , alpha( 0.05 ) , per_channel( false ) { }

  correction_t adj;

  double alpha;

  // test each channel of a window separately
  bool per_channel;

  // adj=... alpha=... per-channel
  void set( const param_t & param );

};


namespace rerp {

  // every (window, contrast[, channel]) test, corrected as one family
  std::vector<window_stat_t> window_stats( const rerp_fit_t & fit ,
					   const design_t & design ,
					   const std::vector<window_t> & windows ,
					   const std::vector<contrast_t> & contrasts ,
					   const winstats_opts_t & opts = winstats_opts_t() );

}

#endif
