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

#ifndef __RERP_SUMMARY_H__
#define __RERP_SUMMARY_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <map>

#include "rerp/trials.h"
#include "rerp/regress.h"

// grouped means and standard errors of voltages

struct erp_summary_t {

  std::vector<std::string> by;

  // first-stage unit (e.g. Subject); empty for a single stage
  std::string within;

  // group key -> channel x timepoint
  std::map<std::string,Eigen::MatrixXd> mean;
  std::map<std::string,Eigen::MatrixXd> sem;

  // trials, or first-stage units, per group
  std::map<std::string,int> n;

};


// coefficients across groups (e.g. Subjects)

struct coef_summary_t {

  std::vector<std::string> terms;
  std::vector<std::string> channels;
  std::vector<double> time;

  int ngroups;

  // term -> channel x timepoint
  std::map<std::string,Eigen::MatrixXd> mean;
  std::map<std::string,Eigen::MatrixXd> sem;

};


struct win_avg_t {
  std::string key;
  int ch;
  double mean;
  int n;
};


namespace rerp {

  // label of a trial's group, e.g. "Condition=A,Region=left"
  std::string group_key( const trial_t & trial , const std::vector<std::string> & by );

  // average within each level of 'within' first (if given), then across those
  erp_summary_t summarize( const trials_t & trials ,
			   const std::vector<std::string> & by ,
			   const std::string & within = "" );

  coef_summary_t coef_summary( const std::map<std::string,group_fit_t> & groups );

  // mean voltage per group and channel over start_ms <= time < stop_ms
  std::vector<win_avg_t> window_averages( const trials_t & trials ,
					  const double start_ms ,
					  const double stop_ms ,
					  const std::vector<std::string> & by );

}

#endif
