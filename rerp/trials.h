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

#ifndef __RERP_TRIALS_H__
#define __RERP_TRIALS_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <map>
#include <set>

// a raw predictor value: a categorical level or a number

struct pred_value_t {

  pred_value_t() : is_num( false ) , num( 0 ) { }

  pred_value_t( double x ) : is_num( true ) , num( x ) { }

  pred_value_t( const std::string & s ) : is_num( false ) , num( 0 ) , str( s ) { }

  pred_value_t( const char * s ) : is_num( false ) , num( 0 ) , str( s ) { }

  bool is_num;
  double num;
  std::string str;

  // numeric value (parsing a string level if needed)
  bool numeric( double * x ) const;

  // level label (a number is printed)
  std::string level() const;

  bool operator==( const pred_value_t & rhs ) const;
  bool operator!=( const pred_value_t & rhs ) const { return ! ( *this == rhs ) ; }

};


// one epoch: channel x timepoint voltages, predictors and descriptors

struct trial_t {

  trial_t() { }

  trial_t( const Eigen::MatrixXd & eeg ) : X( eeg ) { }

  // channels (rows) x timepoints (cols); missing samples are NaN
  Eigen::MatrixXd X;

  // model predictors
  std::map<std::string,pred_value_t> preds;

  // descriptors (Subject, ItemNum, ...) never used as model terms
  std::map<std::string,std::string> desc;

  trial_t & pred( const std::string & name , const pred_value_t & v ) { preds[ name ] = v; return *this; }

  trial_t & descriptor( const std::string & name , const std::string & v ) { desc[ name ] = v; return *this; }

  bool has_pred( const std::string & name ) const { return preds.find( name ) != preds.end(); }

  bool has_desc( const std::string & name ) const { return desc.find( name ) != desc.end(); }

};


// long-format table layout for trials_t::read()

struct table_spec_t {

  table_spec_t() : time( "Timestamp" ) { }

  // time axis column (ms)
  std::string time;

  // columns that jointly identify one trial (e.g. Subject,ItemNum)
  std::vector<std::string> keys;

  // voltage columns, one per channel
  std::vector<std::string> channels;

  // predictor columns; numeric entries are stored as numbers
  std::vector<std::string> preds;

  // further per-trial descriptor columns (e.g. Condition)
  std::vector<std::string> desc;

};


struct trials_t {

  trials_t() { }

  trials_t( const std::vector<std::string> & channels ,
	    const std::vector<double> & time )
    : channels( channels ) , time( time ) { }

  std::vector<std::string> channels;

  // ms, one per timepoint
  std::vector<double> time;

  // append a trial; dimensions must match channels x time
  void add( const trial_t & trial );

  int size() const { return trials.size(); }
  int nc() const { return channels.size(); }
  int nt() const { return time.size(); }

  const trial_t & operator[]( const int i ) const { return trials[i]; }

  // voltages at (channel, timepoint) across all trials
  Eigen::VectorXd response( const int ch , const int t ) const;

  // -1 if not found
  int channel( const std::string & label ) const;

  // index of the first timepoint >= ms, or nt() if none
  int timepoint( const double ms ) const;

  // observed levels of a predictor or descriptor
  std::set<std::string> levels( const std::string & name ) const;

  std::vector<int> rows( const std::string & desc , const std::string & level ) const;

  trials_t subset( const std::vector<int> & rows ) const;

  // same trials, new voltages (one matrix per trial)
  trials_t with_voltages( const std::vector<Eigen::MatrixXd> & V ) const;

  // editing
  void rename_predictor( const std::string & from , const std::string & to );

  void rename_level( const std::string & name , const std::string & from , const std::string & to );

  // long-format text input: one row per trial x timepoint
  void read( const std::string & filename , const table_spec_t & spec );

  // total number of missing (NaN) samples
  int missing() const;

 private:

  std::vector<trial_t> trials;

};

#endif
