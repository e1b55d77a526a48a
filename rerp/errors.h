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

#ifndef __RERP_ERRORS_H__
#define __RERP_ERRORS_H__

#include <stdexcept>
#include <string>

// all modelling errors thrown by the rerp library

struct rerp_error : public std::runtime_error {
  explicit rerp_error( const std::string & msg ) : std::runtime_error( msg ) { }
};

// bad or missing predictor, rank-deficient design, inconsistent trials
struct design_error : public rerp_error {
  explicit design_error( const std::string & msg ) : rerp_error( "design specification error: " + msg ) { }
};

// design numerically unstable (condition number over threshold)
struct ill_conditioned_error : public rerp_error {
  explicit ill_conditioned_error( const std::string & msg ) : rerp_error( "ill-conditioned design: " + msg ) { }
};

// reconstruction requested outside the fitted factor levels
struct unsupported_condition_error : public rerp_error {
  explicit unsupported_condition_error( const std::string & msg ) : rerp_error( "unsupported condition: " + msg ) { }
};

struct empty_window_error : public rerp_error {
  explicit empty_window_error( const std::string & msg ) : rerp_error( "empty window: " + msg ) { }
};

struct undefined_contrast_error : public rerp_error {
  explicit undefined_contrast_error( const std::string & msg ) : rerp_error( "undefined contrast: " + msg ) { }
};

#endif
