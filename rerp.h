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

#ifndef __RERP_H__
#define __RERP_H__

#include <cstddef>

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <Eigen/Dense>
#include "stats/statistics.h"

#include "miscmath/crandom.h"

#include "rerp/errors.h"
#include "rerp/trials.h"
#include "rerp/design.h"
#include "rerp/ols.h"
#include "rerp/pool.h"
#include "rerp/regress.h"
#include "rerp/reconstruct.h"
#include "rerp/winstats.h"
#include "rerp/summary.h"
#include "rerp/simulate.h"
#include "rerp/cmd.h"

#endif
