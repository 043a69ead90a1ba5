
//    --------------------------------------------------------------------
//
//    This file is part of Velo.
//
//    VELO is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Velo is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Velo. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#ifndef __VELO_H__
#define __VELO_H__

#include <cstddef>

#include "param.h"

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include "intervals/intervals.h"

#include "stats/eigen_ops.h"
#include "stats/running-stats.h"

#include "miscmath/miscmath.h"

#include "stream/stream.h"
#include "zones/zones.h"
#include "segments/segments.h"
#include "metrics/metrics.h"
#include "metrics/rollup.h"
#include "dashboard/dashboard.h"
#include "dashboard/rtables.h"
#include "pipeline/pipeline.h"

extern logger_t logger;

#endif
