#pragma once

#include "util/CSV.hpp"
#include "util/Config.hpp"

#include <ostream>

namespace trendline {

/*
 * Streams x,y rows through the regression and prints the line with its band
 * at every row once three points are held:
 *
 *   x,y,lower,fitted,upper,residual,pearsonsR
 *
 * With a window configured the oldest point is shifted off once the window
 * is full, so the line follows the most recent points.  Rows that cannot be
 * used and windows without a fit are reported on err and skipped.
 */
void trend(CSV & csv, Config const & config, std::ostream & out, std::ostream & err);

}
