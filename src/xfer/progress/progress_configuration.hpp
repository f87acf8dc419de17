#ifndef _XFER_PROGRESS_PROGRESS_CONFIGURATION_H_
#define _XFER_PROGRESS_PROGRESS_CONFIGURATION_H_

#include "base/defines.hpp"
#include "xfer/base/units/time_delta.hpp"

namespace xferstat {

struct XFER_CPP_EXPORT ProgressConfiguration {
    // Whether progress reporting was requested.
    bool enabled = false;
    // Delay between two progress reports, must be positive.
    TimeDelta reporting_interval = TimeDelta::Seconds(3);
    // A dry run transfers nothing, so nothing is reported.
    bool dry_run = false;
};

} // namespace xferstat

#endif
