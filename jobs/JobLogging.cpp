#include "JobLogging.hpp"

Q_LOGGING_CATEGORY(nmfJobs, "nmf.jobs", QtInfoMsg)

namespace nmf {

void enableJobsDebugLogging(bool enabled) {
    QLoggingCategory::setFilterRules(enabled
                                         ? QStringLiteral("nmf.jobs.debug=true")
                                         : QStringLiteral("nmf.jobs.debug=false"));
}

} // namespace nmf
