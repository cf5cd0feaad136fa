// Logging category for the background job queue.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(nmfJobs)

namespace nmf {

// Debug output of nmf.jobs is off by default; this toggles the per-path trace.
void enableJobsDebugLogging(bool enabled);

} // namespace nmf
