// Text helpers for presenting job snapshots (queue lists, detail panes, CLI).
#pragma once
#include "JobTypes.hpp"

#include <QString>

namespace nmf {

const char *jobTypeName(JobType type);
const char *jobStatusName(JobStatus status);
const char *cancelResultName(CancelResult result);

// Clock time (HH:mm:ss, local) for an epoch-ms timestamp; "—" when unset.
QString clockTime(qint64 epochMs);

// One line per job, e.g.
// "[12:30:01] copy 1/3 → /home/me/dst  (running)"
QString formatJobSummary(const JobSnapshot &job);

// Multi-line description with the failure records of a failed job.
QString formatJobDetails(const JobSnapshot &job);

} // namespace nmf
