#include "JobFormat.hpp"

#include <QDateTime>

namespace nmf {

const char *jobTypeName(JobType type) {
    switch (type) {
    case JobType::Copy:
        return "copy";
    case JobType::Move:
        return "move";
    }
    return "unknown";
}

const char *jobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::Running:
        return "running";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Canceled:
        return "canceled";
    }
    return "unknown";
}

const char *cancelResultName(CancelResult result) {
    switch (result) {
    case CancelResult::CanceledPending:
        return "CanceledPending";
    case CancelResult::CancelRequested:
        return "CancelRequested";
    case CancelResult::AlreadyFinished:
        return "AlreadyFinished";
    case CancelResult::NotFound:
        return "NotFound";
    }
    return "Unknown";
}

QString clockTime(qint64 epochMs) {
    if (epochMs <= 0)
        return QStringLiteral("—");
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(epochMs);
    if (!dt.isValid())
        return QStringLiteral("—");
    return dt.toString(QStringLiteral("HH:mm:ss"));
}

QString formatJobSummary(const JobSnapshot &job) {
    qint64 when = job.enqueuedAtMs;
    if (job.status == JobStatus::Running && job.startedAtMs > 0)
        when = job.startedAtMs;
    QString line = QStringLiteral("[%1] %2 %3/%4 → %5  (%6)")
                       .arg(clockTime(when), QLatin1String(jobTypeName(job.type)))
                       .arg(job.doneItems)
                       .arg(job.totalItems)
                       .arg(job.destDir, QLatin1String(jobStatusName(job.status)));
    if (job.status == JobStatus::Failed && !job.error.isEmpty())
        line += QStringLiteral("  ERROR");
    return line;
}

QString formatJobDetails(const JobSnapshot &job) {
    QString out = QStringLiteral("Job #%1 %2 → %3\n")
                      .arg(job.id)
                      .arg(QLatin1String(jobTypeName(job.type)), job.destDir);
    out += QStringLiteral("Status: %1, %2/%3 completed\n")
               .arg(QLatin1String(jobStatusName(job.status)))
               .arg(job.doneItems)
               .arg(job.totalItems);
    if (job.status == JobStatus::Running && !job.currentSource.isEmpty())
        out += QStringLiteral("Current: %1\n").arg(job.currentSource);
    if (job.status != JobStatus::Failed)
        return out;

    if (!job.failures.isEmpty()) {
        out += QStringLiteral("Failures:\n");
        for (const JobFailure &f : job.failures) {
            if (!f.topSource.isEmpty())
                out += QStringLiteral("  - item: %1\n").arg(f.topSource);
            if (!f.path.isEmpty())
                out += QStringLiteral("    path: %1\n").arg(f.path);
            if (!f.error.isEmpty())
                out += QStringLiteral("    error: %1\n").arg(f.error);
        }
    } else if (!job.error.isEmpty()) {
        out += QStringLiteral("Error: %1\n").arg(job.error);
    }
    return out;
}

} // namespace nmf
