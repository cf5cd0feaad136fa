#include "JobExecutor.hpp"
#include "Job.hpp"
#include "JobLogging.hpp"

#include <utility>

namespace nmf {

JobExecutor::JobExecutor(const TransferOptions &transfer, NotifyFn notify)
    : transfer_(transfer), notify_(std::move(notify)) {}

JobOutcome JobExecutor::run(Job &job) {
    TransferOptions opt = transfer_;
    opt.mode = job.type() == JobType::Move ? TransferMode::Move
                                           : TransferMode::Copy;

    const quint64 jobId = job.id();
    const CancelFn shouldCancel = [&job]() { return job.cancelRequested(); };
    TraceFn trace;
    if (nmfJobs().isDebugEnabled()) {
        trace = [jobId](const std::string &msg) {
            qCDebug(nmfJobs).noquote()
                << "job" << jobId << QString::fromStdString(msg);
        };
    }

    qCDebug(nmfJobs) << "run job" << jobId << "items=" << job.totalItems()
                     << "dest=" << job.destDir();
    const QStringList &sources = job.sources();
    for (int i = 0; i < sources.size(); ++i) {
        if (job.cancelRequested())
            return {JobStatus::Canceled, QString()};

        const QString &src = sources.at(i);
        const QString name =
            QString::fromStdString(baseName(src.toStdString()));
        job.beginItem(src, opt.mode == TransferMode::Move
                               ? QStringLiteral("Moving %1").arg(name)
                               : QStringLiteral("Copying %1").arg(name));
        if (notify_)
            notify_();

        TransferError err;
        const TransferResult r =
            transferPath(src.toStdString(), job.destDir().toStdString(), opt,
                         err, shouldCancel, trace);
        if (r == TransferResult::Canceled) {
            qCDebug(nmfJobs) << "job" << jobId << "canceled at item" << i + 1
                             << "of" << job.totalItems();
            return {JobStatus::Canceled, QString()};
        }
        if (r == TransferResult::Failed) {
            const QString message = QString::fromStdString(err.message);
            job.addFailure({src, QString::fromStdString(err.path), message});
            return {JobStatus::Failed, message};
        }

        job.setDoneItems(i + 1);
        qCDebug(nmfJobs) << "job" << jobId << "done" << i + 1 << "/"
                         << job.totalItems();
        if (notify_)
            notify_();
    }
    return {JobStatus::Completed, QString()};
}

} // namespace nmf
