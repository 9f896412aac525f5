#pragma once

#include <QString>
#include <QtGlobal>

enum class TransferPhase {
    Queued,
    Started,
    InProgress,
    Completed,
    Failed
};

static inline QString transferPhaseToString(TransferPhase p)
{
    switch (p) {
        case TransferPhase::Queued:     return "queued";
        case TransferPhase::Started:    return "started";
        case TransferPhase::InProgress: return "in-progress";
        case TransferPhase::Completed:  return "completed";
        case TransferPhase::Failed:     return "failed";
    }
    return "queued";
}

static inline bool isTerminalPhase(TransferPhase p)
{
    return p == TransferPhase::Completed || p == TransferPhase::Failed;
}

// Wire format between workers and the aggregator.
// Events of one task are emitted by one thread, in order.
struct ProgressEvent {
    quint64 taskId = 0;
    TransferPhase phase = TransferPhase::Queued;
    quint64 bytesDone  = 0;
    quint64 totalBytes = 0;   // 0 = unknown

    QString displayName;      // local file name
    QString remotePath;
    QString reason;           // Failed only
};

// One queued or in-flight download, as seen by the display.
struct TransferTask {
    quint64 id = 0;
    QString remotePath;
    QString displayName;
    quint64 totalBytes = 0;
    quint64 bytesDone  = 0;
    TransferPhase phase = TransferPhase::Queued;
    QString failReason;
};

// Item carried by TransferEventQueue: per-task progress, or a free-form
// notice from the orchestrator (enumeration results/errors).
struct TransferEvent {
    enum class Kind {
        Progress,
        Info,
        Error
    };

    Kind kind = Kind::Progress;
    ProgressEvent progress;
    QString message;          // Info/Error only

    static TransferEvent fromProgress(const ProgressEvent& p)
    {
        TransferEvent e;
        e.kind = Kind::Progress;
        e.progress = p;
        return e;
    }

    static TransferEvent info(const QString& msg)
    {
        TransferEvent e;
        e.kind = Kind::Info;
        e.message = msg;
        return e;
    }

    static TransferEvent error(const QString& msg)
    {
        TransferEvent e;
        e.kind = Kind::Error;
        e.message = msg;
        return e;
    }
};
