#pragma once

#include <QMutex>
#include <QObject>
#include <QString>

#include <atomic>
#include <memory>
#include <vector>

class QThread;
class QTimer;

namespace taskvault {
namespace data {
class DocumentRepository;
}

namespace core {

// Periodically flushes dirty repositories from a dedicated thread.
class AutoSaveWorker : public QObject
{
    Q_OBJECT

public:
    static constexpr int kDefaultIntervalMs = 30000;
    static constexpr int kStopTimeoutMs = 10000;

    explicit AutoSaveWorker(QObject *parent = nullptr);
    ~AutoSaveWorker() override;

    // Repositories are not owned and must outlive the worker or be removed
    // after stop().
    void addRepository(data::DocumentRepository *repository);
    void clearRepositories();

    void setInterval(int milliseconds);
    int interval() const;

    bool isRunning() const;
    void start();
    // Returns false if the thread did not finish within timeoutMs.
    bool stop(int timeoutMs = kStopTimeoutMs);

    // Flushes on the calling thread. Returns the number of documents written,
    // or -1 when another flush cycle is still running.
    int flushNow();

signals:
    void flushed(int documents);
    void flushFailed(const QString &document, const QString &reason);

private:
    mutable QMutex m_mutex;
    std::vector<data::DocumentRepository *> m_repositories;
    int m_intervalMs = kDefaultIntervalMs;
    std::unique_ptr<QThread> m_thread;
    QTimer *m_timer = nullptr;
    std::atomic<bool> m_flushing{false};
};

} // namespace core
} // namespace taskvault
