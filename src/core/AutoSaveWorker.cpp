#include "taskvault/core/AutoSaveWorker.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/data/DocumentRepository.hpp"

#include <QMutexLocker>
#include <QThread>
#include <QTimer>

#include <algorithm>

namespace taskvault {
namespace core {

AutoSaveWorker::AutoSaveWorker(QObject *parent)
    : QObject(parent)
{
}

AutoSaveWorker::~AutoSaveWorker()
{
    if (!stop() && m_thread) {
        qCWarning(lcWorker) << "autosave thread still busy, waiting for it to finish";
        m_thread->wait();
    }
}

void AutoSaveWorker::addRepository(data::DocumentRepository *repository)
{
    QMutexLocker locker(&m_mutex);
    if (repository && std::find(m_repositories.begin(), m_repositories.end(), repository) == m_repositories.end()) {
        m_repositories.push_back(repository);
    }
}

void AutoSaveWorker::clearRepositories()
{
    QMutexLocker locker(&m_mutex);
    m_repositories.clear();
}

void AutoSaveWorker::setInterval(int milliseconds)
{
    QMutexLocker locker(&m_mutex);
    m_intervalMs = std::max(1, milliseconds);
    if (m_timer) {
        QTimer *timer = m_timer;
        const int interval = m_intervalMs;
        QMetaObject::invokeMethod(timer, [timer, interval] { timer->setInterval(interval); }, Qt::QueuedConnection);
    }
    qCInfo(lcWorker) << "autosave interval set to" << m_intervalMs << "ms";
}

int AutoSaveWorker::interval() const
{
    QMutexLocker locker(&m_mutex);
    return m_intervalMs;
}

bool AutoSaveWorker::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_thread && m_thread->isRunning();
}

void AutoSaveWorker::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_thread) {
        return;
    }
    m_thread = std::make_unique<QThread>();
    m_thread->setObjectName(QStringLiteral("taskvault-autosave"));

    m_timer = new QTimer();
    m_timer->setInterval(m_intervalMs);
    m_timer->moveToThread(m_thread.get());

    QTimer *timer = m_timer;
    connect(m_thread.get(), &QThread::started, timer, [timer] { timer->start(); });
    connect(timer, &QTimer::timeout, timer, [this] { flushNow(); });
    connect(m_thread.get(), &QThread::finished, timer, &QObject::deleteLater);

    m_thread->start();
    qCInfo(lcWorker) << "autosave started, interval" << m_intervalMs << "ms";
}

bool AutoSaveWorker::stop(int timeoutMs)
{
    QThread *thread = nullptr;
    QTimer *timer = nullptr;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_thread) {
            return true;
        }
        thread = m_thread.get();
        timer = m_timer;
    }

    // The worker thread takes m_mutex during a flush; wait without holding it.
    QMetaObject::invokeMethod(timer, [timer] { timer->stop(); }, Qt::QueuedConnection);
    thread->quit();
    if (!thread->wait(static_cast<unsigned long>(std::max(0, timeoutMs)))) {
        qCWarning(lcWorker) << "autosave thread did not stop within" << timeoutMs << "ms";
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        m_thread.reset();
        m_timer = nullptr;
    }
    qCInfo(lcWorker) << "autosave stopped";
    return true;
}

int AutoSaveWorker::flushNow()
{
    bool expected = false;
    if (!m_flushing.compare_exchange_strong(expected, true)) {
        qCDebug(lcWorker) << "previous flush still running, skipping cycle";
        return -1;
    }

    std::vector<data::DocumentRepository *> repositories;
    {
        QMutexLocker locker(&m_mutex);
        repositories = m_repositories;
    }

    int written = 0;
    for (data::DocumentRepository *repository : repositories) {
        if (!repository->isDirty()) {
            continue;
        }
        try {
            if (repository->flush()) {
                ++written;
            }
        } catch (const std::exception &e) {
            qCWarning(lcWorker) << "autosave of" << repository->documentName() << "failed:" << e.what();
            emit flushFailed(repository->documentName(), QString::fromLocal8Bit(e.what()));
        }
    }
    m_flushing = false;

    if (written > 0) {
        qCDebug(lcWorker) << "autosave wrote" << written << "documents";
        emit flushed(written);
    }
    return written;
}

} // namespace core
} // namespace taskvault
