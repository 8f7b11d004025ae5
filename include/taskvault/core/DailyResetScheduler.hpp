#pragma once

#include <QDateTime>
#include <QObject>
#include <QTime>
#include <QTimer>

#include <functional>

namespace taskvault {
namespace core {

// Fires a callback once per day at a configured wall-clock time. Waits in
// bounded steps so a suspended machine or a clock change is noticed on the
// next check, and a missed reset runs late instead of being skipped.
class DailyResetScheduler : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;
    using ResetCallback = std::function<void(const QDateTime &)>;

    static constexpr int kMaxCheckIntervalMs = 60000;

    explicit DailyResetScheduler(ResetCallback callback, QObject *parent = nullptr);
    ~DailyResetScheduler() override;

    void setClock(Clock clock);

    QTime resetTime() const;
    // Cancels the pending wait and recomputes the next reset.
    void setResetTime(const QTime &time);

    QDateTime lastReset() const;
    void setLastReset(const QDateTime &lastReset);

    QDateTime nextReset() const;

    void setCheckInterval(int milliseconds);

    void start();
    void stop();
    bool isActive() const;

    // Runs the reset if it is due. Returns true if it ran.
    bool checkNow();

    // First occurrence of time strictly after the given moment.
    static QDateTime nextOccurrence(const QDateTime &after, const QTime &time);

signals:
    void resetPerformed(const QDateTime &when);

private:
    QDateTime nextAfterLastReset(const QDateTime &base) const;
    void recompute();
    void arm();

    ResetCallback m_callback;
    Clock m_clock;
    QTime m_resetTime = QTime(9, 0);
    QDateTime m_lastReset;
    QDateTime m_nextReset;
    int m_checkIntervalMs = kMaxCheckIntervalMs;
    bool m_active = false;
    QTimer m_timer;
};

} // namespace core
} // namespace taskvault
