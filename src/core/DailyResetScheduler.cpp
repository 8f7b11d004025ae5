#include "taskvault/core/DailyResetScheduler.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"

#include <algorithm>

namespace taskvault {
namespace core {

DailyResetScheduler::DailyResetScheduler(ResetCallback callback, QObject *parent)
    : QObject(parent)
    , m_callback(std::move(callback))
    , m_clock([] { return QDateTime::currentDateTime(); })
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, [this] { checkNow(); });
}

DailyResetScheduler::~DailyResetScheduler() = default;

void DailyResetScheduler::setClock(Clock clock)
{
    m_clock = std::move(clock);
    recompute();
}

QTime DailyResetScheduler::resetTime() const
{
    return m_resetTime;
}

void DailyResetScheduler::setResetTime(const QTime &time)
{
    if (!time.isValid()) {
        throw ValidationError(QStringLiteral("daily_reset_time"), QStringLiteral("must be HH:mm"));
    }
    m_resetTime = QTime(time.hour(), time.minute());
    recompute();
    qCInfo(lcWorker) << "daily reset time set to" << m_resetTime.toString(QStringLiteral("HH:mm")) << "next"
                     << m_nextReset.toString(Qt::ISODate);
}

QDateTime DailyResetScheduler::lastReset() const
{
    return m_lastReset;
}

void DailyResetScheduler::setLastReset(const QDateTime &lastReset)
{
    m_lastReset = lastReset;
    recompute();
}

QDateTime DailyResetScheduler::nextReset() const
{
    return m_nextReset;
}

void DailyResetScheduler::setCheckInterval(int milliseconds)
{
    m_checkIntervalMs = std::clamp(milliseconds, 1, kMaxCheckIntervalMs);
    if (m_active) {
        arm();
    }
}

void DailyResetScheduler::start()
{
    m_active = true;
    recompute();
    checkNow();
}

void DailyResetScheduler::stop()
{
    m_active = false;
    m_timer.stop();
}

bool DailyResetScheduler::isActive() const
{
    return m_active;
}

bool DailyResetScheduler::checkNow()
{
    const QDateTime now = m_clock();
    if (!m_nextReset.isValid() || now < m_nextReset) {
        arm();
        return false;
    }

    qCInfo(lcWorker) << "running daily reset scheduled for" << m_nextReset.toString(Qt::ISODate);
    try {
        if (m_callback) {
            m_callback(now);
        }
    } catch (const Error &e) {
        qCWarning(lcWorker) << "daily reset failed, retrying on next check:" << e.message();
        arm();
        return false;
    }

    m_lastReset = now;
    m_nextReset = nextAfterLastReset(now);
    emit resetPerformed(now);
    arm();
    return true;
}

QDateTime DailyResetScheduler::nextOccurrence(const QDateTime &after, const QTime &time)
{
    QDateTime candidate(after.date(), time);
    if (candidate <= after) {
        candidate = QDateTime(after.date().addDays(1), time);
    }
    return candidate;
}

QDateTime DailyResetScheduler::nextAfterLastReset(const QDateTime &base) const
{
    QDateTime next = nextOccurrence(base, m_resetTime);
    // At most one reset per calendar day.
    if (m_lastReset.isValid() && next.date() <= m_lastReset.date()) {
        next = QDateTime(m_lastReset.date().addDays(1), m_resetTime);
    }
    return next;
}

void DailyResetScheduler::recompute()
{
    // Without a recorded reset there is nothing to catch up on.
    const QDateTime base = m_lastReset.isValid() ? m_lastReset : m_clock();
    m_nextReset = nextAfterLastReset(base);
    if (m_active) {
        arm();
    }
}

void DailyResetScheduler::arm()
{
    if (!m_active) {
        return;
    }
    const qint64 untilNext = m_clock().msecsTo(m_nextReset);
    const qint64 wait = std::clamp<qint64>(untilNext, 0, m_checkIntervalMs);
    m_timer.start(static_cast<int>(wait));
}

} // namespace core
} // namespace taskvault
