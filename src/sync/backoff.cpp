#include "backoff.h"

#include <QEventLoop>
#include <QTimer>
#include <QElapsedTimer>
#include <QDebug>

#include <limits>
#include <utility>

namespace ShelfSync {

Backoff::Backoff(QObject *parent)
    : QObject(parent)
{
}

Backoff::~Backoff()
{
    for (QEventLoop *loop : std::as_const(m_loops)) {
        loop->quit();
    }
}

bool Backoff::wait(qint64 delayMs)
{
    if (isCancelled()) {
        return false;
    }

    delayMs = qBound<qint64>(0, delayMs, std::numeric_limits<int>::max());
    emit waitStarted(delayMs);

    if (m_waitFunction) {
        m_waitFunction(delayMs);
        m_totalWaitedMs += delayMs;
        return !isCancelled();
    }

    QElapsedTimer elapsed;
    elapsed.start();

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    timer.setTimerType(Qt::PreciseTimer);  // coarse timers may fire early
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    m_loops.append(&loop);
    timer.start(static_cast<int>(delayMs));
    loop.exec();
    m_loops.removeOne(&loop);

    m_totalWaitedMs += elapsed.elapsed();

    if (timer.isActive()) {
        // Woken by cancel() before the timer fired
        timer.stop();
        qDebug() << "[Backoff] Wait abandoned after" << elapsed.elapsed() << "ms";
        return false;
    }

    return !isCancelled();
}

bool Backoff::isCancelled() const
{
    return m_cancelled || (m_cancelCheck && m_cancelCheck());
}

void Backoff::cancel()
{
    m_cancelled = true;
    for (QEventLoop *loop : std::as_const(m_loops)) {
        loop->quit();
    }
}

void Backoff::reset()
{
    m_cancelled = false;
    m_totalWaitedMs = 0;
}

} // namespace ShelfSync
