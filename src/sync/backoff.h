#ifndef BACKOFF_H
#define BACKOFF_H

#include <QObject>
#include <QList>
#include <functional>

class QEventLoop;

namespace ShelfSync {

/**
 * @brief Cancellable wait between retry attempts
 *
 * By default a wait runs a local QEventLoop until a single-shot timer
 * fires, so the calling thread keeps delivering events (network
 * replies, cancel requests) while it waits. cancel() ends a wait in
 * progress and makes every later wait return false immediately until
 * reset() is called.
 *
 * Tests replace the timer with setWaitFunction() to record delays
 * without sleeping.
 */
class Backoff : public QObject
{
    Q_OBJECT

public:
    using WaitFunction = std::function<void(qint64 delayMs)>;

    explicit Backoff(QObject *parent = nullptr);
    ~Backoff() override;

    /**
     * @brief Wait for delayMs milliseconds
     *
     * Negative delays count as 0 and delays past INT_MAX are capped.
     * Waits may nest (an event handled during one wait starts another);
     * cancel() wakes all of them.
     *
     * @return false if the wait was cancelled
     */
    bool wait(qint64 delayMs);

    /**
     * @brief Replace the event-loop wait (nullptr restores it)
     */
    void setWaitFunction(WaitFunction function) { m_waitFunction = function; }

    /**
     * @brief Set external cancel check callback
     *
     * Polled before and after every wait.
     */
    void setCancelCheck(std::function<bool()> callback) { m_cancelCheck = callback; }

    bool isCancelled() const;

    /**
     * @brief Total milliseconds spent in wait() since the last reset()
     */
    qint64 totalWaitedMs() const { return m_totalWaitedMs; }

public slots:
    void cancel();
    void reset();

signals:
    void waitStarted(qint64 delayMs);

private:
    WaitFunction m_waitFunction;
    std::function<bool()> m_cancelCheck;
    QList<QEventLoop*> m_loops;  // innermost last
    bool m_cancelled = false;
    qint64 m_totalWaitedMs = 0;
};

} // namespace ShelfSync

#endif // BACKOFF_H
