/*!
 * @file        concurrencycoordinator.cppm
 * @brief       Slot pool and exclusive lane shared by all transfers.
 * @details     Provides two FIFO admission primitives used by the transfer
 *              pipeline:
 *
 *              - a counting slot pool bounding how many part uploads run at
 *                the same time;
 *              - an exclusive lane (capacity 1) ensuring that only one
 *                multipart session proceeds at a time.
 *
 *              Acquisition is asynchronous. The caller passes a context object
 *              and a continuation, and receives a ticket. The continuation runs
 *              on the event loop once the slot is granted. Releasing hands the
 *              slot directly to the oldest waiter, so no third party can take
 *              it in between.
 *
 *              The coordinator is an ordinary injected object, not a
 *              singleton; every pipeline instance owns one.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <QObject>
#include <QPointer>
#include <QMutex>
#include <QHash>
#include <QList>

#ifndef Q_MOC_RUN
export module skylift.core.concurrencycoordinator;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief FIFO slot pool plus a single exclusive lane.
 *
 * Every successful acquisition must be paired with exactly one release on
 * every exit path (success, error and cancellation). Tickets that have not
 * been granted yet can be withdrawn with cancelPending().
 */
SKYLIFT_MODULE_EXPORT class ConcurrencyCoordinator : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of slots handed out at once.
    Q_PROPERTY(int capacity READ capacity WRITE setCapacity NOTIFY capacityChanged)

    //!< @brief Number of slots currently held.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of callers waiting for a slot.
    Q_PROPERTY(int waitingCount READ waitingCount NOTIFY countsChanged)

    //!< @brief Whether the exclusive lane is held.
    Q_PROPERTY(bool exclusiveHeld READ isExclusiveHeld NOTIFY countsChanged)

public:
    using Ticket = quint64;

    /**
     * @brief Construct a coordinator.
     * @param capacity Size of the slot pool (at least 1).
     * @param parent Optional parent QObject.
     */
    explicit ConcurrencyCoordinator(int capacity = 5, QObject* parent = nullptr);

    /**
     * @brief Request one slot from the pool.
     *
     * @param context Receiver whose lifetime bounds the grant. If it is gone
     *        when the grant is delivered the slot is released again.
     * @param onGranted Continuation invoked on the event loop once granted.
     * @return Ticket identifying the request.
     */
    Ticket acquireSlot(QObject* context, std::function<void()> onGranted);

    /**
     * @brief Return one slot; the oldest waiter inherits it.
     */
    void releaseSlot();

    /**
     * @brief Request the exclusive lane. Same contract as acquireSlot().
     */
    Ticket acquireExclusive(QObject* context, std::function<void()> onGranted);

    /**
     * @brief Release the exclusive lane; the oldest waiter inherits it.
     */
    void releaseExclusive();

    /**
     * @brief Withdraw a request that has not been granted yet.
     *
     * @param ticket Ticket returned by acquireSlot() or acquireExclusive().
     * @return true if the ticket was still waiting and has been removed. A
     *         false return means the grant already happened (or is queued for
     *         delivery) and the caller owns a slot it must release.
     */
    bool cancelPending(Ticket ticket);

    int capacity() const;
    void setCapacity(int capacity);
    int activeCount() const;
    int waitingCount() const;
    bool isExclusiveHeld() const;
    int exclusiveWaitingCount() const;

signals:
    void capacityChanged();
    void countsChanged();

private:
    /**
     * @brief Pending acquisition request.
     */
    struct Waiter {
        Ticket ticket = 0;                  //!< Request identifier
        QPointer<QObject> context;          //!< Lifetime guard for the grant
        std::function<void()> onGranted;    //!< Continuation
    };

    enum class Lane { Slot, Exclusive };

    Ticket enqueue(Lane lane, QObject* context, std::function<void()> onGranted);
    void deliver(Lane lane, Waiter waiter);
    void release(Lane lane);
    void grantWaiting();

    mutable QMutex m_mutex;                 //!< Guards every member below
    int m_capacity = 5;                     //!< Slot pool size
    int m_active = 0;                       //!< Slots currently held
    bool m_exclusiveHeld = false;           //!< Exclusive lane state
    Ticket m_nextTicket = 1;                //!< Ticket generator
    QList<Waiter> m_slotWaiters;            //!< FIFO slot waiters
    QList<Waiter> m_exclusiveWaiters;       //!< FIFO exclusive waiters
    QHash<Ticket, Lane> m_undelivered;      //!< Granted tickets whose continuation has not run
};

#include "concurrencycoordinator.moc"
