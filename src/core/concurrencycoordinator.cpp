module;
#include <functional>
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QObject>
#include <QPointer>
#include <QtGlobal>

module skylift.core.concurrencycoordinator;

ConcurrencyCoordinator::ConcurrencyCoordinator(int capacity, QObject* parent)
    : QObject(parent)
    , m_capacity(qMax(1, capacity))
{
}

ConcurrencyCoordinator::Ticket ConcurrencyCoordinator::acquireSlot(QObject* context, std::function<void()> onGranted)
{
    return enqueue(Lane::Slot, context, std::move(onGranted));
}

ConcurrencyCoordinator::Ticket ConcurrencyCoordinator::acquireExclusive(QObject* context, std::function<void()> onGranted)
{
    return enqueue(Lane::Exclusive, context, std::move(onGranted));
}

void ConcurrencyCoordinator::releaseSlot()
{
    release(Lane::Slot);
}

void ConcurrencyCoordinator::releaseExclusive()
{
    release(Lane::Exclusive);
}

ConcurrencyCoordinator::Ticket ConcurrencyCoordinator::enqueue(Lane lane, QObject* context, std::function<void()> onGranted)
{
    Waiter waiter;
    waiter.context = context;
    waiter.onGranted = std::move(onGranted);

    bool grantNow = false;
    {
        QMutexLocker locker(&m_mutex);
        waiter.ticket = m_nextTicket++;
        if (lane == Lane::Slot) {
            // Newcomers never overtake callers that are already queued.
            if (m_active < m_capacity && m_slotWaiters.isEmpty()) {
                ++m_active;
                grantNow = true;
            } else {
                m_slotWaiters.append(waiter);
            }
        } else {
            if (!m_exclusiveHeld && m_exclusiveWaiters.isEmpty()) {
                m_exclusiveHeld = true;
                grantNow = true;
            } else {
                m_exclusiveWaiters.append(waiter);
            }
        }
        if (grantNow) m_undelivered.insert(waiter.ticket, lane);
    }

    const Ticket ticket = waiter.ticket;
    if (grantNow) deliver(lane, std::move(waiter));
    emit countsChanged();
    return ticket;
}

void ConcurrencyCoordinator::deliver(Lane lane, Waiter waiter)
{
    QMetaObject::invokeMethod(this, [this, lane, waiter]() {
        {
            QMutexLocker locker(&m_mutex);
            // Withdrawn by cancelPending() after the grant was queued.
            if (!m_undelivered.remove(waiter.ticket)) return;
        }
        if (!waiter.context) {
            qDebug() << "ConcurrencyCoordinator: grant receiver gone, releasing ticket" << waiter.ticket;
            release(lane);
            return;
        }
        if (waiter.onGranted) waiter.onGranted();
    }, Qt::QueuedConnection);
}

void ConcurrencyCoordinator::release(Lane lane)
{
    Waiter next;
    bool handOff = false;
    {
        QMutexLocker locker(&m_mutex);
        if (lane == Lane::Slot) {
            if (m_active <= 0) {
                qWarning() << "ConcurrencyCoordinator: releaseSlot() without a held slot";
                return;
            }
            if (!m_slotWaiters.isEmpty() && m_active <= m_capacity) {
                next = m_slotWaiters.takeFirst();
                handOff = true;
            } else {
                --m_active;
            }
        } else {
            if (!m_exclusiveHeld) {
                qWarning() << "ConcurrencyCoordinator: releaseExclusive() without holding the lane";
                return;
            }
            if (!m_exclusiveWaiters.isEmpty()) {
                next = m_exclusiveWaiters.takeFirst();
                handOff = true;
            } else {
                m_exclusiveHeld = false;
            }
        }
        if (handOff) m_undelivered.insert(next.ticket, lane);
    }

    if (handOff) deliver(lane, std::move(next));
    emit countsChanged();
}

bool ConcurrencyCoordinator::cancelPending(Ticket ticket)
{
    if (ticket == 0) return false;

    Lane grantedLane = Lane::Slot;
    bool wasGranted = false;
    {
        QMutexLocker locker(&m_mutex);
        for (int i = 0; i < m_slotWaiters.size(); ++i) {
            if (m_slotWaiters[i].ticket == ticket) {
                m_slotWaiters.removeAt(i);
                locker.unlock();
                emit countsChanged();
                return true;
            }
        }
        for (int i = 0; i < m_exclusiveWaiters.size(); ++i) {
            if (m_exclusiveWaiters[i].ticket == ticket) {
                m_exclusiveWaiters.removeAt(i);
                locker.unlock();
                emit countsChanged();
                return true;
            }
        }
        auto it = m_undelivered.find(ticket);
        if (it != m_undelivered.end()) {
            grantedLane = it.value();
            m_undelivered.erase(it);
            wasGranted = true;
        }
    }

    if (wasGranted) {
        // Granted but not delivered yet: give the slot back on the caller's behalf.
        release(grantedLane);
        return true;
    }
    return false;
}

int ConcurrencyCoordinator::capacity() const
{
    QMutexLocker locker(&m_mutex);
    return m_capacity;
}

void ConcurrencyCoordinator::setCapacity(int capacity)
{
    capacity = qMax(1, capacity);
    {
        QMutexLocker locker(&m_mutex);
        if (m_capacity == capacity) return;
        m_capacity = capacity;
    }
    emit capacityChanged();
    grantWaiting();
}

void ConcurrencyCoordinator::grantWaiting()
{
    QList<Waiter> granted;
    {
        QMutexLocker locker(&m_mutex);
        while (m_active < m_capacity && !m_slotWaiters.isEmpty()) {
            Waiter w = m_slotWaiters.takeFirst();
            ++m_active;
            m_undelivered.insert(w.ticket, Lane::Slot);
            granted.append(w);
        }
    }
    for (Waiter& w : granted) deliver(Lane::Slot, std::move(w));
    if (!granted.isEmpty()) emit countsChanged();
}

int ConcurrencyCoordinator::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active;
}

int ConcurrencyCoordinator::waitingCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_slotWaiters.size();
}

bool ConcurrencyCoordinator::isExclusiveHeld() const
{
    QMutexLocker locker(&m_mutex);
    return m_exclusiveHeld;
}

int ConcurrencyCoordinator::exclusiveWaitingCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_exclusiveWaiters.size();
}
