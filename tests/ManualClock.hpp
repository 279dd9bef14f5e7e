#pragma once

#include "goalglide/core/Clock.hpp"

// Clock for tests: time only moves when told to.
class ManualClock : public goalglide::core::Clock
{
public:
    explicit ManualClock(QDateTime start)
        : m_now(std::move(start))
    {
    }

    QDateTime now() const override { return m_now; }
    void set(const QDateTime &now) { m_now = now; }
    void advance(qint64 seconds) { m_now = m_now.addSecs(seconds); }

private:
    QDateTime m_now;
};
