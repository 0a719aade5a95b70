#pragma once

#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QTime>

#include <functional>
#include <optional>

#include "PomodoroPeriod.h"
#include "PowerMonitor.h"

class TimerEngine : public QObject
{
    Q_OBJECT
public:
    using Clock = std::function<QTime()>;

    // |clock| defaults to the local wall clock
    explicit TimerEngine(QObject* parent = nullptr);
    explicit TimerEngine(Clock clock, QObject* parent = nullptr);

    // Resume signals from |monitor| trigger an extra cycle while running.
    // The subscription is made in start() and dropped in destroy().
    void setResumeSource(PowerMonitor* monitor);

    // Emit the current period right away, then once per second.
    // No-op if already running. Propagates ConfigurationFault.
    void start();

    // Disarm the 1 s trigger. No further emissions until start().
    void stop();

    // stop() plus disconnect every listener. Safe to call repeatedly.
    void destroy();

    bool       isRunning() const { return m_running; }
    TimerState state()     const { return m_state; }

signals:
    // Emitted every cycle while running
    void tick(const TimerState& state);

    // Emitted after tick() on the cycle where the mode flips
    void periodChanged(PomodoroMode mode);

private slots:
    void onTick();
    void onResumed();

private:
    Clock                       m_clock;
    QTimer                      m_timer;
    QPointer<PowerMonitor>      m_resumeSource;
    QMetaObject::Connection     m_resumeConnection;
    TimerState                  m_state;
    std::optional<PomodoroMode> m_lastMode;
    bool                        m_running = false;
};
