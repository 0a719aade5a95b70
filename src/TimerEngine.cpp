#include "TimerEngine.h"

#include <spdlog/spdlog.h>

TimerEngine::TimerEngine(QObject* parent)
    : TimerEngine([] { return QTime::currentTime(); }, parent)
{}

TimerEngine::TimerEngine(Clock clock, QObject* parent)
    : QObject(parent)
    , m_clock(std::move(clock))
{
    // The period is derived from the wall clock on every cycle, so a late
    // timeout only delays the display, it never accumulates drift.
    m_timer.setInterval(1000);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &TimerEngine::onTick);
}

void TimerEngine::setResumeSource(PowerMonitor* monitor)
{
    if (m_resumeConnection) {
        disconnect(m_resumeConnection);
        m_resumeConnection = {};
    }
    m_resumeSource = monitor;
    if (m_running && m_resumeSource)
        m_resumeConnection = connect(m_resumeSource.data(), &PowerMonitor::resumed,
                                     this, &TimerEngine::onResumed);
}

void TimerEngine::start()
{
    if (m_running)
        return;

    // A previous run's mode must not leak into the first tick
    m_lastMode.reset();
    m_running = true;

    if (m_resumeSource && !m_resumeConnection)
        m_resumeConnection = connect(m_resumeSource.data(), &PowerMonitor::resumed,
                                     this, &TimerEngine::onResumed);

    try {
        onTick();
    } catch (const ConfigurationFault&) {
        m_running = false;
        throw;
    }

    m_timer.start();
    spdlog::info("Timer started in {} period, {} left",
                 PomodoroPeriod::modeName(m_state.mode).toStdString(),
                 m_state.formattedTime.toStdString());
}

void TimerEngine::stop()
{
    if (!m_running)
        return;

    m_timer.stop();
    m_running = false;
    spdlog::info("Timer stopped");
}

void TimerEngine::destroy()
{
    stop();

    if (m_resumeConnection) {
        disconnect(m_resumeConnection);
        m_resumeConnection = {};
    }
    m_resumeSource = nullptr;

    // Drop every observer of tick() / periodChanged()
    disconnect(this, nullptr, nullptr, nullptr);
}

void TimerEngine::onTick()
{
    m_state = PomodoroPeriod::periodAt(m_clock());

    spdlog::trace("tick {} {}", PomodoroPeriod::modeName(m_state.mode).toStdString(),
                  m_state.formattedTime.toStdString());
    emit tick(m_state);

    if (m_lastMode && *m_lastMode != m_state.mode) {
        spdlog::info("Period changed to {}", PomodoroPeriod::modeName(m_state.mode).toStdString());
        emit periodChanged(m_state.mode);
    }
    m_lastMode = m_state.mode;
}

void TimerEngine::onResumed()
{
    if (!m_running)
        return;

    spdlog::debug("Recomputing period after resume");
    onTick();
}
