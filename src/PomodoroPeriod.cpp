#include "PomodoroPeriod.h"

#include <string>

ConfigurationFault::ConfigurationFault(int minute)
    : std::logic_error("no segment covers minute " + std::to_string(minute))
    , m_minute(minute)
{}

namespace PomodoroPeriod {

const QList<Segment>& timetable()
{
    static const QList<Segment> segments = {
        { 0,  25, PomodoroMode::Work },
        { 25, 30, PomodoroMode::Rest },
        { 30, 55, PomodoroMode::Work },
        { 55, 60, PomodoroMode::Rest },
    };
    return segments;
}

TimerState periodAt(int minute, int second)
{
    return periodAt(minute, second, timetable());
}

TimerState periodAt(int minute, int second, const QList<Segment>& table)
{
    for (const Segment& segment : table) {
        if (minute < segment.startMinute || minute >= segment.endMinute)
            continue;

        TimerState state;
        state.mode             = segment.mode;
        state.remainingSeconds = segment.endMinute * 60 - (minute * 60 + second);
        state.formattedTime    = formatRemaining(state.remainingSeconds);
        return state;
    }
    throw ConfigurationFault(minute);
}

TimerState periodAt(const QTime& time)
{
    return periodAt(time.minute(), time.second());
}

QString formatRemaining(int seconds)
{
    return QString("%1:%2")
        .arg(seconds / 60, 2, 10, QChar('0'))
        .arg(seconds % 60, 2, 10, QChar('0'));
}

QString modeName(PomodoroMode mode)
{
    switch (mode) {
        case PomodoroMode::Work: return QStringLiteral("work");
        case PomodoroMode::Rest: return QStringLiteral("rest");
    }
    return {};
}

} // namespace PomodoroPeriod
