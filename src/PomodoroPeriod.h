#pragma once

#include <QList>
#include <QMetaType>
#include <QString>
#include <QTime>

#include <stdexcept>

enum class PomodoroMode {
    Work,
    Rest
};

// One minute range of the hour, half-open: [startMinute, endMinute)
struct Segment {
    int          startMinute;
    int          endMinute;
    PomodoroMode mode;
};

struct TimerState {
    PomodoroMode mode             = PomodoroMode::Work;
    int          remainingSeconds = 0;
    QString      formattedTime;
};

// Raised when the segment table does not cover a minute. The built-in table
// covers the whole hour, so this only ever signals a broken table.
class ConfigurationFault : public std::logic_error
{
public:
    explicit ConfigurationFault(int minute);

    int minute() const { return m_minute; }

private:
    int m_minute;
};

namespace PomodoroPeriod {

// :00-:25 Work, :25-:30 Rest, :30-:55 Work, :55-:00 Rest
const QList<Segment>& timetable();

// Looks up the segment covering |minute| and returns the mode plus the
// seconds left until that segment ends. Throws ConfigurationFault if no
// segment matches.
TimerState periodAt(int minute, int second);
TimerState periodAt(int minute, int second, const QList<Segment>& table);
TimerState periodAt(const QTime& time);

// MM:SS, zero padded. Minutes are not wrapped at 60.
QString formatRemaining(int seconds);

QString modeName(PomodoroMode mode);

} // namespace PomodoroPeriod

Q_DECLARE_METATYPE(PomodoroMode)
Q_DECLARE_METATYPE(TimerState)
