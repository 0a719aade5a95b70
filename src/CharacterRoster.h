#pragma once

#include <QString>
#include <QStringList>

#include "PomodoroPeriod.h"

// The characters the overlay can show. Each id names a directory under
// assets/characters/ holding one image per mode.
namespace CharacterRoster {

const QStringList& characters();
QString defaultCharacter();

bool isKnown(const QString& id);

// Next id in roster order, wrapping around. Unknown ids restart at the first.
QString nextCharacter(const QString& id);

// "augustine-of-hippo" -> "Augustine Of Hippo"
QString displayName(const QString& id);

QString imageFile(PomodoroMode mode);

} // namespace CharacterRoster
