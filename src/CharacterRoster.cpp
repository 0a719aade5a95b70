#include "CharacterRoster.h"

namespace CharacterRoster {

const QStringList& characters()
{
    static const QStringList roster = {
        QStringLiteral("augustine-of-hippo"),
        QStringLiteral("thomas-aquinas"),
        QStringLiteral("saint-patrick"),
        QStringLiteral("thomas-more"),
    };
    return roster;
}

QString defaultCharacter()
{
    return characters().first();
}

bool isKnown(const QString& id)
{
    return characters().contains(id);
}

QString nextCharacter(const QString& id)
{
    const QStringList& roster = characters();
    int index = roster.indexOf(id);
    return roster.at((index + 1) % roster.size());
}

QString displayName(const QString& id)
{
    QStringList words = id.split('-', Qt::SkipEmptyParts);
    for (QString& word : words)
        word[0] = word.at(0).toUpper();
    return words.join(' ');
}

QString imageFile(PomodoroMode mode)
{
    return mode == PomodoroMode::Work ? QStringLiteral("work.png")
                                      : QStringLiteral("quick-break.png");
}

} // namespace CharacterRoster
