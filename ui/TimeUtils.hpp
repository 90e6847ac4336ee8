// Small UI time helpers.
#pragma once
#include <QDateTime>
#include <QLocale>
#include <QString>

namespace scpnatorui {

// Epoch seconds in local time, short system-locale format.
inline QString localShortTime(quint64 secs) {
    if (secs == 0) return QStringLiteral("-");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(secs));
    if (!dt.isValid()) return QStringLiteral("-");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

} // namespace scpnatorui
