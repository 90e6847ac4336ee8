#pragma once

#include <QMessageBox>
#include <QStringList>

class QString;
class QWidget;

namespace UiAlerts {
void configure(QMessageBox &box,
               Qt::WindowModality modality = Qt::WindowModal);

QMessageBox::StandardButton
show(QWidget *parent, QMessageBox::Icon icon, const QString &title,
     const QString &text,
     QMessageBox::StandardButtons buttons = QMessageBox::Ok,
     QMessageBox::StandardButton defaultButton = QMessageBox::NoButton,
     const QString &details = QString());

QMessageBox::StandardButton
warning(QWidget *parent, const QString &title, const QString &text,
        const QString &details = QString());

// Lists the colliding names; defaults to "No".
bool confirmOverwrite(QWidget *parent, const QStringList &names);
} // namespace UiAlerts
