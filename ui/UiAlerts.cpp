#include "UiAlerts.hpp"

namespace UiAlerts {
namespace {
// Nombres mostrados antes de resumir el resto.
constexpr int kMaxListedNames = 10;

// Botón por defecto: el pedido si existe; si no, el más conservador.
QMessageBox::StandardButton
safeDefault(QMessageBox::StandardButtons buttons, QMessageBox::StandardButton requested) {
    if (requested != QMessageBox::NoButton && buttons.testFlag(requested))
        return requested;
    for (auto b : {QMessageBox::No, QMessageBox::Cancel, QMessageBox::Ok}) {
        if (buttons.testFlag(b))
            return b;
    }
    return QMessageBox::NoButton;
}
} // namespace

void configure(QMessageBox &box, Qt::WindowModality modality) {
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(modality);
}

QMessageBox::StandardButton
show(QWidget *parent, QMessageBox::Icon icon, const QString &title,
     const QString &text, QMessageBox::StandardButtons buttons,
     QMessageBox::StandardButton defaultButton, const QString &details) {
    QMessageBox box(parent);
    configure(box);
    box.setIcon(icon);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(buttons);
    if (!details.isEmpty())
        box.setDetailedText(details);

    if (const auto def = safeDefault(buttons, defaultButton); def != QMessageBox::NoButton)
        box.setDefaultButton(def);

    return static_cast<QMessageBox::StandardButton>(box.exec());
}

QMessageBox::StandardButton warning(QWidget *parent, const QString &title,
                                    const QString &text,
                                    const QString &details) {
    return show(parent, QMessageBox::Warning, title, text, QMessageBox::Ok,
                QMessageBox::Ok, details);
}

bool confirmOverwrite(QWidget *parent, const QStringList &names) {
    QStringList shown = names.mid(0, kMaxListedNames);
    if (names.size() > kMaxListedNames)
        shown << QObject::tr("... and %1 more").arg(names.size() - kMaxListedNames);
    const QString text =
        QObject::tr("These items already exist at the destination:\n\n%1\n\n"
                    "Overwrite them?")
            .arg(shown.join('\n'));
    return show(parent, QMessageBox::Question, QObject::tr("Overwrite?"), text,
                QMessageBox::Yes | QMessageBox::No,
                QMessageBox::No) == QMessageBox::Yes;
}
} // namespace UiAlerts
