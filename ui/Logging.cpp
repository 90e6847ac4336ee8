#include "Logging.hpp"
#include <QString>

Q_LOGGING_CATEGORY(scSession, "scpnator.session")
Q_LOGGING_CATEGORY(scTransfer, "scpnator.transfer")
Q_LOGGING_CATEGORY(scListing, "scpnator.listing")
Q_LOGGING_CATEGORY(scSettings, "scpnator.settings")

scpnator::LogSink qtLogSink(const QLoggingCategory& (*category)()) {
    return [category](scpnator::LogLevel level, const std::string& msg) {
        const QString text = QString::fromStdString(msg);
        switch (level) {
        case scpnator::LogLevel::Debug:
            qDebug(category) << text;
            break;
        case scpnator::LogLevel::Info:
            qInfo(category) << text;
            break;
        case scpnator::LogLevel::Warning:
            qWarning(category) << text;
            break;
        case scpnator::LogLevel::Error:
            qCritical(category) << text;
            break;
        }
    };
}
