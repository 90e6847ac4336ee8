// Logging categories shared by the UI and the bridge to the core log sink.
#pragma once
#include <QLoggingCategory>
#include "scpnator/RemoteTypes.hpp"

Q_DECLARE_LOGGING_CATEGORY(scSession)
Q_DECLARE_LOGGING_CATEGORY(scTransfer)
Q_DECLARE_LOGGING_CATEGORY(scListing)
Q_DECLARE_LOGGING_CATEGORY(scSettings)

// Core LogSink that forwards to the given category.
scpnator::LogSink qtLogSink(const QLoggingCategory& (*category)());
