#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_CODEC)
Q_DECLARE_LOGGING_CATEGORY(LC_REGISTRY)
Q_DECLARE_LOGGING_CATEGORY(LC_NOTIFY)
Q_DECLARE_LOGGING_CATEGORY(LC_LIVENESS)
Q_DECLARE_LOGGING_CATEGORY(LC_OWNER)
Q_DECLARE_LOGGING_CATEGORY(LC_SESSION)
Q_DECLARE_LOGGING_CATEGORY(LC_TRANSPORT)
Q_DECLARE_LOGGING_CATEGORY(LC_SYSLOG)
