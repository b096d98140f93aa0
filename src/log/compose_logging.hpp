#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_DETECT)
Q_DECLARE_LOGGING_CATEGORY(LC_COMPOSE)
Q_DECLARE_LOGGING_CATEGORY(LC_PIPELINE)
Q_DECLARE_LOGGING_CATEGORY(LC_CAPTURE)
