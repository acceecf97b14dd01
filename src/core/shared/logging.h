#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(drCore)
Q_DECLARE_LOGGING_CATEGORY(drIndex)
Q_DECLARE_LOGGING_CATEGORY(drQuery)
Q_DECLARE_LOGGING_CATEGORY(drRanking)
Q_DECLARE_LOGGING_CATEGORY(drEmbedding)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
