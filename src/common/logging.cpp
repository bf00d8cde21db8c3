#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QLoggingCategory>
#include <QtCore/QTextStream>

#include <cstdlib>
#include <cstring>

namespace common
{

namespace
{

constexpr const char* kCategoryPrefix = "stlcam.";

const char* levelName(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg: return "FATAL";
    }
    return "?";
}

// "stlcam.io" prints as "io"; foreign categories keep their full name.
QLatin1String shortCategory(const char* category)
{
    const std::size_t prefixLength = std::strlen(kCategoryPrefix);
    if (std::strncmp(category, kCategoryPrefix, prefixLength) == 0)
    {
        return QLatin1String(category + prefixLength);
    }
    return QLatin1String(category);
}

void writeRecord(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QTextStream err(stderr);
    err << '[' << QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs) << "] " << levelName(type);
    if (context.category != nullptr && std::strcmp(context.category, "default") != 0)
    {
        err << " [" << shortCategory(context.category) << ']';
    }
    err << ": " << message << Qt::endl;

    if (type == QtFatalMsg)
    {
        std::abort();
    }
}

} // namespace

void initLogging(Verbosity verbosity)
{
    qInstallMessageHandler(writeRecord);
    if (verbosity == Verbosity::Quiet)
    {
        QLoggingCategory::setFilterRules(QStringLiteral("stlcam.*.info=false"));
    }
}

} // namespace common
