#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

#include <string>
#include <utility>

namespace common::log
{

enum class Level
{
    Info,
    Warning,
    Error
};

enum class Category
{
    Io,
    Tp,
    Post,
    App
};

namespace detail
{

// One Qt category per subsystem, named "stlcam.<subsystem>".
inline QLoggingCategory& categoryHandle(Category category)
{
    static QLoggingCategory io("stlcam.io");
    static QLoggingCategory tp("stlcam.tp");
    static QLoggingCategory post("stlcam.post");
    static QLoggingCategory app("stlcam.app");
    static QLoggingCategory* const table[] = {&io, &tp, &post, &app};
    return *table[static_cast<int>(category)];
}

inline QString toMessage(const QString& message)
{
    return message;
}

inline QString toMessage(const char* message)
{
    return message ? QString::fromUtf8(message) : QString();
}

inline QString toMessage(const std::string& message)
{
    return QString::fromStdString(message);
}

} // namespace detail

inline void write(Level level, Category category, const QString& message)
{
    QLoggingCategory& qtCategory = detail::categoryHandle(category);
    switch (level)
    {
    case Level::Info:
        qCInfo(qtCategory).noquote() << message;
        break;
    case Level::Warning:
        qCWarning(qtCategory).noquote() << message;
        break;
    case Level::Error:
        qCCritical(qtCategory).noquote() << message;
        break;
    }
}

template <typename Message>
void log(Level level, Category category, Message&& message)
{
    write(level, category, detail::toMessage(std::forward<Message>(message)));
}

} // namespace common::log

#define STLCAM_LOG_INFO(category, message)                                                 \
    do                                                                                     \
    {                                                                                      \
        ::common::log::log(::common::log::Level::Info, ::common::log::Category::category,  \
                           (message));                                                     \
    } while (false)

#define STLCAM_LOG_WARN(category, message)                                                    \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Warning, ::common::log::Category::category,  \
                           (message));                                                        \
    } while (false)

#define STLCAM_LOG_ERR(category, message)                                                   \
    do                                                                                      \
    {                                                                                       \
        ::common::log::log(::common::log::Level::Error, ::common::log::Category::category,  \
                           (message));                                                      \
    } while (false)
