#pragma once

#include <sstream>
#include <stdexcept>

namespace common::detail
{

// Contract violations by the caller; always checked, release builds included.
[[noreturn]] inline void enforceFail(const char* expr, const char* file, int line, const char* message)
{
    std::ostringstream oss;
    oss << (message ? message : "Contract violated") << " (" << expr << " at " << file << ':' << line << ')';
    throw std::logic_error(oss.str());
}

} // namespace common::detail

#define STLCAM_ENFORCE(expr, message)                                              \
    do                                                                             \
    {                                                                              \
        if (!(expr))                                                               \
        {                                                                          \
            ::common::detail::enforceFail(#expr, __FILE__, __LINE__, (message));   \
        }                                                                          \
    } while (false)
