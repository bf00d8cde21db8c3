#pragma once

namespace common
{

enum class Verbosity
{
    Quiet,  // warnings and errors only
    Normal
};

// Routes every Qt message (including the STLCAM_LOG_* categories) through a single
// timestamped stderr sink.
void initLogging(Verbosity verbosity = Verbosity::Normal);

} // namespace common
