#pragma once

#include "tp/MachiningParams.h"
#include "tp/Path.h"

#include <QtCore/QDateTime>

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>

namespace tp
{

// Renders a Path as a line-oriented G-code program bracketed by '%' lines, using ';'
// comments, absolute metric coordinates and three decimals on every number.
class GCodeEmitter
{
public:
    static constexpr std::size_t kProgressCommentInterval = 50;

    [[nodiscard]] std::string emit(const Path& path, const MachiningParams& params) const;
    [[nodiscard]] std::string emit(const Path& path,
                                   const MachiningParams& params,
                                   const QDateTime& generatedAt) const;

    // Rough output size in bytes, for display before the program is rendered.
    [[nodiscard]] static std::size_t estimateSize(const Path& path);

    static std::string formatNumber(double value, int precision = 3);

private:
    void emitHeader(std::ostringstream& out,
                    const Path& path,
                    const MachiningParams& params,
                    const QDateTime& generatedAt) const;
    void emitLayer(std::ostringstream& out,
                   const Layer& layer,
                   std::size_t layerTotal,
                   const MachiningParams& params) const;
    void emitFooter(std::ostringstream& out, const MachiningParams& params) const;

    std::string_view newline() const { return "\n"; }
};

} // namespace tp
