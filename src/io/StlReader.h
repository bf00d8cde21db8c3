#pragma once

#include "mesh/Model.h"

#include <QtCore/QByteArray>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace io
{

class ParseError : public std::runtime_error
{
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

enum class StlEncoding
{
    Binary,
    Ascii
};

const char* encodingName(StlEncoding encoding);

class StlReader
{
public:
    static constexpr std::size_t kHeaderSize = 80;
    static constexpr std::size_t kPreambleSize = kHeaderSize + sizeof(std::uint32_t);
    static constexpr std::size_t kRecordSize = 50;

    // Binary iff the stream length equals exactly 84 + count * 50 for the count
    // stored at offset 80. A text file whose size happens to satisfy the formula is
    // classified as binary.
    [[nodiscard]] static StlEncoding detectEncoding(const QByteArray& data);

    // Throws ParseError; never returns a partially filled model.
    [[nodiscard]] static mesh::Model read(const QByteArray& data);
    [[nodiscard]] static mesh::Model readBinary(const QByteArray& data);
    [[nodiscard]] static mesh::Model readAscii(const QByteArray& data);
};

} // namespace io
