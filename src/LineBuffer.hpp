// An input file held as an ordered, immutable sequence of lines.
// Lines are 0-based. Each line remembers its own terminator so that lines copied
// through unchanged come out byte-for-byte identical.

#ifndef EXCISE_LINEBUFFER_HPP
#define EXCISE_LINEBUFFER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "Util.hpp"

namespace Excise
{

struct SourceLine
{
    std::size_t index;
    std::string text; // Without terminator
    std::string eol; // "\n", "\r\n", or "" for an unterminated last line

    std::string raw() const
    {
        return text + eol;
    }
};

class LineBuffer
{
public:
    LineBuffer() = default;

    explicit LineBuffer(std::string_view t)
    {
        std::size_t pos = 0;
        while (pos < t.size())
        {
            std::size_t nextPos = t.find('\n', pos);
            if (nextPos == std::string_view::npos)
            {
                lines.push_back(SourceLine{lines.size(), std::string(t.substr(pos)), ""});
                break;
            }
            std::string_view body = t.substr(pos, nextPos - pos);
            if (!body.empty() && body.back() == '\r')
            {
                body.remove_suffix(1);
                lines.push_back(SourceLine{lines.size(), std::string(body), "\r\n"});
            }
            else
            {
                lines.push_back(SourceLine{lines.size(), std::string(body), "\n"});
            }
            pos = nextPos + 1; // Skip the newline character
        }
        defaultEol = detectDominantEol();
    }

    std::size_t size() const noexcept
    {
        return lines.size();
    }

    bool empty() const noexcept
    {
        return lines.empty();
    }

    const SourceLine & at(std::size_t index) const
    {
        if (index >= lines.size())
        {
            throw std::out_of_range(fmt::format("Line out of range: target index {}, limit {}", index, lines.size()));
        }
        return lines[index];
    }

    const SourceLine & operator[](std::size_t index) const
    {
        return lines[index];
    }

    // Bounded lookahead/lookbehind: nullptr when index + offset falls outside the buffer.
    const SourceLine * peek(std::size_t index, long offset) const noexcept
    {
        long target = static_cast<long>(index) + offset;
        if (target < 0 || target >= static_cast<long>(lines.size())) return nullptr;
        return &lines[static_cast<std::size_t>(target)];
    }

    const std::vector<SourceLine> & getLines() const noexcept
    {
        return lines;
    }

    // Terminator used for inserted lines
    const std::string & getDefaultEol() const noexcept
    {
        return defaultEol;
    }

    std::string str() const
    {
        StringBuilder builder;
        for (const SourceLine & line : lines)
        {
            builder.append(line.text);
            builder.append(line.eol);
        }
        return builder.str();
    }

private:
    std::vector<SourceLine> lines;
    std::string defaultEol = "\n";

    std::string detectDominantEol() const
    {
        std::size_t crlf = 0;
        std::size_t lf = 0;
        for (const SourceLine & line : lines)
        {
            if (line.eol == "\r\n") ++crlf;
            else if (line.eol == "\n") ++lf;
        }
        return crlf > lf ? "\r\n" : "\n";
    }
};

} // namespace Excise

#endif // EXCISE_LINEBUFFER_HPP
