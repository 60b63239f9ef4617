// Stateless predicates deciding whether a line begins a removable construct.
// A predicate looks at a bounded window: the current line, and optionally the
// line before and the line after it. Nothing is mutated.

#ifndef EXCISE_MATCHER_HPP
#define EXCISE_MATCHER_HPP

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Util.hpp"
#include "Errors.hpp"
#include "LineBuffer.hpp"

namespace Excise
{

// Captured substrings of a successful match. Element 0 is the whole matched text,
// elements 1..n are the regex groups (empty string for a group that did not participate).
using Captures = std::vector<std::string>;

class LinePattern
{
public:
    enum Kind
    {
        Contains,
        Prefix,
        Exact, // Compared against the whitespace-trimmed line
        Regex
    };

    static LinePattern contains(std::string text)
    {
        return LinePattern(Contains, std::move(text));
    }

    static LinePattern prefix(std::string text)
    {
        return LinePattern(Prefix, std::move(text));
    }

    static LinePattern exact(std::string text)
    {
        return LinePattern(Exact, std::move(text));
    }

    static LinePattern regex(std::string text)
    {
        LinePattern pattern(Regex, std::move(text));
        try
        {
            pattern.compiled = std::regex(pattern.text, std::regex::ECMAScript);
        }
        catch (const std::regex_error & e)
        {
            throw ConfigError("", fmt::format("bad regex '{}': {}", pattern.text, e.what()));
        }
        return pattern;
    }

    Kind getKind() const noexcept
    {
        return kind;
    }

    const std::string & getText() const noexcept
    {
        return text;
    }

    // Number of capture groups a template may reference beyond $0
    std::size_t groupCount() const
    {
        return kind == Regex ? compiled.mark_count() : 0;
    }

    std::optional<Captures> match(std::string_view line) const
    {
        switch (kind)
        {
            case Contains:
            {
                if (line.find(text) == std::string_view::npos) return std::nullopt;
                return Captures{text};
            }
            case Prefix:
            {
                if (!line.starts_with(text)) return std::nullopt;
                return Captures{text};
            }
            case Exact:
            {
                if (trim(line) != text) return std::nullopt;
                return Captures{text};
            }
            case Regex:
            {
                std::match_results<std::string_view::const_iterator> m;
                if (!std::regex_search(line.begin(), line.end(), m, compiled)) return std::nullopt;
                Captures captures;
                captures.reserve(m.size());
                for (std::size_t i = 0; i < m.size(); ++i)
                {
                    captures.push_back(m[i].matched ? m[i].str() : std::string());
                }
                return captures;
            }
        }
        return std::nullopt;
    }

    std::string toString() const
    {
        switch (kind)
        {
            case Contains: return fmt::format("contains \"{}\"", text);
            case Prefix: return fmt::format("prefix \"{}\"", text);
            case Exact: return fmt::format("exact \"{}\"", text);
            case Regex: return fmt::format("regex /{}/", text);
        }
        return text;
    }

private:
    LinePattern(Kind kind, std::string text)
        : kind(kind), text(std::move(text))
    {
    }

    Kind kind;
    std::string text;
    std::regex compiled;
};

// The start of a construct: the current line must match `current`; when given,
// the previous and the next line must match `previous` and `next` as well.
// Captures are always taken from the current line.
struct StartPredicate
{
    LinePattern current;
    std::optional<LinePattern> previous = std::nullopt;
    std::optional<LinePattern> next = std::nullopt;
};

class Matcher
{
public:
    static std::optional<Captures> matches(const StartPredicate & predicate, const LineBuffer & buffer, std::size_t index)
    {
        if (index >= buffer.size()) return std::nullopt;

        std::optional<Captures> captures = predicate.current.match(buffer[index].text);
        if (!captures) return std::nullopt;

        if (predicate.previous)
        {
            const SourceLine * prev = buffer.peek(index, -1);
            if (!prev || !predicate.previous->match(prev->text)) return std::nullopt;
        }
        if (predicate.next)
        {
            const SourceLine * nxt = buffer.peek(index, 1);
            if (!nxt || !predicate.next->match(nxt->text)) return std::nullopt;
        }
        return captures;
    }
};

} // namespace Excise

#endif // EXCISE_MATCHER_HPP
