// Computes the inclusive end index of a construct from its start line.
// Termination is decided by scanning forward, never by a fixed line count.
// None of the strategies knows about string or comment literals: a delimiter or
// terminator inside a literal counts like any other occurrence.

#ifndef EXCISE_SPANRESOLVER_HPP
#define EXCISE_SPANRESOLVER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Util.hpp"
#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "Matcher.hpp"

namespace Excise
{

// The span is the start line alone.
struct SingleLine
{
};

// Scan from the start line (inclusive) to the first line matching `terminator`.
// With `followedBy`, the terminator line must be followed by a line matching it,
// and the span ends on that following line.
struct FixedPattern
{
    LinePattern terminator;
    std::optional<LinePattern> followedBy = std::nullopt;
};

struct BalancedDelimiters
{
    char open = '{';
    char close = '}';
    int initialDepth = 0;
};

// Indentation-terminated block. Without baseIndent, the start line's indentation is used.
struct BlankOrDedent
{
    std::optional<std::size_t> baseIndent = std::nullopt;
};

using SpanStrategy = std::variant<SingleLine, FixedPattern, BalancedDelimiters, BlankOrDedent>;

class SpanResolver
{
public:
    // Returns the inclusive end index, or throws UnterminatedConstruct.
    static std::size_t resolve
    (
        const SpanStrategy & strategy,
        const LineBuffer & buffer,
        std::size_t startIndex,
        std::string_view ruleId = ""
    )
    {
        if (startIndex >= buffer.size())
        {
            throw UnterminatedConstruct(std::string(ruleId), startIndex);
        }

        return std::visit
        (
            overloaded
            {
                [&](const SingleLine &) -> std::size_t
                {
                    return startIndex;
                },
                [&](const FixedPattern & s) -> std::size_t
                {
                    return resolveFixedPattern(s, buffer, startIndex, ruleId);
                },
                [&](const BalancedDelimiters & s) -> std::size_t
                {
                    return resolveBalancedDelimiters(s, buffer, startIndex, ruleId);
                },
                [&](const BlankOrDedent & s) -> std::size_t
                {
                    return resolveBlankOrDedent(s, buffer, startIndex);
                }
            },
            strategy
        );
    }

    static std::string describe(const SpanStrategy & strategy)
    {
        return std::visit
        (
            overloaded
            {
                [](const SingleLine &) -> std::string
                {
                    return "single line";
                },
                [](const FixedPattern & s) -> std::string
                {
                    if (s.followedBy)
                    {
                        return fmt::format("up to {} followed by {}", s.terminator.toString(), s.followedBy->toString());
                    }
                    return fmt::format("up to {}", s.terminator.toString());
                },
                [](const BalancedDelimiters & s) -> std::string
                {
                    return fmt::format("balanced '{}' '{}' from depth {}", s.open, s.close, s.initialDepth);
                },
                [](const BlankOrDedent & s) -> std::string
                {
                    if (s.baseIndent) return fmt::format("until dedent to column {}", *s.baseIndent);
                    return "until dedent to the start line's indentation";
                }
            },
            strategy
        );
    }

private:
    static std::size_t resolveFixedPattern
    (
        const FixedPattern & s,
        const LineBuffer & buffer,
        std::size_t startIndex,
        std::string_view ruleId
    )
    {
        for (std::size_t i = startIndex; i < buffer.size(); ++i)
        {
            if (!s.terminator.match(buffer[i].text)) continue;
            if (!s.followedBy)
            {
                SPDLOG_TRACE("Rule {}: terminator found at line {}", ruleId, i + 1);
                return i;
            }
            const SourceLine * following = buffer.peek(i, 1);
            if (following && s.followedBy->match(following->text))
            {
                SPDLOG_TRACE("Rule {}: terminator pair found at lines {}-{}", ruleId, i + 1, i + 2);
                return i + 1;
            }
        }
        throw UnterminatedConstruct(std::string(ruleId), startIndex);
    }

    // Depth is updated per line by (#open - #close). The span ends on the first line
    // after which depth is <= 0, provided depth has been positive before or that line
    // itself contained an opening delimiter. Lines ahead of the first opening
    // delimiter (a leading comment, a signature) are part of the span.
    static std::size_t resolveBalancedDelimiters
    (
        const BalancedDelimiters & s,
        const LineBuffer & buffer,
        std::size_t startIndex,
        std::string_view ruleId
    )
    {
        long depth = s.initialDepth;
        bool wentPositive = depth > 0;
        for (std::size_t i = startIndex; i < buffer.size(); ++i)
        {
            const std::string & text = buffer[i].text;
            long opens = 0;
            long closes = 0;
            for (char c : text)
            {
                if (c == s.open) ++opens;
                else if (c == s.close) ++closes;
            }
            depth += opens - closes;
            SPDLOG_TRACE("Rule {}: line {} depth {}", ruleId, i + 1, depth);
            if ((wentPositive || opens > 0) && depth <= 0)
            {
                return i;
            }
            if (depth > 0) wentPositive = true;
        }
        throw UnterminatedConstruct(std::string(ruleId), startIndex);
    }

    // The first non-blank line indented at most baseIndent terminates the block and
    // is not part of it. Blank lines directly before the terminator stay outside too.
    // Running off the end of the buffer ends the block at the last non-blank line.
    static std::size_t resolveBlankOrDedent
    (
        const BlankOrDedent & s,
        const LineBuffer & buffer,
        std::size_t startIndex
    )
    {
        std::size_t base = s.baseIndent
            ? *s.baseIndent
            : leadingWhitespace(buffer[startIndex].text).size();

        std::size_t lastContent = startIndex;
        for (std::size_t i = startIndex + 1; i < buffer.size(); ++i)
        {
            const std::string & text = buffer[i].text;
            if (isAllWhitespace(text)) continue;
            if (leadingWhitespace(text).size() <= base) break;
            lastContent = i;
        }
        return lastContent;
    }
};

} // namespace Excise

#endif // EXCISE_SPANRESOLVER_HPP
