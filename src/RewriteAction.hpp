// What happens to the lines of a resolved span.
//
// Templates:
//   $N or ${N}   capture group N of the start predicate ($0 is the whole match)
//   ${indent}    leading whitespace of the span's first line
//   $$           a literal '$'
// An expanded template is split on '\n' into output lines; an empty expansion emits nothing.

#ifndef EXCISE_REWRITEACTION_HPP
#define EXCISE_REWRITEACTION_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Util.hpp"
#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "Matcher.hpp"

namespace Excise
{

struct Delete
{
};

// Replace the whole span with the expanded template.
struct ReplaceLines
{
    std::string lineTemplate;
};

// Replace only the span's first line, keep the interior lines unchanged.
struct ReplaceHeaderKeepBody
{
    std::string lineTemplate;
};

// Regex replace-all over every line of the span. The replacement uses
// std::regex_replace syntax ($1, $&, ...).
struct Substitute
{
    std::string pattern;
    std::string replacement;
    std::regex compiled;

    static Substitute make(std::string pattern, std::string replacement)
    {
        Substitute s{std::move(pattern), std::move(replacement), std::regex()};
        try
        {
            s.compiled = std::regex(s.pattern, std::regex::ECMAScript);
        }
        catch (const std::regex_error & e)
        {
            throw ConfigError("", fmt::format("bad regex '{}': {}", s.pattern, e.what()));
        }
        return s;
    }
};

using RewriteAction = std::variant<Delete, ReplaceLines, ReplaceHeaderKeepBody, Substitute>;

class TemplateExpander
{
public:
    static std::string expand(std::string_view lineTemplate, const Captures & captures, std::string_view indent)
    {
        std::string result;
        result.reserve(lineTemplate.size());
        for (std::size_t i = 0; i < lineTemplate.size(); ++i)
        {
            char c = lineTemplate[i];
            if (c != '$' || i + 1 >= lineTemplate.size())
            {
                result.push_back(c);
                continue;
            }

            char n = lineTemplate[i + 1];
            if (n == '$')
            {
                result.push_back('$');
                ++i;
            }
            else if (std::isdigit(static_cast<unsigned char>(n)))
            {
                std::size_t group = static_cast<std::size_t>(n - '0');
                if (group < captures.size()) result.append(captures[group]);
                ++i;
            }
            else if (n == '{')
            {
                std::size_t close = lineTemplate.find('}', i + 2);
                if (close == std::string_view::npos)
                {
                    result.push_back(c);
                    continue;
                }
                std::string_view name = lineTemplate.substr(i + 2, close - i - 2);
                if (name == "indent")
                {
                    result.append(indent);
                }
                else if (isGroupNumber(name))
                {
                    std::size_t group = std::stoul(std::string(name));
                    if (group < captures.size()) result.append(captures[group]);
                }
                else
                {
                    // Unknown placeholder, kept literally
                    result.append(lineTemplate.substr(i, close - i + 1));
                }
                i = close;
            }
            else
            {
                result.push_back(c);
            }
        }
        return result;
    }

    // Highest capture group a template references, or -1 if none.
    static int highestGroup(std::string_view lineTemplate)
    {
        int highest = -1;
        for (std::size_t i = 0; i + 1 < lineTemplate.size(); ++i)
        {
            if (lineTemplate[i] != '$') continue;
            char n = lineTemplate[i + 1];
            if (n == '$')
            {
                ++i;
            }
            else if (std::isdigit(static_cast<unsigned char>(n)))
            {
                highest = std::max(highest, n - '0');
                ++i;
            }
            else if (n == '{')
            {
                std::size_t close = lineTemplate.find('}', i + 2);
                if (close == std::string_view::npos) continue;
                std::string_view name = lineTemplate.substr(i + 2, close - i - 2);
                if (isGroupNumber(name))
                {
                    highest = std::max(highest, std::stoi(std::string(name)));
                }
                i = close;
            }
        }
        return highest;
    }

    static std::vector<std::string> splitLines(std::string_view text)
    {
        std::vector<std::string> result;
        if (text.empty()) return result;
        std::size_t pos = 0;
        while (true)
        {
            std::size_t nextPos = text.find('\n', pos);
            if (nextPos == std::string_view::npos)
            {
                result.emplace_back(text.substr(pos));
                break;
            }
            result.emplace_back(text.substr(pos, nextPos - pos));
            pos = nextPos + 1;
        }
        return result;
    }

private:
    static bool isGroupNumber(std::string_view name)
    {
        if (name.empty() || name.size() > 3) return false;
        for (char d : name)
        {
            if (!std::isdigit(static_cast<unsigned char>(d))) return false;
        }
        return true;
    }
};

class ActionApplier
{
public:
    // Produces the output lines replacing buffer[start..end]. Verbatim lines keep their
    // original terminator; new lines take the buffer's default one, except that a span
    // ending an unterminated file leaves its last emitted line unterminated as well.
    static std::vector<SourceLine> apply
    (
        const RewriteAction & action,
        const LineBuffer & buffer,
        std::size_t start,
        std::size_t end,
        const Captures & captures
    )
    {
        std::string indent(leadingWhitespace(buffer[start].text));
        const std::string & eol = buffer.getDefaultEol();
        bool unterminatedTail = buffer[end].eol.empty();

        std::vector<SourceLine> out = std::visit
        (
            overloaded
            {
                [&](const Delete &) -> std::vector<SourceLine>
                {
                    return {};
                },
                [&](const ReplaceLines & a) -> std::vector<SourceLine>
                {
                    std::vector<SourceLine> lines;
                    std::string expanded = TemplateExpander::expand(a.lineTemplate, captures, indent);
                    for (std::string & text : TemplateExpander::splitLines(expanded))
                    {
                        lines.push_back(SourceLine{0, std::move(text), eol});
                    }
                    return lines;
                },
                [&](const ReplaceHeaderKeepBody & a) -> std::vector<SourceLine>
                {
                    std::vector<SourceLine> lines;
                    std::string expanded = TemplateExpander::expand(a.lineTemplate, captures, indent);
                    for (std::string & text : TemplateExpander::splitLines(expanded))
                    {
                        lines.push_back(SourceLine{0, std::move(text), eol});
                    }
                    for (std::size_t i = start + 1; i <= end; ++i)
                    {
                        lines.push_back(buffer[i]);
                    }
                    return lines;
                },
                [&](const Substitute & a) -> std::vector<SourceLine>
                {
                    std::vector<SourceLine> lines;
                    for (std::size_t i = start; i <= end; ++i)
                    {
                        SourceLine line = buffer[i];
                        line.text = std::regex_replace(line.text, a.compiled, a.replacement);
                        lines.push_back(std::move(line));
                    }
                    return lines;
                }
            },
            action
        );

        if (unterminatedTail && !out.empty())
        {
            out.back().eol.clear();
        }
        return out;
    }

    static std::string describe(const RewriteAction & action)
    {
        return std::visit
        (
            overloaded
            {
                [](const Delete &) -> std::string { return "delete"; },
                [](const ReplaceLines & a) -> std::string { return fmt::format("replace with \"{}\"", a.lineTemplate); },
                [](const ReplaceHeaderKeepBody & a) -> std::string { return fmt::format("replace header with \"{}\"", a.lineTemplate); },
                [](const Substitute & a) -> std::string { return fmt::format("substitute /{}/ with \"{}\"", a.pattern, a.replacement); }
            },
            action
        );
    }
};

} // namespace Excise

#endif // EXCISE_REWRITEACTION_HPP
