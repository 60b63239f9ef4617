// Exceptions raised by the rewrite engine, the rule set loader and the file patcher.
// Every failure aborts the whole-file transformation; nothing is retried.

#ifndef EXCISE_ERRORS_HPP
#define EXCISE_ERRORS_HPP

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace Excise
{

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A matched construct whose end could not be found before the buffer ran out.
class UnterminatedConstruct : public Error
{
public:
    UnterminatedConstruct(std::string ruleId, std::size_t startIndex)
        : Error
        (
            fmt::format
            (
                "Unterminated construct: rule '{}' matched at line {} but its end was never found",
                ruleId, startIndex + 1
            )
        ),
        ruleId(std::move(ruleId)),
        startIndex(startIndex)
    {
    }

    std::string ruleId;
    std::size_t startIndex; // 0-based
};

class IOError : public Error
{
public:
    IOError(const std::filesystem::path & path, std::string cause)
        : Error(fmt::format("I/O error on {}: {}", path.string(), cause)),
        path(path),
        cause(std::move(cause))
    {
    }

    std::filesystem::path path;
    std::string cause;
};

// Two or more rules claim the same start line. Reported before any file is touched.
class AmbiguousMatch : public Error
{
public:
    AmbiguousMatch(std::vector<std::size_t> indices, std::vector<std::string> ruleIds)
        : Error(describe(indices, ruleIds)),
        indices(std::move(indices)),
        ruleIds(std::move(ruleIds))
    {
    }

    std::vector<std::size_t> indices;
    std::vector<std::string> ruleIds;

private:
    static std::string describe(const std::vector<std::size_t> & indices, const std::vector<std::string> & ruleIds)
    {
        std::vector<std::size_t> lines;
        for (std::size_t index : indices) lines.push_back(index + 1);
        return fmt::format
        (
            "Ambiguous match: rules [{}] all claim line(s) {}",
            fmt::join(ruleIds, ", "),
            fmt::join(lines, ", ")
        );
    }
};

// A malformed rule definition. Raised while building or loading a rule set.
class ConfigError : public Error
{
public:
    ConfigError(std::string ruleId, const std::string & message)
        : Error
        (
            ruleId.empty()
                ? fmt::format("Invalid rule set: {}", message)
                : fmt::format("Invalid rule '{}': {}", ruleId, message)
        ),
        ruleId(std::move(ruleId))
    {
    }

    std::string ruleId;
};

} // namespace Excise

#endif // EXCISE_ERRORS_HPP
