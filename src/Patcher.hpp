#ifndef EXCISE_PATCHER_HPP
#define EXCISE_PATCHER_HPP

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Util.hpp"
#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "RuleSet.hpp"
#include "RewriteEngine.hpp"
#include "TempFile.hpp"

namespace Excise
{

// Applies a rule set to one file on disk. The file is read whole, rewritten in
// memory, and only then replaced through a sibling temporary file and a rename.
// Any failure leaves the original untouched.
class Patcher
{
public:
    enum class Mode
    {
        Write, // Replace the file if any rule fired
        DryRun // Compute the result only
    };

    static PatchResult run
    (
        const std::filesystem::path & file,
        const RuleSet & ruleSet,
        Mode mode = Mode::Write,
        bool strict = false
    )
    {
        std::string content = loadFileToString(file);
        LineBuffer buffer(content);
        SPDLOG_DEBUG("Read {} line(s) from {}", buffer.size(), file.string());

        if (strict)
        {
            ruleSet.checkUnambiguous(buffer);
        }

        RewriteEngine engine(ruleSet, buffer);
        PatchResult result = engine.run();

        if (mode == Mode::DryRun)
        {
            SPDLOG_DEBUG("Dry run, {} left untouched", file.string());
            return result;
        }
        if (!result.changed())
        {
            SPDLOG_INFO("No construct matched in {}", file.string());
            return result;
        }

        TempFile temp(file);
        temp.write(result.text());
        temp.commit();
        SPDLOG_INFO("Patched {} ({} construct(s))", file.string(), result.applied.size());
        return result;
    }
};

} // namespace Excise

#endif // EXCISE_PATCHER_HPP
