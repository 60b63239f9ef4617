#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <CLI/CLI.hpp>

#include "Errors.hpp"
#include "RuleSet.hpp"
#include "BuiltinRules.hpp"
#include "RewriteEngine.hpp"
#include "Patcher.hpp"

int main(const int argc, const char* argv[])
{
    using namespace Excise;

    // Default logging level (can be raised with -v / -vv)
    spdlog::set_level(spdlog::level::info);

    std::filesystem::path targetPath;
    std::filesystem::path rulesPath;
    std::string presetName = BuiltinRules::DefaultPreset;
    bool dryRun = false;
    bool check = false;
    bool strict = false;
    bool listRules = false;
    int verbose = 0;

    CLI::App app
    {
        "Remove or rewrite multi-line constructs in a source file by line pattern and span rules\n"
        "Patterns:\n 1) excise <file> [opts]\n 2) excise <file> --rules <rules.json> [opts]"
    };
    app.set_help_flag("-h,--help", "Show help");

    app.add_option("file", targetPath, "File to patch in place");
    CLI::Option * rulesOpt = app.add_option("-r,--rules", rulesPath,
        "Load the rule set from a JSON file instead of a built-in preset")
        ->check(CLI::ExistingFile);
    app.add_option("-p,--rules-preset", presetName,
        fmt::format("Built-in rule set ({})", fmt::join(BuiltinRules::presetNames(), ", ")))
        ->default_str(BuiltinRules::DefaultPreset)
        ->excludes(rulesOpt);
    app.add_flag("-n,--dry-run", dryRun,
        "Print the patched text to stdout and leave the file untouched");
    app.add_flag("-c,--check", check,
        "Exit with 1 if any rule would fire; the file is not modified");
    app.add_flag("-s,--strict", strict,
        "Fail before patching if two rules claim the same line");
    app.add_flag("-l,--list-rules", listRules,
        "Print the rules of the selected rule set and exit");
    app.add_flag("-v,--verbose", verbose,
        "Increase verbosity (-v=debug, -vv=trace)")
        ->default_val(0);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::Error & e)
    {
        // --help exits 0; every argument error exits 1
        return app.exit(e) == 0 ? 0 : 1;
    }

    // Apply verbosity
    switch (verbose)
    {
        case 0: spdlog::set_level(spdlog::level::info); break;
        case 1: spdlog::set_level(spdlog::level::debug); break;
        default: spdlog::set_level(spdlog::level::trace); break;
    }

    try
    {
        RuleSet ruleSet = rulesPath.empty()
            ? BuiltinRules::get(presetName)
            : RuleSet::fromJsonFile(rulesPath);
        SPDLOG_DEBUG
        (
            "Using {} rule(s) from {}",
            ruleSet.size(),
            rulesPath.empty() ? fmt::format("preset {}", presetName) : rulesPath.string()
        );

        if (listRules)
        {
            for (const ConstructRule & rule : ruleSet.getRules())
            {
                std::cout << rule.toString() << "\n";
            }
            return 0;
        }

        if (targetPath.empty())
        {
            std::cerr << "Error: expected <file>.\n" << app.help() << std::endl;
            return 1;
        }

        Patcher::Mode mode = (dryRun || check) ? Patcher::Mode::DryRun : Patcher::Mode::Write;
        PatchResult result = Patcher::run(targetPath, ruleSet, mode, strict);

        if (check)
        {
            if (result.changed())
            {
                std::cout << fmt::format
                (
                    "excise: {} construct(s) would be rewritten in {}: {}",
                    result.applied.size(), targetPath.string(), fmt::join(result.appliedRuleIds(), ", ")
                ) << std::endl;
                return 1;
            }
            std::cout << fmt::format("excise: {} is clean", targetPath.string()) << std::endl;
            return 0;
        }

        if (dryRun)
        {
            std::cout << result.text();
            std::cout.flush();
            return 0;
        }

        if (result.changed())
        {
            std::cout << fmt::format
            (
                "excise: {} construct(s) rewritten in {}: {}",
                result.applied.size(), targetPath.string(), fmt::join(result.appliedRuleIds(), ", ")
            ) << std::endl;
        }
        else
        {
            std::cout << fmt::format("excise: 0 construct(s) rewritten in {}", targetPath.string()) << std::endl;
        }
        return 0;
    }
    catch (const Excise::Error & e)
    {
        SPDLOG_ERROR("{}", e.what());
        return 1;
    }
    catch (const std::exception & e)
    {
        SPDLOG_ERROR("Unexpected failure: {}", e.what());
        return 1;
    }
}
