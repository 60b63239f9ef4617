// Built-in rule sets, selectable by name from the command line.
//
// "interceptors" strips the interceptor facility from a Rust client module:
// imports, lint allowances, the helper macro and its invocations, the chain field
// and its initialisation, builder methods, the helper impl block, and every
// hook call-site. "interceptor-calls" is the call-site subset, for modules that
// only call into the hooks.

#ifndef EXCISE_BUILTINRULES_HPP
#define EXCISE_BUILTINRULES_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "Errors.hpp"
#include "Matcher.hpp"
#include "SpanResolver.hpp"
#include "RewriteAction.hpp"
#include "ConstructRule.hpp"
#include "RuleSet.hpp"

namespace Excise
{

class BuiltinRules
{
public:
    static inline const std::string DefaultPreset = "interceptors";

    static std::vector<std::string> presetNames()
    {
        std::vector<std::string> names;
        for (const auto & [name, factory] : presets())
        {
            names.push_back(name);
        }
        return names;
    }

    static RuleSet get(const std::string & name)
    {
        const auto & table = presets();
        auto it = table.find(name);
        if (it == table.end())
        {
            throw ConfigError("", fmt::format("unknown rule preset \"{}\" (available: {})", name, fmt::join(presetNames(), ", ")));
        }
        return it->second();
    }

    static RuleSet interceptors()
    {
        std::vector<ConstructRule> rules;

        // Ends on the blank line below the attribute
        rules.push_back
        ({
            .id = "lint-allow-comment",
            .start = {LinePattern::prefix("// Allow this lint")},
            .span = FixedPattern
            {
                LinePattern::contains("#![allow(clippy::too_many_arguments)]"),
                LinePattern::regex(R"(^\s*$)")
            },
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "lint-allow",
            .start = {LinePattern::exact("#![allow(clippy::too_many_arguments)]")},
            .span = SingleLine{},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "interceptor-import",
            .start = {LinePattern::regex(R"(^use crate::interceptor::)")},
            .span = FixedPattern{LinePattern::regex(R"(;\s*$)")},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "rwlock-import",
            .start = {LinePattern::exact("use tokio::sync::RwLock;")},
            .span = SingleLine{},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "helper-macro",
            .start = {LinePattern::prefix("// Helper macro to generate interceptor helper methods")},
            .span = BalancedDelimiters{'{', '}', 0},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "helper-macro-invocation",
            .start = {LinePattern::regex(R"(^\s*impl_interceptor_helpers!\()")},
            .span = FixedPattern{LinePattern::regex(R"(\);\s*$)")},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "interceptors-field",
            .start = {LinePattern::regex(R"(^\s*interceptors:\s*Arc(<|::new\()InterceptorChain\b)")},
            .span = SingleLine{},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "debug-impl-comment",
            .start = {LinePattern::contains("// Custom Debug implementation since InterceptorChain")},
            .span = SingleLine{},
            .action = ReplaceLines{"${indent}// Custom Debug implementation"}
        });
        rules.push_back
        ({
            .id = "debug-interceptors-field",
            .start = {LinePattern::contains(R"(.field("interceptors")")},
            .span = SingleLine{},
            .action = Delete{}
        });
        // Builder and accessor methods end at the first closing brace at impl indentation
        rules.push_back
        ({
            .id = "with-interceptor-method",
            .start = {LinePattern::regex(R"(^\s*/// Add an interceptor)")},
            .span = FixedPattern{LinePattern::regex(R"(^    \}\s*$)")},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "interceptors-accessor",
            .start = {LinePattern::regex(R"(^\s*/// Get a reference to the interceptor chain)")},
            .span = FixedPattern{LinePattern::regex(R"(^    \}\s*$)")},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "interceptor-helper-impl",
            .start = {LinePattern::exact("// Interceptor helper methods")},
            .span = BalancedDelimiters{'{', '}', 0},
            .action = Delete{}
        });

        for (ConstructRule & rule : callSiteRules())
        {
            rules.push_back(std::move(rule));
        }
        return RuleSet(std::move(rules));
    }

    static RuleSet interceptorCalls()
    {
        return RuleSet(callSiteRules());
    }

private:
    static const std::map<std::string, std::function<RuleSet()>> & presets()
    {
        static const std::map<std::string, std::function<RuleSet()>> table
        {
            {"interceptors", &BuiltinRules::interceptors},
            {"interceptor-calls", &BuiltinRules::interceptorCalls}
        };
        return table;
    }

    static std::vector<ConstructRule> callSiteRules()
    {
        std::vector<ConstructRule> rules;

        rules.push_back
        ({
            .id = "metadata-declaration",
            .start = {LinePattern::regex(R"(^\s*let (mut )?metadata = HashMap::new\(\);\s*$)")},
            .span = SingleLine{},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "hook-comment",
            .start = {LinePattern::regex(R"(^\s*// Call (before_request|after_response) hooks?\s*$)")},
            .span = SingleLine{},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "before-request-call",
            .start = {LinePattern::regex(R"(^\s*self\.call_before_request\()")},
            .span = FixedPattern{LinePattern::regex(R"(\.await\?;\s*$)")},
            .action = Delete{}
        });
        rules.push_back
        ({
            .id = "after-response-call",
            .start = {LinePattern::regex(R"(^\s*self\.call_after_response\()")},
            .span = FixedPattern{LinePattern::regex(R"(\.await;\s*$)")},
            .action = Delete{}
        });
        // let error = self
        //     .handle_api_error(e, ...)
        //     .await;
        rules.push_back
        ({
            .id = "handle-api-error-chain",
            .start =
            {
                LinePattern::regex(R"(^(\s*)let (\w+) = self\s*$)"),
                std::nullopt,
                LinePattern::regex(R"(^\s*\.handle_api_error\()")
            },
            .span = FixedPattern{LinePattern::regex(R"(;\s*$)")},
            .action = ReplaceLines{"$1let $2 = map_api_error(e);"}
        });
        rules.push_back
        ({
            .id = "handle-api-error-call",
            .start = {LinePattern::regex(R"(self\.handle_api_error\(\w+,[^)]*\))")},
            .span = SingleLine{},
            .action = Substitute::make(R"(self\.handle_api_error\((\w+),[^)]*\))", "map_api_error($1)")
        });
        rules.push_back
        ({
            .id = "metadata-argument",
            .start = {LinePattern::regex(R"(&(mut )?metadata\b)")},
            .span = SingleLine{},
            .action = Substitute::make(R"(,\s*&(mut )?metadata\b|&(mut )?metadata\b,?\s*)", "")
        });
        return rules;
    }
};

} // namespace Excise

#endif // EXCISE_BUILTINRULES_HPP
