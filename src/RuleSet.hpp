// An ordered table of construct rules. Rules are tried top to bottom on each line
// and the first match wins. A rule set is validated as it is built and never
// changes afterwards.

#ifndef EXCISE_RULESET_HPP
#define EXCISE_RULESET_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include "Util.hpp"
#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "Matcher.hpp"
#include "SpanResolver.hpp"
#include "RewriteAction.hpp"
#include "ConstructRule.hpp"

namespace Excise
{

class RuleSet
{
    using json = nlohmann::json;

public:
    // A line claimed by more than one rule
    struct Ambiguity
    {
        std::size_t index;
        std::vector<std::string> ruleIds;
    };

    RuleSet() = default;

    explicit RuleSet(std::vector<ConstructRule> rules)
    {
        for (ConstructRule & rule : rules)
        {
            add(std::move(rule));
        }
    }

    void add(ConstructRule rule)
    {
        validate(rule);
        ids.insert(rule.id);
        rules.push_back(std::move(rule));
    }

    const std::vector<ConstructRule> & getRules() const noexcept
    {
        return rules;
    }

    std::size_t size() const noexcept
    {
        return rules.size();
    }

    bool empty() const noexcept
    {
        return rules.empty();
    }

    std::vector<Ambiguity> findAmbiguities(const LineBuffer & buffer) const
    {
        std::vector<Ambiguity> result;
        for (std::size_t i = 0; i < buffer.size(); ++i)
        {
            std::vector<std::string> claimants;
            for (const ConstructRule & rule : rules)
            {
                if (Matcher::matches(rule.start, buffer, i)) claimants.push_back(rule.id);
            }
            if (claimants.size() > 1)
            {
                SPDLOG_DEBUG("Line {} is claimed by {} rules", i + 1, claimants.size());
                result.push_back(Ambiguity{i, std::move(claimants)});
            }
        }
        return result;
    }

    // Throws AmbiguousMatch listing every contested line and every rule involved.
    void checkUnambiguous(const LineBuffer & buffer) const
    {
        std::vector<Ambiguity> ambiguities = findAmbiguities(buffer);
        if (ambiguities.empty()) return;

        std::vector<std::size_t> indices;
        std::vector<std::string> ruleIds;
        std::unordered_set<std::string> seen;
        for (const Ambiguity & ambiguity : ambiguities)
        {
            indices.push_back(ambiguity.index);
            for (const std::string & id : ambiguity.ruleIds)
            {
                if (seen.insert(id).second) ruleIds.push_back(id);
            }
        }
        throw AmbiguousMatch(std::move(indices), std::move(ruleIds));
    }

    // {"rules": [ {id, match, preceded_by?, followed_by?, span, action}, ... ]}
    static RuleSet fromJson(const json & j)
    {
        if (!j.is_object() || !j.contains("rules") || !j.at("rules").is_array())
        {
            throw ConfigError("", "expected an object with a \"rules\" array");
        }

        RuleSet ruleSet;
        std::size_t position = 0;
        for (const json & ruleJson : j.at("rules"))
        {
            std::string id = ruleJson.is_object() && ruleJson.contains("id") && ruleJson.at("id").is_string()
                ? ruleJson.at("id").get<std::string>()
                : fmt::format("#{}", position);
            try
            {
                ruleSet.add(ruleFromJson(ruleJson));
            }
            catch (const ConfigError & e)
            {
                if (!e.ruleId.empty()) throw;
                throw ConfigError(id, stripPrefix(e.what()));
            }
            catch (const json::exception & e)
            {
                throw ConfigError(id, e.what());
            }
            ++position;
        }
        SPDLOG_DEBUG("Loaded {} rule(s) from JSON", ruleSet.size());
        return ruleSet;
    }

    static RuleSet fromJsonFile(const std::filesystem::path & path)
    {
        std::string content = loadFileToString(path);
        json j;
        try
        {
            j = json::parse(content);
        }
        catch (const json::parse_error & e)
        {
            throw ConfigError("", fmt::format("{} is not valid JSON: {}", path.string(), e.what()));
        }
        return fromJson(j);
    }

private:
    std::vector<ConstructRule> rules;
    std::unordered_set<std::string> ids;

    void validate(const ConstructRule & rule) const
    {
        if (rule.id.empty())
        {
            throw ConfigError("", "rule id must not be empty");
        }
        if (ids.contains(rule.id))
        {
            throw ConfigError(rule.id, "duplicate rule id");
        }

        if (const BalancedDelimiters * s = std::get_if<BalancedDelimiters>(&rule.span))
        {
            if (s->open == s->close)
            {
                throw ConfigError(rule.id, "open and close delimiters must differ");
            }
            if (s->initialDepth < 0)
            {
                throw ConfigError(rule.id, "initial depth must not be negative");
            }
        }

        std::optional<std::string> lineTemplate;
        if (const ReplaceLines * a = std::get_if<ReplaceLines>(&rule.action)) lineTemplate = a->lineTemplate;
        if (const ReplaceHeaderKeepBody * a = std::get_if<ReplaceHeaderKeepBody>(&rule.action)) lineTemplate = a->lineTemplate;
        if (lineTemplate)
        {
            int highest = TemplateExpander::highestGroup(*lineTemplate);
            int available = static_cast<int>(rule.start.current.groupCount());
            if (highest > available)
            {
                throw ConfigError
                (
                    rule.id,
                    fmt::format
                    (
                        "template references capture group {} but the start pattern only has {}",
                        highest, available
                    )
                );
            }
        }
    }

    // ConfigError::what() already carries "Invalid rule set: "; drop it when re-raising under an id.
    static std::string stripPrefix(std::string_view message)
    {
        constexpr std::string_view prefix = "Invalid rule set: ";
        if (message.starts_with(prefix)) message.remove_prefix(prefix.size());
        return std::string(message);
    }

    static LinePattern patternFromJson(const json & j)
    {
        if (!j.is_object() || j.size() != 1)
        {
            throw ConfigError("", "a pattern needs exactly one of \"contains\", \"prefix\", \"exact\", \"regex\"");
        }
        if (j.contains("contains")) return LinePattern::contains(j.at("contains").get<std::string>());
        if (j.contains("prefix")) return LinePattern::prefix(j.at("prefix").get<std::string>());
        if (j.contains("exact")) return LinePattern::exact(j.at("exact").get<std::string>());
        if (j.contains("regex")) return LinePattern::regex(j.at("regex").get<std::string>());
        throw ConfigError("", fmt::format("unknown pattern kind \"{}\"", j.begin().key()));
    }

    // A string in a span or action is read as a regex
    static LinePattern regexOrPatternFromJson(const json & j)
    {
        if (j.is_string()) return LinePattern::regex(j.get<std::string>());
        return patternFromJson(j);
    }

    static char delimiterFromJson(const json & j, const char * key, char fallback)
    {
        if (!j.contains(key)) return fallback;
        std::string s = j.at(key).get<std::string>();
        if (s.size() != 1)
        {
            throw ConfigError("", fmt::format("\"{}\" must be a single character", key));
        }
        return s[0];
    }

    static SpanStrategy spanFromJson(const json & j)
    {
        std::string kind = j.at("kind").get<std::string>();
        if (kind == "single_line")
        {
            return SingleLine{};
        }
        if (kind == "fixed_pattern")
        {
            FixedPattern s{regexOrPatternFromJson(j.at("terminator"))};
            if (j.contains("followed_by")) s.followedBy = regexOrPatternFromJson(j.at("followed_by"));
            return s;
        }
        if (kind == "balanced_delimiters")
        {
            BalancedDelimiters s;
            s.open = delimiterFromJson(j, "open", '{');
            s.close = delimiterFromJson(j, "close", '}');
            s.initialDepth = j.value("initial_depth", 0);
            return s;
        }
        if (kind == "blank_or_dedent")
        {
            BlankOrDedent s;
            if (j.contains("base_indent"))
            {
                long baseIndent = j.at("base_indent").get<long>();
                if (baseIndent < 0)
                {
                    throw ConfigError("", "base indent must not be negative");
                }
                s.baseIndent = static_cast<std::size_t>(baseIndent);
            }
            return s;
        }
        throw ConfigError("", fmt::format("unknown span kind \"{}\"", kind));
    }

    static RewriteAction actionFromJson(const json & j)
    {
        std::string kind = j.at("kind").get<std::string>();
        if (kind == "delete")
        {
            return Delete{};
        }
        if (kind == "replace_lines")
        {
            return ReplaceLines{j.at("template").get<std::string>()};
        }
        if (kind == "replace_header_keep_body")
        {
            return ReplaceHeaderKeepBody{j.at("template").get<std::string>()};
        }
        if (kind == "substitute")
        {
            return Substitute::make(j.at("pattern").get<std::string>(), j.value("replacement", std::string()));
        }
        throw ConfigError("", fmt::format("unknown action kind \"{}\"", kind));
    }

    static ConstructRule ruleFromJson(const json & j)
    {
        StartPredicate start{patternFromJson(j.at("match"))};
        if (j.contains("preceded_by")) start.previous = patternFromJson(j.at("preceded_by"));
        if (j.contains("followed_by")) start.next = patternFromJson(j.at("followed_by"));

        SpanStrategy span = j.contains("span") ? spanFromJson(j.at("span")) : SpanStrategy{SingleLine{}};
        RewriteAction action = j.contains("action") ? actionFromJson(j.at("action")) : RewriteAction{Delete{}};

        return ConstructRule
        {
            .id = j.at("id").get<std::string>(),
            .start = std::move(start),
            .span = std::move(span),
            .action = std::move(action)
        };
    }
};

} // namespace Excise

#endif // EXCISE_RULESET_HPP
