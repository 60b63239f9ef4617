// Single forward pass over a line buffer. At each line the rules are tried in order;
// on a hit the span is resolved, the rule's action replaces the whole span and
// scanning resumes after it. Lines no rule claims are copied through unchanged.
// Already emitted output is never looked at again.

#ifndef EXCISE_REWRITEENGINE_HPP
#define EXCISE_REWRITEENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Util.hpp"
#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "Matcher.hpp"
#include "SpanResolver.hpp"
#include "RewriteAction.hpp"
#include "ConstructRule.hpp"
#include "RuleSet.hpp"

namespace Excise
{

struct AppliedRewrite
{
    std::string ruleId;
    std::size_t startIndex; // Inclusive, in the input
    std::size_t endIndex; // Inclusive, in the input
    std::size_t emitted; // Lines written in place of the span

    std::size_t spanLength() const noexcept
    {
        return endIndex - startIndex + 1;
    }
};

struct PatchResult
{
    std::vector<SourceLine> outputLines;
    std::vector<AppliedRewrite> applied; // Audit trail, ordered by startIndex

    bool changed() const noexcept
    {
        return !applied.empty();
    }

    std::string text() const
    {
        StringBuilder builder;
        for (const SourceLine & line : outputLines)
        {
            builder.append(line.text);
            builder.append(line.eol);
        }
        return builder.str();
    }

    std::vector<std::string> appliedRuleIds() const
    {
        std::vector<std::string> ids;
        for (const AppliedRewrite & record : applied)
        {
            ids.push_back(record.ruleId);
        }
        return ids;
    }
};

class RewriteEngine
{
public:
    enum class State
    {
        Scanning,
        InSpan,
        Done
    };

    RewriteEngine(const RuleSet & ruleSet, const LineBuffer & buffer)
        : ruleSet(ruleSet), buffer(buffer)
    {
    }

    RewriteEngine(const RewriteEngine &) = delete;
    RewriteEngine & operator=(const RewriteEngine &) = delete;

    // Runs the pass to completion. Throws UnterminatedConstruct, in which case
    // no result is produced and the engine is left in the InSpan state.
    PatchResult run()
    {
        result = PatchResult{};
        index = 0;
        state = buffer.empty() ? State::Done : State::Scanning;

        while (state != State::Done)
        {
            step();
        }

        SPDLOG_DEBUG
        (
            "Rewrite pass done: {} input line(s), {} output line(s), {} construct(s) rewritten",
            buffer.size(), result.outputLines.size(), result.applied.size()
        );
        return std::move(result);
    }

    State getState() const noexcept
    {
        return state;
    }

    std::size_t getIndex() const noexcept
    {
        return index;
    }

private:
    const RuleSet & ruleSet;
    const LineBuffer & buffer;

    State state = State::Scanning;
    std::size_t index = 0;
    PatchResult result;

    void step()
    {
        const ConstructRule * hit = nullptr;
        std::optional<Captures> captures;
        for (const ConstructRule & rule : ruleSet.getRules())
        {
            captures = Matcher::matches(rule.start, buffer, index);
            if (captures)
            {
                hit = &rule;
                break;
            }
        }

        if (!hit)
        {
            emit(buffer[index]);
            advanceTo(index + 1);
            return;
        }

        state = State::InSpan;
        std::size_t end = SpanResolver::resolve(hit->span, buffer, index, hit->id);
        std::vector<SourceLine> replacement = ActionApplier::apply(hit->action, buffer, index, end, *captures);

        SPDLOG_DEBUG
        (
            "Rule {} rewrote lines {}-{} into {} line(s)",
            hit->id, index + 1, end + 1, replacement.size()
        );
        result.applied.push_back(AppliedRewrite{hit->id, index, end, replacement.size()});
        for (SourceLine & line : replacement)
        {
            emit(std::move(line));
        }
        advanceTo(end + 1);
    }

    void emit(SourceLine line)
    {
        line.index = result.outputLines.size();
        result.outputLines.push_back(std::move(line));
    }

    void advanceTo(std::size_t next)
    {
        index = next;
        state = index >= buffer.size() ? State::Done : State::Scanning;
    }
};

} // namespace Excise

#endif // EXCISE_REWRITEENGINE_HPP
