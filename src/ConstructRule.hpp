#ifndef EXCISE_CONSTRUCTRULE_HPP
#define EXCISE_CONSTRUCTRULE_HPP

#include <string>

#include <spdlog/fmt/fmt.h>

#include "Matcher.hpp"
#include "SpanResolver.hpp"
#include "RewriteAction.hpp"

namespace Excise
{

// One removable or rewritable construct: where it starts, how far it reaches,
// and what replaces it.
struct ConstructRule
{
    std::string id;
    StartPredicate start;
    SpanStrategy span;
    RewriteAction action;

    std::string toString() const
    {
        std::string window = start.current.toString();
        if (start.previous) window = fmt::format("{} after a line matching {}", window, start.previous->toString());
        if (start.next) window = fmt::format("{} before a line matching {}", window, start.next->toString());
        return fmt::format
        (
            "{}: {}; span {}; {}",
            id,
            window,
            SpanResolver::describe(span),
            ActionApplier::describe(action)
        );
    }
};

} // namespace Excise

#endif // EXCISE_CONSTRUCTRULE_HPP
