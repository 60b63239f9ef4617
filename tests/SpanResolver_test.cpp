#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "Matcher.hpp"
#include "SpanResolver.hpp"

int main(int argc, char **argv)
{
    using namespace Excise;

    spdlog::set_level(spdlog::level::trace);

    int failures = 0;
    auto expect = [&failures](bool ok, const std::string & what)
    {
        if (!ok)
        {
            std::cout << "FAILED: " << what << std::endl;
            ++failures;
        }
    };
    auto expectEnd = [&expect](std::size_t got, std::size_t want, const std::string & what)
    {
        if (got != want)
        {
            std::cout << "Expected end " << want << ", got " << got << std::endl;
        }
        expect(got == want, what);
    };
    auto throwsUnterminated = [](auto && call, const std::string & ruleId, std::size_t startIndex)
    {
        try
        {
            call();
        }
        catch (const UnterminatedConstruct & e)
        {
            return e.ruleId == ruleId && e.startIndex == startIndex;
        }
        return false;
    };

    // Balanced delimiters: the nested closing brace must not end the span
    {
        LineBuffer buffer
        (
            "X {\n"     // 0
            "  A {\n"   // 1
            "  }\n"     // 2
            "  B\n"     // 3
            "}\n"       // 4
            "tail\n"    // 5
        );
        std::size_t end = SpanResolver::resolve(BalancedDelimiters{'{', '}', 0}, buffer, 0, "block");
        expectEnd(end, 4, "span ends at the brace matching the first one");
    }

    // Balanced delimiters on a single line
    {
        LineBuffer buffer("X { A { } B } tail\nnext\n");
        expectEnd(SpanResolver::resolve(BalancedDelimiters{}, buffer, 0), 0, "start line that balances ends immediately");
    }

    // Lines before the first opening delimiter belong to the span
    {
        LineBuffer buffer
        (
            "// Interceptor helper methods\n"  // 0
            "impl Client {\n"                  // 1
            "    fn a() { x }\n"               // 2
            "    fn b() {\n"                   // 3
            "    } \n"                         // 4
            "}\n"                              // 5
            "\n"                               // 6
            "impl Other {}\n"                  // 7
        );
        expectEnd(SpanResolver::resolve(BalancedDelimiters{}, buffer, 0, "helper-impl"), 5, "leading comment line is included");
    }

    // Several delimiters per line and a non-zero seed
    {
        LineBuffer buffer
        (
            "    a: 1,\n"       // 0
            "    b: ((2)),\n"   // 1
            "});\n"             // 2
            "after\n"           // 3
        );
        expectEnd(SpanResolver::resolve(BalancedDelimiters{'(', ')', 1}, buffer, 0), 2, "seeded depth counts down to zero");
    }

    // Balanced delimiters that never close
    {
        LineBuffer buffer("fn f() {\n    if x {\n    }\n");
        expect
        (
            throwsUnterminated([&]{ SpanResolver::resolve(BalancedDelimiters{}, buffer, 0, "fn"); }, "fn", 0),
            "unclosed block raises UnterminatedConstruct"
        );
    }

    // Fixed pattern: terminator on a later line, on the start line itself, and missing
    {
        LineBuffer buffer
        (
            "let x = 1;\n"                                   // 0
            "        self.call_before_request(op, &model)\n" // 1
            "            .await?;\n"                         // 2
            "        self.call_before_request(op).await?;\n" // 3
            "        self.call_after_response(\n"            // 4
            "            &response,\n"                       // 5
        );
        FixedPattern awaitTry{LinePattern::regex(R"(\.await\?;\s*$)")};
        expectEnd(SpanResolver::resolve(awaitTry, buffer, 1), 2, "terminator on the next line");
        expectEnd(SpanResolver::resolve(awaitTry, buffer, 3), 3, "terminator on the start line");

        FixedPattern awaitOnly{LinePattern::regex(R"(\.await;\s*$)")};
        expect
        (
            throwsUnterminated([&]{ SpanResolver::resolve(awaitOnly, buffer, 4, "after-call"); }, "after-call", 4),
            "missing terminator raises UnterminatedConstruct"
        );
    }

    // Fixed pattern with a required following line
    {
        LineBuffer buffer
        (
            "macro_rules! m {\n"   // 0
            "    () => {\n"        // 1
            "        }\n"          // 2
            "        x\n"          // 3
            "    }\n"              // 4
            "}\n"                  // 5
            "rest\n"               // 6
        );
        FixedPattern pair{LinePattern::regex(R"(^\s*\}\s*$)"), LinePattern::regex(R"(^\s*\}\s*$)")};
        expectEnd(SpanResolver::resolve(pair, buffer, 0), 5, "lone closing brace is skipped, the pair ends the span");

        LineBuffer unpaired("m {\n}\nx\n");
        expect
        (
            throwsUnterminated([&]{ SpanResolver::resolve(pair, unpaired, 0, "macro"); }, "macro", 0),
            "terminator never followed by its partner raises UnterminatedConstruct"
        );
    }

    // Blank or dedent
    {
        LineBuffer buffer
        (
            "def f():\n"      // 0
            "    a = 1\n"     // 1
            "\n"              // 2
            "    b = 2\n"     // 3
            "\n"              // 4
            "def g():\n"      // 5
            "    pass\n"      // 6
        );
        expectEnd(SpanResolver::resolve(BlankOrDedent{}, buffer, 0), 3, "block ends before the dedent, blank tail left out");
        expectEnd(SpanResolver::resolve(BlankOrDedent{0}, buffer, 5), 6, "block running to end of buffer");
        expectEnd(SpanResolver::resolve(BlankOrDedent{4}, buffer, 1), 1, "explicit base indent stops at the sibling line");
    }

    // Single line, and a start index outside the buffer
    {
        LineBuffer buffer("a\nb\n");
        expectEnd(SpanResolver::resolve(SingleLine{}, buffer, 1), 1, "single line span");
        expect
        (
            throwsUnterminated([&]{ SpanResolver::resolve(SingleLine{}, buffer, 2, "oob"); }, "oob", 2),
            "start past the end raises UnterminatedConstruct"
        );
    }

    if (failures == 0)
    {
        std::cout << "Test passed!" << std::endl;
        return 0;
    }
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
}
