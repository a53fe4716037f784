// =================================================================
// tests/SearchOptionsTest.cpp
// =================================================================
// Unit tests for command-line resolution.

#include "TestSupport.hpp"
#include <literalgrep/search_options.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

class SearchOptionsTest {
private:
    static std::string usageErrorFor(const std::vector<std::string>& args) {
        OutputCapture output;
        try {
            resolve_search_options(args, output.file());
        } catch (const usage_error& e) {
            assert(output.str().empty() && "Usage errors should not print help");
            return e.what();
        }
        return "";
    }

    static search_options resolve(const std::vector<std::string>& args) {
        OutputCapture output;
        auto outcome = resolve_search_options(args, output.file());
        assert(outcome.next == parse_outcome::action::run);
        assert(outcome.options.has_value());
        return std::move(outcome.options.value());
    }

public:
    void testMissingArguments() {
        std::cout << "Testing empty argument list..." << std::endl;

        assert(usageErrorFor({}) == "Missing arguments. Use -h for help.");

        std::cout << "✓ Empty argument list test passed" << std::endl;
    }

    void testMissingPatternAndInputs() {
        std::cout << "Testing missing pattern and inputs..." << std::endl;

        assert(usageErrorFor({"-n", "-i"}) == "Missing search pattern.");
        assert(usageErrorFor({"--"}) == "Missing search pattern.");
        assert(usageErrorFor({"Utility"}) == "Missing input files.");
        assert(usageErrorFor({"-r", "Utility", "-n"}) == "Missing input files.");

        std::cout << "✓ Missing pattern and inputs test passed" << std::endl;
    }

    void testHelpShortCircuits() {
        std::cout << "Testing help flag..." << std::endl;

        {
            OutputCapture output;
            auto outcome = resolve_search_options({"-h"}, output.file());
            assert(outcome.next == parse_outcome::action::help);
            assert(!outcome.options.has_value());
            assert(output.str().find("Usage: grep [OPTIONS] <pattern> <files...>") != std::string::npos);
        }

        {
            // Nothing after the help flag is looked at, even incomplete input
            OutputCapture output;
            auto outcome = resolve_search_options({"Utility", "--help", "--"}, output.file());
            assert(outcome.next == parse_outcome::action::help);
            assert(output.str().find("-h, --help        Show help information") != std::string::npos);
        }

        std::cout << "✓ Help flag test passed" << std::endl;
    }

    void testFlagsAndPositionalsInterleave() {
        std::cout << "Testing flag and positional interleaving..." << std::endl;

        auto options = resolve({"-n", "Utility", "a.md", "-i", "b.md", "-v", "-r", "-f", "-c"});
        assert(options.pattern == "Utility");
        assert((options.inputs == std::vector<std::string>{"a.md", "b.md"}));
        assert(options.show_line_numbers);
        assert(options.ignore_case);
        assert(options.invert_match);
        assert(options.recursive);
        assert(options.print_filenames);
        assert(options.colored);
        assert(options.matcher);
        assert(options.matcher->ignore_case());

        auto defaults = resolve({"Utility", "a.md"});
        assert(!defaults.show_line_numbers);
        assert(!defaults.ignore_case);
        assert(!defaults.invert_match);
        assert(!defaults.recursive);
        assert(!defaults.print_filenames);
        assert(!defaults.colored);
        assert(!defaults.matcher->ignore_case());

        std::cout << "✓ Interleaving test passed" << std::endl;
    }

    void testDoubleDashClosesOptions() {
        std::cout << "Testing double dash..." << std::endl;

        auto options = resolve({"--", "-n", "grep.md"});
        assert(options.pattern == "-n");
        assert(!options.show_line_numbers);
        assert((options.inputs == std::vector<std::string>{"grep.md"}));
        assert(options.matcher->pattern() == "-n");

        auto late = resolve({"-i", "Utility", "--", "-r", "-h", "--"});
        assert(late.ignore_case);
        assert(!late.recursive);
        assert((late.inputs == std::vector<std::string>{"-r", "-h", "--"}));

        std::cout << "✓ Double dash test passed" << std::endl;
    }

    void testUnknownTokensArePositional() {
        std::cout << "Testing unrecognised tokens..." << std::endl;

        auto options = resolve({"-in", "-", "--color"});
        assert(options.pattern == "-in");
        assert(!options.ignore_case);
        assert(!options.show_line_numbers);
        assert((options.inputs == std::vector<std::string>{"-", "--color"}));

        std::cout << "✓ Unrecognised tokens test passed" << std::endl;
    }

    void testInputsAreNotChecked() {
        std::cout << "Testing that inputs are not touched while parsing..." << std::endl;

        auto options = resolve({"Utility", "/definitely/not/here.md"});
        assert((options.inputs == std::vector<std::string>{"/definitely/not/here.md"}));

        std::cout << "✓ Unchecked inputs test passed" << std::endl;
    }

    void runAllTests() {
        testMissingArguments();
        testMissingPatternAndInputs();
        testHelpShortCircuits();
        testFlagsAndPositionalsInterleave();
        testDoubleDashClosesOptions();
        testUnknownTokensArePositional();
        testInputsAreNotChecked();
    }
};

int runSearchOptionsTests() {
    SearchOptionsTest tests;
    tests.runAllTests();
    return 0;
}
