#include "ibtac/options.hpp"

#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using ibtac::Mode;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static ibtac::Options parse_(std::initializer_list<std::string_view> args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("ibtac");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return ibtac::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool test_no_arguments_is_interactive_() {
        const auto opt = parse_({});

        bool ok = true;
        ok &= require_(opt.ok, "empty command line must parse");
        ok &= require_(opt.mode == Mode::Repl, "no input selects interactive mode");
        ok &= require_(!opt.report.show_newlines && !opt.report.hide_comments && !opt.report.suggest,
                       "report flags default off");
        return ok;
    }

    static bool test_file_input_() {
        const auto opt = parse_({"sample.ibt"});

        bool ok = true;
        ok &= require_(opt.ok, "file argument must parse");
        ok &= require_(opt.mode == Mode::File && opt.input == "sample.ibt", "file mode keeps the path");
        return ok;
    }

    static bool test_eval_input_() {
        const auto a = parse_({"-e", "071x = 1"});
        const auto b = parse_({"--eval", "$s$"});

        bool ok = true;
        ok &= require_(a.ok && a.mode == Mode::Eval && a.input == "071x = 1", "-e takes the next argument");
        ok &= require_(b.ok && b.mode == Mode::Eval && b.input == "$s$", "--eval is the long form");
        return ok;
    }

    static bool test_report_flags_() {
        const auto opt = parse_({"--show-newlines", "--hide-comments", "--suggest", "main.ibt"});

        bool ok = true;
        ok &= require_(opt.ok, "flags must parse");
        ok &= require_(opt.report.show_newlines, "--show-newlines");
        ok &= require_(opt.report.hide_comments, "--hide-comments");
        ok &= require_(opt.report.suggest, "--suggest");
        ok &= require_(opt.mode == Mode::File && opt.input == "main.ibt", "flags may precede the input");
        return ok;
    }

    static bool test_unknown_option_rejected_() {
        const auto opt = parse_({"--fast", "main.ibt"});

        bool ok = true;
        ok &= require_(!opt.ok, "unknown option must fail");
        ok &= require_(opt.error == "unknown option: --fast", "error names the option");
        return ok;
    }

    static bool test_single_input_only_() {
        const auto two_files = parse_({"a.ibt", "b.ibt"});
        const auto file_and_eval = parse_({"a.ibt", "-e", "if"});

        bool ok = true;
        ok &= require_(!two_files.ok && two_files.error == "only one input may be given", "two files");
        ok &= require_(!file_and_eval.ok, "a file and -e");
        return ok;
    }

    static bool test_eval_needs_source_() {
        const auto opt = parse_({"-e"});

        bool ok = true;
        ok &= require_(!opt.ok, "-e without source must fail");
        ok &= require_(opt.error == "missing source after -e", "error names the flag");
        return ok;
    }

    static bool test_help_and_version_win_() {
        const auto h = parse_({"--bogus", "-h"});
        const auto help = parse_({"-h", "--bogus"});
        const auto ver = parse_({"--version", "x.ibt", "y.ibt"});

        bool ok = true;
        ok &= require_(!h.ok, "an earlier unknown option still fails");
        ok &= require_(help.ok && help.mode == Mode::Usage, "-h stops parsing");
        ok &= require_(ver.ok && ver.mode == Mode::Version, "--version stops parsing");
        return ok;
    }

    static bool test_usage_text_() {
        std::ostringstream os;
        ibtac::print_usage(os);
        const std::string s = os.str();

        bool ok = true;
        ok &= require_(s.rfind("usage: ibtac", 0) == 0, "usage line first");
        ok &= require_(s.find("--show-newlines") != std::string::npos, "lists --show-newlines");
        ok &= require_(s.find("--suggest") != std::string::npos, "lists --suggest");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"no_arguments_is_interactive", test_no_arguments_is_interactive_},
        {"file_input", test_file_input_},
        {"eval_input", test_eval_input_},
        {"report_flags", test_report_flags_},
        {"unknown_option_rejected", test_unknown_option_rejected_},
        {"single_input_only", test_single_input_only_},
        {"eval_needs_source", test_eval_needs_source_},
        {"help_and_version_win", test_help_and_version_win_},
        {"usage_text", test_usage_text_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
