#pragma once
#include <ostream>
#include <string>

#include "ibtac/report.hpp"


namespace ibtac {


inline constexpr const char* k_version = "0.1.0";


enum class Mode { Usage, Version, File, Eval, Repl };


struct Options {
Mode mode{Mode::Repl};
std::string input;          // path for File, source text for Eval
ReportOptions report;

bool ok{true};
std::string error;
};


void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);


} // namespace ibtac
