#pragma once
#include <ostream>
#include <string>

#include "ibtac/report.hpp"


namespace ibtac {


// Front end around the scanner: file, inline and interactive modes.
// run_* return 0 (clean), 1 (lexical errors) or 2 (host error).
struct Shell {
ReportOptions report;

void repl(const char* prompt="ibtac> ");
int run_file(const std::string& path, std::ostream& os);
int run_source(const std::string& src, std::ostream& os);

// Interactive meta command (HELP, LOAD, toggles). Returns false when the
// line is not one, so it should be scanned as source.
bool meta_command(const std::string& line, std::ostream& os, bool* quit);
};


} // namespace ibtac
