#include "ibtac/options.hpp"
#include "ibtac/shell.hpp"
#include <cstdlib>
#include <iostream>


int main(int argc, char** argv){
auto opt = ibtac::parse_options(argc, argv);
if(!opt.ok){ std::cerr << "ibtac: " << opt.error << "\n"; ibtac::print_usage(std::cerr); return 2; }

ibtac::Shell sh; sh.report = opt.report;
switch(opt.mode){
  case ibtac::Mode::Usage:   ibtac::print_usage(std::cout); return 0;
  case ibtac::Mode::Version: std::cout << "ibtac " << ibtac::k_version << "\n"; return 0;
  case ibtac::Mode::File:    return sh.run_file(opt.input, std::cout);
  case ibtac::Mode::Eval:    return sh.run_source(opt.input, std::cout);
  case ibtac::Mode::Repl:    break;
}
const char* ps = std::getenv("IBTAC_PROMPT");
sh.repl(ps && *ps ? ps : "ibtac> ");
return 0;
}
