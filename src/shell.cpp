#include "ibtac/shell.hpp"
#include "ibtac/lexer.hpp"
#include "ibtac/options.hpp"
#include "ibtac/signals.hpp"
#include "ibtac/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

#ifdef IBTAC_USE_READLINE
extern "C" {
#include <readline/history.h>
#include <readline/readline.h>
extern int rl_catch_signals;
}
#endif

namespace ibtac {

static void print_help(std::ostream& os){
  os << "Type IBTAC source to see its tokens, e.g.  func 071main() { return $hi$ }\n";
  os << "Commands: HELP, LOAD <file>, NEWLINES, COMMENTS, HINTS, BYE\n";
  os << "Identifiers start with 071, 070 or 048; strings are $...$\n";
}

static const char* on_off(bool b){ return b ? "on" : "off"; }

int Shell::run_source(const std::string& src, std::ostream& os){
  Lexer lx(src);
  auto tokens = lx.tokenize();
  os << render_listing(tokens, report);
  if(lx.errors().has_errors()) os << "\n" << render_errors(lx.errors(), report);
  os << render_stats(tokens, lx.errors()) << "\n";
  return lx.errors().has_errors() ? 1 : 0;
}

int Shell::run_file(const std::string& path, std::ostream& os){
  std::string src;
  auto r = read_source(path, src);
  if(r.err){ std::cerr << r.err->msg << "\n"; return 2; }
  return run_source(src, os);
}

bool Shell::meta_command(const std::string& line, std::ostream& os, bool* quit){
  std::string up = to_upper(line);
  if(up=="HELP"){ print_help(os); return true; }
  if(up=="BYE" || up=="EXIT"){ if(quit) *quit = true; return true; }
  if(up=="NEWLINES"){ report.show_newlines = !report.show_newlines; os << "newlines " << on_off(report.show_newlines) << "\n"; return true; }
  if(up=="COMMENTS"){ report.hide_comments = !report.hide_comments; os << "comments " << on_off(!report.hide_comments) << "\n"; return true; }
  if(up=="HINTS"){ report.suggest = !report.suggest; os << "hints " << on_off(report.suggest) << "\n"; return true; }
  if(starts_with(up, "LOAD ")){
    std::string p = trim(line.substr(5));
    if(p.empty()){ os << "LOAD needs a file name\n"; return true; }
    (void)run_file(p, os);
    return true;
  }
  return false;
}

void Shell::repl(const char* prompt){
  SigintGuard sig;
#ifdef IBTAC_USE_READLINE
  rl_catch_signals = 0; // SigintGuard owns SIGINT
#endif

  std::cout << "IBTAC lexical analyzer " << k_version << " (type HELP)\n";

  bool quit = false;
  while(!quit){
    std::string line;
#ifndef IBTAC_USE_READLINE
    std::cout << prompt << std::flush;
    if(!std::getline(std::cin, line)){
      if(take_interrupt()){ std::cout << "\n"; std::cin.clear(); std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n'); continue; }
      break;
    }
#else
    char* in = readline(prompt);
    if(!in){
      if(take_interrupt()){ std::cout << "\n"; continue; }
      break;
    }
    line.assign(in);
    if(!trim(line).empty()) add_history(in);
    std::free(in);
#endif
    if(take_interrupt()) continue;  // Ctrl-C while typing drops the line

    std::string s = trim(line);
    if(s.empty()) continue;
    if(meta_command(s, std::cout, &quit)) continue;

    (void)run_source(line, std::cout);
  }
}

} // namespace ibtac
