#include "ibtac/report.hpp"
#include "ibtac/utils.hpp"
#include <iomanip>
#include <sstream>

namespace ibtac {

static bool listed(const Token& t, const ReportOptions& opt){
  if(t.is_error()) return false;
  switch(t.k){
    case TokKind::EndOfInput:
    case TokKind::Whitespace: return false;
    case TokKind::Newline:    return opt.show_newlines;
    case TokKind::Comment:    return !opt.hide_comments;
    default:                  return true;
  }
}

std::string render_listing(const std::vector<Token>& tokens, const ReportOptions& opt){
  std::ostringstream os;
  os << std::left
     << std::setw(5)  << "#"
     << std::setw(20) << "TYPE"
     << std::setw(28) << "VALUE"
     << std::setw(6)  << "LINE"
     << "COL" << "\n";
  os << std::string(62, '-') << "\n";

  int n = 0;
  for(const auto& t : tokens){
    if(!listed(t, opt)) continue;
    os << std::setw(5)  << ++n
       << std::setw(20) << to_string(t.k)
       << std::setw(28) << escape_visible(t.text)
       << std::setw(6)  << t.line
       << t.col << "\n";
  }
  if(n == 0) os << "(no tokens)\n";
  return os.str();
}

std::string render_errors(const ErrorHandler& errs, const ReportOptions& opt){
  if(!opt.suggest || !errs.has_errors()) return errs.summary();

  std::ostringstream os;
  os << errs.summary_header();
  for(size_t i=0;i<errs.errors.size();++i){
    const Token& e = errs.errors[i];
    os << ErrorHandler::summary_line(i+1, e);
    if(auto hint = suggest_correction(e)) os << "   hint: " << *hint << "\n";
  }
  return os.str();
}

std::string render_stats(const std::vector<Token>& tokens, const ErrorHandler& errs){
  int n = 0;
  for(const auto& t : tokens) if(!is_structural(t.k)) ++n;
  return "tokens: " + std::to_string(n) + ", errors: " + std::to_string(errs.error_count());
}

} // namespace ibtac
