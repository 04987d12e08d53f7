#include "ibtac/errors.hpp"
#include "ibtac/utils.hpp"
#include <cstdlib>

namespace ibtac {

static const char* const kPrefixRule = "must start with '071', '070', or '048'";

Token ErrorHandler::report(TokKind k, std::string msg, int line, int col, std::string lexeme){
  ++count;
  Token t{k, std::move(lexeme), line, col, std::move(msg)};
  errors.push_back(t);
  return t;
}

Token ErrorHandler::unterminated_string(int line, int col, const std::string& partial){
  return report(TokKind::UnterminatedString,
                "Unterminated string literal: '" + partial + "'", line, col, partial);
}

Token ErrorHandler::invalid_number(int line, int col, const std::string& text){
  return report(TokKind::InvalidNumber,
                "Invalid number format: '" + text + "'", line, col, text);
}

Token ErrorHandler::invalid_symbol(int line, int col, const std::string& symbol){
  return report(TokKind::InvalidSymbol,
                "Invalid symbol: '" + symbol + "'", line, col, symbol);
}

Token ErrorHandler::invalid_identifier(int line, int col, const std::string& word){
  return report(TokKind::GenericError,
                "Invalid identifier: '" + word + "' (" + kPrefixRule + ")", line, col, word);
}

Token ErrorHandler::underscore_identifier(int line, int col, const std::string& text){
  return report(TokKind::GenericError,
                "Invalid identifier: " + text + " (identifiers " + kPrefixRule + ", never '_')",
                line, col, text);
}

Token ErrorHandler::nested_comment(int line, int col){
  return report(TokKind::GenericError,
                "Nested multi-line comments are not supported", line, col, "/*");
}

Token ErrorHandler::unterminated_comment(int line, int col){
  return report(TokKind::GenericError,
                "Unterminated multi-line comment", line, col, "/*");
}

std::string ErrorHandler::summary() const {
  if(count == 0) return "No lexical errors found.";
  std::string out = summary_header();
  for(size_t i=0;i<errors.size();++i) out += summary_line(i+1, errors[i]);
  return out;
}

std::string ErrorHandler::summary_header() const {
  return "Found " + std::to_string(count) + " lexical error(s):\n";
}

std::string ErrorHandler::summary_line(size_t n, const Token& e){
  return std::to_string(n) + ". " + e.str() + "\n";
}

void ErrorHandler::clear(){
  errors.clear();
  count = 0;
}

/* ---------------- validation ---------------- */

bool validate_identifier_format(const std::string& text){
  if(text.size() < 3) return false;
  return starts_with(text, "071") || starts_with(text, "070") || starts_with(text, "048");
}

bool validate_number_format(const std::string& text){
  if(text.empty()) return false;
  bool floaty = text.find_first_of(".eE") != std::string::npos;
  if(!floaty){
    for(char c: text) if(!is_digit(c)) return false;
    return true;
  }
  // strtod also takes "inf", "nan" and hex floats; none of those is a numeral here
  for(char c: text){
    if(!is_digit(c) && c!='.' && c!='e' && c!='E' && c!='+' && c!='-') return false;
  }
  const char* begin = text.c_str();
  char* end = nullptr;
  std::strtod(begin, &end);  // out-of-range values still name a float literal
  return end == begin + text.size();
}

std::optional<std::string> suggest_correction(const Token& t){
  if(t.k == TokKind::GenericError && t.err && t.err->find("must start with") != std::string::npos)
    return std::string("Try starting the identifier with '071', '070', or '048'.");
  if(t.k == TokKind::UnterminatedString)
    return "Add closing '$' to complete string: '" + t.text + "$'";
  if(t.k == TokKind::InvalidNumber)
    return std::string("Check number format - use digits, decimal point, or exponential notation");
  return std::nullopt;
}

} // namespace ibtac
