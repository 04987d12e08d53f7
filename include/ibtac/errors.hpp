#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ibtac/token.hpp"


namespace ibtac {


// Error log for one scan. Every constructor records the token it returns,
// so the scanner can hand that same token back as the current one.
struct ErrorHandler {
std::vector<Token> errors;
int count{0};

Token report(TokKind k, std::string msg, int line, int col, std::string lexeme);

Token unterminated_string(int line, int col, const std::string& partial);
Token invalid_number(int line, int col, const std::string& text);
Token invalid_symbol(int line, int col, const std::string& symbol);
Token invalid_identifier(int line, int col, const std::string& word);
Token underscore_identifier(int line, int col, const std::string& text);
Token nested_comment(int line, int col);
Token unterminated_comment(int line, int col);

std::string summary() const;
std::string summary_header() const;                  // "Found N lexical error(s):\n"
static std::string summary_line(size_t n, const Token& e);  // "n. <e.str()>\n", n is 1-based
bool has_errors() const { return count > 0; }
int error_count() const { return count; }
void clear();
};


// "071", "070" or "048" followed by anything.
bool validate_identifier_format(const std::string& text);

// Integer ([0-9]+) or a complete floating-point literal (".5", "1E-5").
bool validate_number_format(const std::string& text);

std::optional<std::string> suggest_correction(const Token& t);


} // namespace ibtac
