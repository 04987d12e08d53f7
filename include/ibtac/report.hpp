#pragma once
#include <string>
#include <vector>

#include "ibtac/token.hpp"
#include "ibtac/errors.hpp"


namespace ibtac {


struct ReportOptions {
bool show_newlines{false};
bool hide_comments{false};
bool suggest{false};
};


// Token table (#, TYPE, VALUE, LINE, COL) without EOF, whitespace and error tokens.
std::string render_listing(const std::vector<Token>& tokens, const ReportOptions& opt);

// Error summary, with "hint:" lines when opt.suggest is set.
std::string render_errors(const ErrorHandler& errs, const ReportOptions& opt);

// "tokens: N, errors: M"
std::string render_stats(const std::vector<Token>& tokens, const ErrorHandler& errs);


} // namespace ibtac
