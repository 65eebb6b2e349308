#pragma once
#include <string>
#include <vector>

namespace xorgconf::utils::string {

std::string str_err(int errnum);

// str_err() for a failed stream, which does not always set errno
std::string io_err(int errnum);

std::string to_lower(const std::string &src);

bool iequals(const std::string &a, const std::string &b);

std::string join(const std::vector<std::string> &src, const std::string &separator);

// Splits on separator, trims blanks around every token and drops empty tokens.
std::vector<std::string> split_list(const std::string &src, char separator = ',');

} // namespace xorgconf::utils::string
