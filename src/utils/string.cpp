#include "string.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <string>
#include <system_error>

namespace xorgconf::utils::string {

std::string str_err(int errnum)
{
    return std::system_category().message(errnum);
}


std::string io_err(int errnum)
{
    return errnum == 0 ? "unknown I/O error" : str_err(errnum);
}


std::string to_lower(const std::string &src)
{
    return boost::algorithm::to_lower_copy(src);
}


bool iequals(const std::string &a, const std::string &b)
{
    return boost::iequals(a, b);
}


std::string join(const std::vector<std::string> &src, const std::string &separator)
{
    return boost::algorithm::join(src, separator);
}


std::vector<std::string> split_list(const std::string &src, char separator)
{
    std::vector<std::string> tokens;
    boost::split(tokens, src, [separator](char c) { return c == separator; });

    std::vector<std::string> result;
    for (auto &token: tokens) {
        boost::trim(token);
        if (!token.empty())
            result.push_back(std::move(token));
    }
    return result;
}

} // namespace xorgconf::utils::string
