#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ckd
{
namespace utils
{
namespace fs = std::filesystem;

std::string Trim(const std::string &s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void WriteVector(std::ostream &os, const std::vector<double> &v,
                 const std::string &label)
{
    os << label << " [size=" << v.size() << "]:";
    for (double x : v)
    {
        os << " " << x;
    }
    os << "\n";
}

void EnsureParentDirectory(const std::string &path)
{
    fs::path p(path);
    if (p.has_parent_path())
    {
        fs::create_directories(p.parent_path());
    }
}
}  // namespace utils
}  // namespace ckd
