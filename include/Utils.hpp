#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ckd
{
namespace utils
{
/// Strip leading/trailing whitespace.
std::string Trim(const std::string &s);

/// ASCII lower-case copy.
std::string ToLower(std::string s);

/// Write vector contents with a label to a stream.
void WriteVector(std::ostream &os, const std::vector<double> &v,
                 const std::string &label);

/// Create the parent directories of a file path if it has any.
void EnsureParentDirectory(const std::string &path);
}  // namespace utils
}  // namespace ckd
