#pragma once
#include <string>
#include <vector>

// Tiny CSV helpers shared by the loaders. No quoted fields.
namespace pviz::csv {

std::string trim(std::string s);
std::string lower(std::string s);
std::vector<std::string> split_line(const std::string& line);

double to_double_safe(const std::string& s, bool& ok);
int to_int_safe(const std::string& s, bool& ok);
// true/false, yes/no, on/off, 1/0
bool to_bool_safe(const std::string& s, bool& ok);

} // namespace pviz::csv
