#include "csv_util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pviz::csv {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

double to_double_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::logic_error&) {
    ok = false;
    return 0.0;
  }
}

int to_int_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    int v = std::stoi(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::logic_error&) {
    ok = false;
    return 0;
  }
}

bool to_bool_safe(const std::string& s, bool& ok) {
  const auto v = lower(trim(s));
  ok = true;
  if (v == "1" || v == "true"  || v == "yes" || v == "on")  return true;
  if (v == "0" || v == "false" || v == "no"  || v == "off") return false;
  ok = false;
  return false;
}

} // namespace pviz::csv
