#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip leading/trailing ascii whitespace
std::string trim(const std::string& s);

std::string to_lower(std::string s);

// join parts with sep, no leading/trailing separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// trim every item, drop the blank ones, keep order
std::vector<std::string> non_blank(const std::vector<std::string>& items);

}
