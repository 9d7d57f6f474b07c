#pragma once
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace docio {

// {"documents": ["...", ...]}
std::vector<std::string> parse_analyze_request(const nlohmann::json& j);

std::vector<std::string> load_analyze_request(const std::string& path);

}  // namespace docio
