#pragma once
#include <string>

namespace fitz::paths {

// Resolved location of config.json (see configFilePath in paths.cpp for the search order).
std::string configFilePath();

} // namespace fitz::paths
