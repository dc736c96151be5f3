#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <string>

namespace tradestats::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Reads and parses a whole file. Throws std::runtime_error when the file cannot be opened.
boost::json::value readJsonFile(const std::filesystem::path& path);

} // namespace tradestats::util
