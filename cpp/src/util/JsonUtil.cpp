#include "tradestats/util/JsonUtil.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace tradestats::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

boost::json::value readJsonFile(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parseJson(content);
}

} // namespace tradestats::util
