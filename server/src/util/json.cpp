#include "json.hpp"

namespace
{

std::string describe(const std::string &path, const std::string &problem)
{
    if (path.empty()) {
        return problem;
    }
    return "At \"" + path + "\": " + problem;
}

} // namespace

Json::FormatException::~FormatException() = default;

Json::FormatException::FormatException(std::string path, std::string problem) :
    std::runtime_error(describe(path, problem)), path(std::move(path)), problem(std::move(problem))
{
}

Json::ObjectReader::~ObjectReader() = default;

Json::ObjectReader::ObjectReader(const nlohmann::json &j, std::string path) : j(j), path(std::move(path))
{
    if (!j.is_object()) {
        throw FormatException(this->path, "Expected an object, got " + std::string(j.type_name()) + ".");
    }
}

void Json::ObjectReader::finish() const
{
    for (const auto &[key, value]: j.items()) {
        if (!readKeys.contains(key)) {
            throw FormatException(pathTo(key), "Unknown key.");
        }
    }
}

const nlohmann::json *Json::ObjectReader::find(std::string_view key, bool isRequired)
{
    std::string keyString(key);
    auto it = j.find(keyString);
    readKeys.insert(std::move(keyString));

    if (it == j.end()) {
        if (isRequired) {
            throw FormatException(pathTo(key), "Missing.");
        }
        return nullptr;
    }
    return &*it;
}

std::string Json::ObjectReader::pathTo(std::string_view key) const
{
    return path.empty() ? std::string(key) : path + "." + std::string(key);
}

nlohmann::json Json::parse(std::string_view jsonString, bool allowComments)
{
    return nlohmann::json::parse(jsonString, nullptr, true, allowComments);
}

std::string Json::dump(const nlohmann::json &json, int indent)
{
    return json.dump(indent);
}
