#include "json.hpp"

#include <utility>

Json::ShapeError::~ShapeError() = default;

Json::ShapeError::ShapeError(std::optional<std::string> object, std::string detail) :
    std::runtime_error(object ? "in \"" + *object + "\": " + detail : detail),
    object(std::move(object)), detail(std::move(detail))
{
}

Json::ObjectReader::~ObjectReader() = default;

Json::ObjectReader::ObjectReader(const nlohmann::json &j, const char *name) : j(j), name(name)
{
    if (!j.is_object()) {
        throw error("expected an object");
    }
}

void Json::ObjectReader::finish() const
{
    for (const auto &[key, value]: j.items()) {
        if (!seen.contains(key)) {
            throw error("unknown key \"" + key + "\"");
        }
    }
}

const nlohmann::json *Json::ObjectReader::find(const char *key, bool required)
{
    seen.emplace(key);

    auto it = j.find(key);
    if (it != j.end()) {
        return &*it;
    }
    if (required) {
        throw error("missing key \"" + std::string(key) + "\"");
    }
    return nullptr;
}

void Json::ObjectReader::convert(const char *key, const std::function<void ()> &fn) const
{
    try {
        fn();
    }
    catch (const nlohmann::json::type_error &e) {
        throw error("key \"" + std::string(key) + "\" has the wrong type (" + e.what() + ")");
    }
    catch (const nlohmann::json::out_of_range &e) {
        throw error("key \"" + std::string(key) + "\" is out of range (" + e.what() + ")");
    }
}

std::string Json::ObjectReader::getString(const char *key, const nlohmann::json &value) const
{
    if (!value.is_string()) {
        throw error("key \"" + std::string(key) + "\" is not a string");
    }
    return value.get<std::string>();
}

Json::ShapeError Json::ObjectReader::error(std::string detail) const
{
    return ShapeError(name ? std::optional<std::string>(name) : std::nullopt, std::move(detail));
}

nlohmann::json Json::parse(std::string_view text, bool allowComments)
{
    return nlohmann::json::parse(text, nullptr, true, allowComments);
}
