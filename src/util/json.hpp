#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <initializer_list>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

/// @addtogroup util
/// @{

/**
 * Helpers for reading structured data out of nlohmann::json values.
 */
namespace Json
{

/**
 * Thrown when a JSON value doesn't have the shape that's expected of it.
 */
class ShapeError final : public std::runtime_error
{
public:
    ~ShapeError() override;

    /**
     * @param object The name of the object that was being read, or std::nullopt for the root.
     * @param detail What's wrong with it.
     */
    explicit ShapeError(std::optional<std::string> object, std::string detail);

    const std::optional<std::string> &getObject() const
    {
        return object;
    }

    const std::string &getDetail() const
    {
        return detail;
    }

private:
    const std::optional<std::string> object;
    const std::string detail;
};

/**
 * Reads the members of a JSON object one key at a time.
 *
 * Every key that's asked for is remembered, so finish() can reject the keys that nothing asked for. Missing keys leave
 * the destination alone unless they're required.
 */
class ObjectReader final
{
public:
    /**
     * The JSON name of an enum value.
     */
    template <typename E>
    struct Name final
    {
        E value;
        const char *name;
    };

    ~ObjectReader();

    /**
     * @param j The value to read. This must outlive the reader.
     * @param name The name of the object, for error messages. nullptr for the root.
     * @throws ShapeError If the value isn't an object.
     */
    explicit ObjectReader(const nlohmann::json &j, const char *name = nullptr);

    /**
     * Read a member with nlohmann::json's conversion to T.
     *
     * If T is a std::optional, the member is converted to the contained type.
     */
    template <typename T>
    void read(T &dst, const char *key, bool required = false)
    {
        const nlohmann::json *value = find(key, required);
        if (!value) {
            return;
        }
        convert(key, [&dst, value]() {
            dst = value->get<typename Unwrap<T>::type>();
        });
    }

    /**
     * Read a member that's a string naming one of the values of an enum.
     */
    template <typename E> requires(std::is_enum_v<E>)
    void read(E &dst, const char *key, std::initializer_list<Name<E>> names, bool required = false)
    {
        const nlohmann::json *value = find(key, required);
        if (!value) {
            return;
        }

        std::string string = getString(key, *value);
        std::string expected;
        for (const Name<E> &name: names) {
            if (string == name.name) {
                dst = name.value;
                return;
            }
            expected += (expected.empty() ? "\"" : ", \"") + std::string(name.name) + "\"";
        }
        throw error("key \"" + std::string(key) + "\" is \"" + string + "\", expected one of: " + expected);
    }

    /**
     * Check that every key of the object has been read.
     *
     * @throws ShapeError If there's a key that nothing asked for.
     */
    void finish() const;

private:
    template <typename T> struct Unwrap final { using type = T; };
    template <typename T> struct Unwrap<std::optional<T>> final { using type = T; };

    /**
     * Look up a key and record that it was asked for.
     *
     * @return The member, or nullptr if there isn't one.
     */
    const nlohmann::json *find(const char *key, bool required);

    /**
     * Run a conversion, turning nlohmann::json's exceptions into ShapeError.
     */
    void convert(const char *key, const std::function<void ()> &fn) const;

    std::string getString(const char *key, const nlohmann::json &value) const;

    [[nodiscard]] ShapeError error(std::string detail) const;

    const nlohmann::json &j;
    const char *name;
    std::set<std::string, std::less<>> seen;
};

/**
 * Parse a JSON document.
 *
 * @param allowComments Accept C and C++ style comments.
 * @throws nlohmann::json::parse_error If it isn't valid JSON.
 */
nlohmann::json parse(std::string_view text, bool allowComments = false);

} // namespace Json

/// @}
