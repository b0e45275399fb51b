#pragma once

#include <any>
#include <ostream>
#include <sstream>
#include <string>
#include <typeinfo>
#include <utility>

/// @addtogroup service
/// @{

namespace Service
{

/**
 * The value an operation produced, with its type erased.
 *
 * Operations of a service can produce values of any type, so the success hook gets them as a Result. A subclass that
 * knows what an operation returns gets the value back with get<T>().
 */
class Result final
{
public:
    /**
     * The result of an operation that doesn't produce a value.
     */
    Result() = default;

    /**
     * Wrap a value.
     *
     * If the value can be written to a std::ostream, that's what the description is. Otherwise the description is just
     * the type.
     */
    template <typename T>
    static Result of(T value)
    {
        Result result;
        result.value = std::move(value);
        result.describe = &describeValue<T>;
        return result;
    }

    /**
     * Find out whether there's a value.
     */
    bool hasValue() const
    {
        return value.has_value();
    }

    /**
     * Get the value.
     *
     * @throws std::bad_any_cast If there's no value, or it isn't a T.
     */
    template <typename T>
    const T &get() const
    {
        return std::any_cast<const T &>(value);
    }

    /**
     * Get a human readable description of the value, for logging.
     *
     * This is built on each call, so results nobody logs are never formatted.
     */
    std::string getDescription() const
    {
        if (!describe) {
            return "(none)";
        }
        return describe(value);
    }

private:
    static std::string describeType(const std::type_info &type);

    template <typename T>
    static std::string describeValue(const std::any &value)
    {
        if constexpr (requires (std::ostream &s, const T &t) { s << t; }) {
            std::stringstream description;
            description << std::any_cast<const T &>(value);
            return description.str();
        }
        else {
            return "<" + describeType(typeid(T)) + ">";
        }
    }

    std::any value;

    /**
     * Describes the value. Null if there's no value.
     */
    std::string (*describe)(const std::any &) = nullptr;
};

} // namespace Service

/// @}
