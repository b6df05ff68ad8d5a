#pragma once

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/// @addtogroup util
/// @{

/**
 * JSON helpers on top of nlohmann::json.
 */
namespace Json
{

/**
 * A JSON document has the right syntax but the wrong shape: a missing or unknown key, or a value of the wrong type.
 */
class FormatException final : public std::runtime_error
{
public:
    ~FormatException() override;

    /**
     * @param path The dotted path of the offending value, e.g: "media.root". Empty for the document itself.
     * @param problem What's wrong with it.
     */
    explicit FormatException(std::string path, std::string problem);

    const std::string &getPath() const
    {
        return path;
    }

    const std::string &getProblem() const
    {
        return problem;
    }

private:
    const std::string path;
    const std::string problem;
};

/**
 * Reads the members of a JSON object into C++ values, rejecting objects with keys that weren't read.
 *
 *     Json::ObjectReader reader(j, "media");
 *     reader.required(out.root, "root");
 *     reader.optional(out.hlsRoot, "hlsRoot");
 *     reader.finish();
 *
 * Values are converted with nlohmann::json::get(), so nested objects go through from_json().
 */
class ObjectReader final
{
public:
    ~ObjectReader();

    /**
     * @param path Where j is in the document, for error messages.
     * @throws FormatException if j is not an object.
     */
    explicit ObjectReader(const nlohmann::json &j, std::string path = {});

    /**
     * @throws FormatException if the key is missing or its value doesn't convert.
     */
    template <typename T>
    void required(T &dst, std::string_view key)
    {
        read(dst, key, true);
    }

    /**
     * Leave dst unchanged if the key is missing. A std::optional is reset by null.
     *
     * @throws FormatException if the value doesn't convert.
     */
    template <typename T>
    void optional(T &dst, std::string_view key)
    {
        read(dst, key, false);
    }

    /**
     * Read an enum spelled as one of the given strings. Leave dst unchanged if the key is missing.
     *
     * @throws FormatException if the value is not one of the names.
     */
    template <typename T> requires(std::is_enum_v<T>)
    void oneOf(T &dst, std::string_view key,
               std::initializer_list<std::pair<std::type_identity_t<T>, std::string_view>> names)
    {
        const nlohmann::json *value = find(key, false);
        if (!value) {
            return;
        }
        if (value->is_string()) {
            const std::string &string = value->get_ref<const std::string &>();
            for (const auto &[enumerator, name]: names) {
                if (name == string) {
                    dst = enumerator;
                    return;
                }
            }
        }

        std::string expected;
        for (const auto &entry: names) {
            expected += (expected.empty() ? "\"" : ", \"") + std::string(entry.second) + "\"";
        }
        throw FormatException(pathTo(key), "Expected one of " + expected + ", got " + value->dump() + ".");
    }

    /**
     * @throws FormatException if the object has a key that none of the read methods asked for.
     */
    void finish() const;

private:
    template <typename T> struct IsOptional final : std::false_type {};
    template <typename T> struct IsOptional<std::optional<T>> final : std::true_type {};

    template <typename T>
    void read(T &dst, std::string_view key, bool isRequired)
    {
        const nlohmann::json *value = find(key, isRequired);
        if (!value) {
            return;
        }
        try {
            if constexpr (IsOptional<T>::value) {
                if (value->is_null()) {
                    dst.reset();
                }
                else {
                    dst = value->get<typename T::value_type>();
                }
            }
            else {
                dst = value->get<T>();
            }
        }
        catch (const nlohmann::json::type_error &e) {
            throw FormatException(pathTo(key), std::string("Wrong type: ") + e.what());
        }
        catch (const nlohmann::json::out_of_range &e) {
            throw FormatException(pathTo(key), std::string("Out of range: ") + e.what());
        }
    }

    /**
     * Look up a key, and remember that it was asked for.
     *
     * @return nullptr if the key is missing and not required.
     */
    const nlohmann::json *find(std::string_view key, bool isRequired);

    std::string pathTo(std::string_view key) const;

    const nlohmann::json &j;
    const std::string path;
    std::set<std::string, std::less<>> readKeys;
};

/**
 * Parse a JSON string. Out of line, so only one translation unit instantiates the parser.
 *
 * @throws nlohmann::json::parse_error on malformed input.
 */
nlohmann::json parse(std::string_view jsonString, bool allowComments = false);

/**
 * @param indent As with nlohmann::json::dump: -1 is maximally compact.
 */
std::string dump(const nlohmann::json &json, int indent = -1);

} // namespace Json

/// @}
