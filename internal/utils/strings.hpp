#ifndef UTILS_STRINGS_HPP
#define UTILS_STRINGS_HPP

#include <locale>
#include <string>

#include <boost/locale.hpp>

// resource names arrive as utf-8 json strings
inline const std::locale &Utf8Locale() {
    static const std::locale locale = boost::locale::generator()("en_US.UTF-8");
    return locale;
}

// right-pads with spaces to exactly length user-perceived characters; longer strings are cut
// on a character boundary
inline std::string Padded(const std::string &value, const std::size_t length) {
    namespace lb = boost::locale::boundary;
    const lb::ssegment_index characters(lb::character, value.begin(), value.end(), Utf8Locale());
    std::string out;
    std::size_t count = 0;
    for (const auto &character : characters) {
        if (count == length) {
            break;
        }
        out += character.str();
        count++;
    }
    out.append(length - count, ' ');
    return out;
}

// full unicode lowercase mapping, so "ENTRÉE" and "entrée" compare equal
inline std::string ToLower(const std::string &value) {
    return boost::locale::to_lower(value, Utf8Locale());
}

inline const char *BoolString(const bool value) {
    return value ? "true" : "false";
}

#endif //UTILS_STRINGS_HPP
