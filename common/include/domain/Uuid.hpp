#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <regex>
#include <string>

namespace monolith::domain {

/**
 * @brief Сгенерировать UUID v4 в канонической форме
 */
inline std::string generateUuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

/**
 * @brief Проверить, что строка является UUID в канонической форме
 * (8-4-4-4-12 шестнадцатеричных символов)
 */
inline bool isUuid(const std::string& value) {
    static const std::regex pattern(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
    return std::regex_match(value, pattern);
}

} // namespace monolith::domain
