#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace monolith::storage {

/// Строка хранилища: JSON-документ агрегата
using Row = nlohmann::json;

/**
 * @brief Отложенная запись в таблицу
 */
struct Mutation {
    enum class Kind {
        INSERT_OR_UPDATE,
        DELETE
    };

    Kind kind = Kind::INSERT_OR_UPDATE;
    std::string table;
    std::string key;
    Row row;            ///< Пусто для DELETE

    static Mutation insertOrUpdate(std::string table, std::string key, Row row) {
        return Mutation{Kind::INSERT_OR_UPDATE, std::move(table), std::move(key), std::move(row)};
    }

    static Mutation remove(std::string table, std::string key) {
        return Mutation{Kind::DELETE, std::move(table), std::move(key), Row()};
    }
};

} // namespace monolith::storage
