#pragma once

#include "enums/ResourceKind.hpp"
#include "Timestamp.hpp"
#include <string>

namespace hospitality::domain {

/**
 * @brief Бронируемый ресурс объекта размещения (номер или столик)
 *
 * После создания меняется только флаг active (мягкая деактивация).
 */
struct BookableResource {
    std::string id;             ///< UUID ресурса
    std::string propertyId;     ///< Объект, которому принадлежит ресурс
    ResourceKind kind = ResourceKind::ROOM;
    std::string name;           ///< "Room 101", "Table 7"
    int capacity = 1;           ///< Вместимость (гостей)
    bool active = true;
    Timestamp createdAt;

    BookableResource() = default;

    BookableResource(
        const std::string& id,
        const std::string& propertyId,
        ResourceKind kind,
        const std::string& name,
        int capacity
    ) : id(id), propertyId(propertyId), kind(kind), name(name),
        capacity(capacity), active(true), createdAt(Timestamp::now()) {}

    bool belongsTo(const std::string& property) const {
        return propertyId == property;
    }
};

} // namespace hospitality::domain
