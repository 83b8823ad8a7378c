/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_TYPES_HPP
#define ENTITY_TYPES_HPP

#include "utils/UniqueID.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string_view>

// Forward declarations
class Entity;

// Smart pointer type aliases
using EntityPtr = std::shared_ptr<Entity>;
using EntityWeakPtr = std::weak_ptr<Entity>;

// Type alias for entity ID
using EntityID = CloudDefenders::UniqueIDGenerator::IDType;

/**
 * @brief Grouping and collision tag of an entity.
 *
 * The same tag decides which render bucket an entity lives in and how
 * behaviors react to a collision with it.
 */
enum class EntityLayer : uint8_t {
    Default,
    Background,
    Targets,
    Missiles,
    Countermeasures,
    Defences,
    Effects,
    UI
};

// Back-to-front draw order; Default is drawn last
inline constexpr std::array<EntityLayer, 8> RENDER_LAYER_ORDER = {
    EntityLayer::Background, EntityLayer::Targets,  EntityLayer::Missiles,
    EntityLayer::Countermeasures, EntityLayer::Defences, EntityLayer::Effects,
    EntityLayer::UI, EntityLayer::Default
};

const char* toString(EntityLayer layer);
EntityLayer layerFromString(std::string_view name);

#endif // ENTITY_TYPES_HPP
