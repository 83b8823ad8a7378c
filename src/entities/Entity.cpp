/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Entity.hpp"
#include "core/Logger.hpp"
#include <array>
#include <string>

namespace {
constexpr std::array<const char*, 8> LAYER_NAMES = {
    "default", "background", "targets", "missiles",
    "countermeasures", "defences", "effects", "ui"
};
}

const char* toString(EntityLayer layer) {
  auto index = static_cast<size_t>(layer);
  return index < LAYER_NAMES.size() ? LAYER_NAMES[index] : "default";
}

EntityLayer layerFromString(std::string_view name) {
  for (size_t i = 0; i < LAYER_NAMES.size(); ++i) {
    if (name == LAYER_NAMES[i]) {
      return static_cast<EntityLayer>(i);
    }
  }
  ENTITY_INFO("Unknown layer '" + std::string(name) + "', using default");
  return EntityLayer::Default;
}

Entity::Entity(EntityID id, float x, float y, float width, float height, Behavior behavior)
    : m_id(id), m_x(x), m_y(y), m_width(width), m_height(height),
      m_behavior(std::move(behavior)) {
  updateBounds();
  attachBehavior();
}

void Entity::attachBehavior() {
  std::visit([this](auto& behavior) {
    using T = std::decay_t<decltype(behavior)>;
    if constexpr (!std::is_same_v<T, std::monostate>) {
      behavior.attach(this);
    }
  }, m_behavior);
}

void Entity::setBehavior(Behavior behavior) {
  m_behavior = std::move(behavior);
  attachBehavior();
}

void Entity::update(float deltaTime) {
  if (!m_active) return;

  m_x += m_velocity.getX() * deltaTime;
  m_y += m_velocity.getY() * deltaTime;
  m_age += deltaTime;
  updateBounds();

  std::visit([deltaTime](auto& behavior) {
    using T = std::decay_t<decltype(behavior)>;
    if constexpr (!std::is_same_v<T, std::monostate>) {
      behavior.onUpdate(deltaTime);
    }
  }, m_behavior);
}

void Entity::render(CloudDefenders::DrawContext& ctx) const {
  if (!m_visible) return;

  std::visit([this, &ctx](const auto& behavior) {
    using T = std::decay_t<decltype(behavior)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      renderDefaultBody(ctx);
    } else {
      behavior.renderBody(ctx);
      behavior.onRender(ctx);
    }
  }, m_behavior);
}

void Entity::renderDefaultBody(CloudDefenders::DrawContext& ctx) const {
  ctx.fillRect(m_bounds.left, m_bounds.top, m_bounds.width(), m_bounds.height(), m_color);
  ctx.strokeRect(m_bounds.left, m_bounds.top, m_bounds.width(), m_bounds.height(),
                 CloudDefenders::Color(0, 0, 0));
}

bool Entity::isCollidingWith(const Entity& other) const {
  if (this == &other || !m_collidable || !other.m_collidable) {
    return false;
  }
  return m_bounds.intersects(other.m_bounds);
}

float Entity::distanceTo(const Entity& other) const {
  return Vector2D::distance(m_bounds.center(), other.m_bounds.center());
}

void Entity::destroy() {
  if (m_markedForDestruction) return;

  m_markedForDestruction = true;
  m_active = false;

  std::visit([](auto& behavior) {
    using T = std::decay_t<decltype(behavior)>;
    if constexpr (!std::is_same_v<T, std::monostate>) {
      behavior.onDestroy();
    }
  }, m_behavior);

  if (m_onDestroy) {
    m_onDestroy(*this);
  }
}

void Entity::onCollision(Entity& other) {
  std::visit([&other](auto& behavior) {
    using T = std::decay_t<decltype(behavior)>;
    if constexpr (!std::is_same_v<T, std::monostate>) {
      behavior.onCollision(other);
    }
  }, m_behavior);
}

void Entity::setPosition(float x, float y) {
  m_x = x;
  m_y = y;
  updateBounds();
}

void Entity::setSize(float width, float height) {
  m_width = width;
  m_height = height;
  updateBounds();
}

void Entity::setScale(float scale) {
  m_scale = scale;
  updateBounds();
}

void Entity::updateBounds() {
  m_bounds = CloudDefenders::AABB::fromRect(m_x, m_y, m_width, m_height, m_scale);
}
