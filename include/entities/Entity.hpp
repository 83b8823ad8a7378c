/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "collisions/AABB.hpp"
#include "entities/Defense.hpp"
#include "entities/DefenseProjectile.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/ExplosiveBomb.hpp"
#include "entities/Missile.hpp"
#include "entities/Target.hpp"
#include "utils/DrawContext.hpp"
#include "utils/Vector2D.hpp"
#include <functional>
#include <memory>
#include <type_traits>
#include <variant>

/**
 * @brief A single simulated object: a missile, a defense, a target, ...
 *
 * Entity is one concrete class. What kind of object it is comes from the
 * behavior it carries, a closed std::variant injected at construction.
 * The entity owns the shared kinematic state (position, velocity, bounds,
 * lifecycle flags); the behavior owns everything type specific and is
 * notified through onUpdate / renderBody / onRender / onCollision / onDestroy.
 *
 * Entities are always owned through EntityPtr (std::shared_ptr) so that
 * weak back references (projectile -> source defense) stay valid to check.
 */
class Entity : public std::enable_shared_from_this<Entity> {
 public:
  using Behavior = std::variant<std::monostate, Missile, Defense, DefenseProjectile,
                                Target, ExplosiveBomb>;
  using DestroyListener = std::function<void(Entity&)>;

  static constexpr float DEFAULT_SIZE = 32.0f;

  /**
   * @brief Construct an entity and attach its behavior.
   *
   * @param id Identifier handed out by the owning EntityManager
   * @param x Top-left position
   * @param y Top-left position
   * @param width Unscaled width
   * @param height Unscaled height
   * @param behavior Type specific behavior, none by default
   */
  Entity(EntityID id, float x, float y, float width = DEFAULT_SIZE,
         float height = DEFAULT_SIZE, Behavior behavior = std::monostate{});

  Entity(const Entity&) = delete;
  Entity& operator=(const Entity&) = delete;

  /**
   * @brief Advance the entity by deltaTime seconds.
   *
   * Inactive entities are left untouched. Otherwise position integrates
   * velocity, age grows, bounds are recomputed and the behavior's onUpdate
   * runs last so it sees the new position.
   */
  void update(float deltaTime);

  /**
   * @brief Draw the entity if visible. Does not change entity state.
   *
   * Behaviors draw their own body; a plain entity gets a filled rectangle
   * with a black outline. The behavior's overlay (trails, icons, bars) follows.
   */
  void render(CloudDefenders::DrawContext& ctx) const;

  /**
   * @brief Inclusive AABB overlap test.
   *
   * False against itself and when either side is not collidable.
   * Symmetric by construction.
   */
  bool isCollidingWith(const Entity& other) const;

  // Euclidean distance between bound centers
  float distanceTo(const Entity& other) const;

  /**
   * @brief Deactivate and mark for removal on the next manager sweep.
   *
   * The behavior's onDestroy and the destroy listener run on the first call
   * only; later calls do nothing.
   */
  void destroy();

  // Forwarded to the behavior by the collision pass
  void onCollision(Entity& other);

  /**
   * @brief Typed access to the behavior.
   * @return The behavior when it holds a T, nullptr otherwise
   */
  template <typename T>
  T* as() { return std::get_if<T>(&m_behavior); }

  template <typename T>
  const T* as() const { return std::get_if<T>(&m_behavior); }

  bool hasBehavior() const { return !std::holds_alternative<std::monostate>(m_behavior); }

  // Replaces the behavior and attaches the new one to this entity
  void setBehavior(Behavior behavior);

  EntityPtr shared_this() { return shared_from_this(); }
  EntityWeakPtr weak_this() { return shared_from_this(); }

  // Accessor methods
  EntityID getID() const { return m_id; }
  float getX() const { return m_x; }
  float getY() const { return m_y; }
  Vector2D getPosition() const { return Vector2D(m_x, m_y); }
  float getWidth() const { return m_width; }
  float getHeight() const { return m_height; }
  float getScale() const { return m_scale; }
  Vector2D getVelocity() const { return m_velocity; }
  float getSpeed() const { return m_velocity.length(); }
  const CloudDefenders::AABB& getBounds() const { return m_bounds; }
  Vector2D getCenter() const { return m_bounds.center(); }
  float getAge() const { return m_age; }
  EntityLayer getLayer() const { return m_layer; }
  const CloudDefenders::Color& getColor() const { return m_color; }

  bool isActive() const { return m_active; }
  bool isVisible() const { return m_visible; }
  bool isCollidable() const { return m_collidable; }
  bool isMarkedForDestruction() const { return m_markedForDestruction; }

  // Setter methods; anything that moves or resizes the entity refreshes bounds
  void setPosition(float x, float y);
  void setPosition(const Vector2D& position) { setPosition(position.getX(), position.getY()); }
  void setSize(float width, float height);
  void setScale(float scale);
  void setVelocity(const Vector2D& velocity) { m_velocity = velocity; }
  void setVelocity(float vx, float vy) { m_velocity = Vector2D(vx, vy); }
  void setLayer(EntityLayer layer) { m_layer = layer; }
  void setColor(const CloudDefenders::Color& color) { m_color = color; }
  void setActive(bool active) { m_active = active; }
  void setVisible(bool visible) { m_visible = visible; }
  void setCollidable(bool collidable) { m_collidable = collidable; }

  void setOnDestroy(DestroyListener listener) { m_onDestroy = std::move(listener); }

 private:
  void updateBounds();
  void renderDefaultBody(CloudDefenders::DrawContext& ctx) const;
  void attachBehavior();

  EntityID m_id;
  float m_x;
  float m_y;
  float m_width;
  float m_height;
  float m_scale{1.0f};
  Vector2D m_velocity;
  CloudDefenders::AABB m_bounds;
  float m_age{0.0f};

  EntityLayer m_layer{EntityLayer::Default};
  CloudDefenders::Color m_color{255, 255, 255};

  bool m_active{true};
  bool m_visible{true};
  bool m_collidable{true};
  bool m_markedForDestruction{false};

  Behavior m_behavior;
  DestroyListener m_onDestroy;
};

#endif // ENTITY_HPP
