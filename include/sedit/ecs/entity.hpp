#pragma once

/// @file entity.hpp
/// @brief Entity handle for the editor registry.
///
/// An entity is a 32-bit id allocated monotonically starting at 1.  Ids are
/// never reused within one registry, so a stale handle held by the UI or a
/// command simply stops resolving once the entity is destroyed.  Id 0 is
/// the null entity and doubles as the permanent scene root.

#include <cstdint>
#include <functional>

namespace sedit::ecs {

struct Entity {
    uint32_t raw = 0;

    constexpr Entity() = default;
    constexpr explicit Entity(uint32_t id) : raw(id) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw; }

    /// False only for the null entity / scene root.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != 0; }

    [[nodiscard]] static constexpr Entity null() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

/// The null entity.  Also the implicit root of the scene hierarchy.
inline constexpr Entity kNullEntity{};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace sedit::ecs

template <>
struct std::hash<sedit::ecs::Entity> {
    std::size_t operator()(const sedit::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
