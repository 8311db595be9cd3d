/// @file main.cpp
/// @brief sedit_scene_tool: print the hierarchy of a scene file.
///
/// Usage: sedit_scene_tool <scene.yaml> [config.yaml]

#include "sedit/editor/editor_context.hpp"
#include "sedit/scene/components.hpp"
#include "sedit/scene/transform_system.hpp"
#include "sedit/version.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* argv0) {
    std::cerr << "sedit_scene_tool " << sedit::Version::string << "\n"
              << "Usage: " << argv0 << " <scene.yaml> [config.yaml]\n";
}

std::string componentMarkers(const sedit::ecs::Registry& registry, sedit::ecs::Entity e) {
    using namespace sedit::scene;
    std::string markers;
    auto add = [&markers](bool present, const char* label) {
        if (present) {
            markers += markers.empty() ? "" : ",";
            markers += label;
        }
    };
    add(registry.HasComponent<Transform>(e), "T");
    add(registry.HasComponent<Renderer>(e), "R");
    add(registry.HasComponent<Camera>(e), "C");
    add(registry.HasComponent<Light>(e), "L");
    add(registry.HasComponent<Script>(e), "S");
    return markers;
}

void printTree(const sedit::ecs::Registry& registry, const sedit::scene::TransformSystem& transforms,
               sedit::ecs::Entity entity, int depth) {
    const auto position = transforms.WorldPosition(entity);
    std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ') << "- "
              << registry.GetName(entity) << " #" << entity.id()
              << " [" << componentMarkers(registry, entity) << "]";
    if (!registry.IsActive(entity)) {
        std::cout << " (inactive)";
    }
    if (registry.HasComponent<sedit::scene::Transform>(entity)) {
        std::cout << std::fixed << std::setprecision(2) << " @(" << position.x << ", "
                  << position.y << ", " << position.z << ")";
    }
    std::cout << '\n';

    for (auto child : registry.GetChildren(entity)) {
        printTree(registry, transforms, child, depth + 1);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    sedit::editor::EditorContext context;
    auto init = argc == 3 ? context.Init(std::filesystem::path(argv[2])) : context.Init();
    if (!init) {
        std::cerr << "error: " << init.error().describe() << '\n';
        return EXIT_FAILURE;
    }

    auto loaded = context.LoadScene(argv[1]);
    if (!loaded) {
        std::cerr << "error: " << loaded.error().describe() << '\n';
        return EXIT_FAILURE;
    }

    context.UpdateTransforms();

    const auto& registry = context.GetRegistry();
    const auto& transforms = context.GetTransforms();
    std::cout << argv[1] << ": " << registry.Count() << " entities\n";
    for (auto top : registry.GetChildren(sedit::ecs::kNullEntity)) {
        printTree(registry, transforms, top, 0);
    }

    context.Shutdown();
    return EXIT_SUCCESS;
}
