// Lucent - Scene kinds

#include <lucent/scene.h>
#include <algorithm>
#include <cctype>

namespace lucent {

std::optional<SceneKind> parseSceneKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (SceneKind kind : ALL_SCENE_KINDS) {
        std::string candidate = sceneKindName(kind);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lower) {
            return kind;
        }
    }
    return std::nullopt;
}

SceneKind nextSceneKind(SceneKind kind) {
    auto it = std::find(ALL_SCENE_KINDS.begin(), ALL_SCENE_KINDS.end(), kind);
    if (it == ALL_SCENE_KINDS.end() || ++it == ALL_SCENE_KINDS.end()) {
        return ALL_SCENE_KINDS.front();
    }
    return *it;
}

} // namespace lucent
