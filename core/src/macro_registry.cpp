// Lucent - Macro Registry

#include <lucent/macro_registry.h>
#include <algorithm>
#include <cmath>

namespace lucent {

const std::vector<MacroDecl>& MacroRegistry::builtins() {
    static const std::vector<MacroDecl> decls = {
        {"intensity",        0.7f, 0.0f,  1.0f},
        {"bloom",            0.8f, 0.0f,  2.0f},
        {"glitch",           0.0f, 0.0f,  1.0f},
        {"speed",            1.0f, 0.0f,  4.0f},
        {"raymarchSteps",  512.0f, 1.0f, 1024.0f},
        {"particleMillions", 0.5f, 0.01f, 5.0f},
        {"fluidIters",      35.0f, 1.0f,  128.0f},
    };
    return decls;
}

MacroRegistry::MacroRegistry() {
    for (const auto& decl : builtins()) {
        declare(decl);
    }
}

void MacroRegistry::declare(const MacroDecl& decl) {
    m_decls[decl.name] = decl;
    m_values[decl.name] = std::clamp(decl.defaultValue, decl.minValue, decl.maxValue);
}

bool MacroRegistry::set(const std::string& name, float value) {
    if (!std::isfinite(value)) {
        return false;
    }
    auto it = m_decls.find(name);
    if (it != m_decls.end()) {
        value = std::clamp(value, it->second.minValue, it->second.maxValue);
    }
    m_values[name] = value;
    return true;
}

float MacroRegistry::get(const std::string& name, float fallback) const {
    auto it = m_values.find(name);
    return it != m_values.end() ? it->second : fallback;
}

bool MacroRegistry::has(const std::string& name) const {
    return m_values.count(name) > 0;
}

const MacroDecl* MacroRegistry::declaration(const std::string& name) const {
    auto it = m_decls.find(name);
    return it != m_decls.end() ? &it->second : nullptr;
}

} // namespace lucent
