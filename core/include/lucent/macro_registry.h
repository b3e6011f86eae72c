#pragma once

/**
 * @file macro_registry.h
 * @brief Named float parameters read by scenes every frame
 *
 * Declared macros carry a default and a valid range; writes are clamped to
 * that range. Undeclared names are stored verbatim so controllers can add
 * their own knobs without registering them first.
 */

#include <map>
#include <string>
#include <vector>

namespace lucent {

/// @brief Declaration of a known macro
struct MacroDecl {
    std::string name;
    float defaultValue = 0.0f;
    float minValue = 0.0f;
    float maxValue = 1.0f;
};

class MacroRegistry {
public:
    /// @brief Registry holding the built-in declarations and their defaults
    MacroRegistry();

    /**
     * @brief Declare (or redeclare) a macro and reset it to its default
     */
    void declare(const MacroDecl& decl);

    /**
     * @brief Write a value
     *
     * Declared names are clamped to their range. Non-finite values are
     * rejected and leave the stored value unchanged.
     *
     * @return false if the value was rejected
     */
    bool set(const std::string& name, float value);

    /// @brief Stored value, or @p fallback if the name was never written
    float get(const std::string& name, float fallback) const;

    bool has(const std::string& name) const;

    /// @brief Declaration for @p name, or nullptr if undeclared
    const MacroDecl* declaration(const std::string& name) const;

    /// @brief All stored values, for persistence and seeding scenes
    const std::map<std::string, float>& values() const { return m_values; }

    /// @brief Built-in declarations (intensity, bloom, glitch, speed, ...)
    static const std::vector<MacroDecl>& builtins();

private:
    std::map<std::string, MacroDecl> m_decls;
    std::map<std::string, float> m_values;
};

} // namespace lucent
