#pragma once

/**
 * @file control_bridge.h
 * @brief WebSocket server that lets external controllers drive the engine
 *
 * Accepts JSON messages such as
 * @code
 * {"type": "set_macro", "key": "intensity", "value": 0.9}
 * {"type": "phrase", "bar": 16, "tempo": 124}
 * {"type": "palette", "dominant": "#ff0000", "secondary": "#00ff00", "colors": [...]}
 * {"type": "palette_url", "url": "https://.../cover.jpg"}
 * {"type": "crossfade", "scene": "Tunnel", "seconds": 2}
 * {"type": "quality", "scale": 0.75}
 * {"type": "post", "bloom": 1.2}
 * {"type": "accessibility", "epilepsySafe": true, "intensityLimit": 0.5}
 * @endcode
 * Messages are parsed on the network thread and queued; poll() applies them
 * on the main thread between frames.
 */

#include <lucent/palette.h>
#include <lucent/scene.h>
#include <lucent/settings.h>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lucent {

class SceneManager;
class PaletteRequester;

enum class ControlCommandType {
    SetMacro,
    Phrase,
    Palette,
    PaletteUrl,
    Crossfade,
    Quality,
    Post,
    Accessibility
};

/// A parsed control message; only the fields of its type are meaningful
struct ControlCommand {
    ControlCommandType type = ControlCommandType::SetMacro;

    std::string key;                ///< SetMacro
    float value = 0.0f;             ///< SetMacro
    int bar = 0;                    ///< Phrase
    double tempo = 120.0;           ///< Phrase
    Palette palette;                ///< Palette
    std::string url;                ///< PaletteUrl
    SceneKind scene = SceneKind::Particles;  ///< Crossfade
    double seconds = 2.0;           ///< Crossfade
    QualityPatch quality;           ///< Quality
    PostPatch post;                 ///< Post
    AccessibilityPatch accessibility;  ///< Accessibility
};

class ControlBridge {
public:
    static constexpr int DEFAULT_PORT = 9877;

    ControlBridge();
    ~ControlBridge();

    ControlBridge(const ControlBridge&) = delete;
    ControlBridge& operator=(const ControlBridge&) = delete;

    /// Start the WebSocket server on the specified port
    /// @return false if the port could not be bound
    bool start(int port = DEFAULT_PORT);

    /// Stop the WebSocket server
    void stop();

    bool isRunning() const { return m_running; }

    /// Get number of connected clients
    size_t clientCount() const;

    /**
     * @brief Parse one message
     * @return The command, or std::nullopt (logged) for malformed JSON,
     *         unknown types and invalid fields
     */
    static std::optional<ControlCommand> parse(const std::string& text);

    /// @brief Parse and queue a message (called from the network thread)
    /// @return true if the message was queued
    bool handleMessage(const std::string& text);

    /// @brief Apply all queued commands; returns how many were applied
    size_t poll(SceneManager& manager, PaletteRequester& palettes);

    /// @brief Apply one command on the calling thread
    static bool apply(const ControlCommand& command, SceneManager& manager, PaletteRequester& palettes);

    size_t queued() const;

    /// Send {"type":"fps","fps":x} to all connected clients
    void broadcastFps(double fps);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
    bool m_running = false;
    int m_port = DEFAULT_PORT;

    mutable std::mutex m_queueMutex;
    std::deque<ControlCommand> m_queue;
};

} // namespace lucent
