#include <lucent/control_bridge.h>
#include <lucent/palette_requester.h>
#include <lucent/scene_manager.h>
#include <ixwebsocket/IXWebSocketServer.h>
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace lucent {

class ControlBridge::Impl {
public:
    ix::WebSocketServer server;
    std::mutex mutex;
    int port = DEFAULT_PORT;

    Impl(int p) : server(p, "0.0.0.0"), port(p) {}
};

ControlBridge::ControlBridge() : m_impl(std::make_unique<Impl>(DEFAULT_PORT)) {}

ControlBridge::~ControlBridge() {
    stop();
}

bool ControlBridge::start(int port) {
    if (m_running) return true;

    m_port = port;
    m_impl = std::make_unique<Impl>(port);

    m_impl->server.setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> state,
               ix::WebSocket& /*ws*/,
               const ix::WebSocketMessagePtr& msg) {

            if (msg->type == ix::WebSocketMessageType::Open) {
                std::cout << "[ControlBridge] Client connected from " << state->getRemoteIp() << "\n";
            }
            else if (msg->type == ix::WebSocketMessageType::Close) {
                std::cout << "[ControlBridge] Client disconnected\n";
            }
            else if (msg->type == ix::WebSocketMessageType::Message) {
                handleMessage(msg->str);
            }
            else if (msg->type == ix::WebSocketMessageType::Error) {
                std::cerr << "[ControlBridge] Error: " << msg->errorInfo.reason << "\n";
            }
        }
    );

    auto res = m_impl->server.listen();
    if (!res.first) {
        std::cerr << "[ControlBridge] Failed to start on port " << port << ": " << res.second << "\n";
        return false;
    }

    m_impl->server.start();
    m_running = true;
    std::cout << "[ControlBridge] Listening on port " << port << "\n";
    return true;
}

void ControlBridge::stop() {
    if (!m_running) return;

    m_impl->server.stop();
    m_running = false;
    std::cout << "[ControlBridge] Stopped\n";
}

size_t ControlBridge::clientCount() const {
    if (!m_impl) return 0;
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->server.getClients().size();
}

// -----------------------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------------------

static bool parseColor(const json& value, Color& out) {
    return value.is_string() && Color::parseHex(value.get<std::string>(), out);
}

static bool parsePalette(const json& j, Palette& out) {
    std::vector<Color> colors;
    if (j.contains("colors")) {
        if (!j["colors"].is_array()) return false;
        for (const auto& entry : j["colors"]) {
            Color c;
            if (!parseColor(entry, c)) return false;
            colors.push_back(c);
        }
    }

    Color dominant, secondary;
    bool hasDominant = j.contains("dominant");
    bool hasSecondary = j.contains("secondary");
    if (hasDominant && !parseColor(j["dominant"], dominant)) return false;
    if (hasSecondary && !parseColor(j["secondary"], secondary)) return false;

    if (colors.empty()) {
        if (!hasDominant) return false;
        colors.push_back(dominant);
        if (hasSecondary) colors.push_back(secondary);
    }

    out = Palette::fromColors(colors);
    if (hasDominant) out.dominant = dominant;
    if (hasSecondary) out.secondary = secondary;
    return true;
}

std::optional<ControlCommand> ControlBridge::parse(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[ControlBridge] Ignoring non-object message\n";
            return std::nullopt;
        }
        std::string type = j.value("type", "");
        ControlCommand cmd;

        if (type == "set_macro") {
            if (!j.contains("key") || !j["key"].is_string() ||
                !j.contains("value") || !j["value"].is_number()) {
                std::cerr << "[ControlBridge] set_macro needs string key and numeric value\n";
                return std::nullopt;
            }
            cmd.type = ControlCommandType::SetMacro;
            cmd.key = j["key"].get<std::string>();
            cmd.value = j["value"].get<float>();
        }
        else if (type == "phrase") {
            if (!j.contains("bar") || !j["bar"].is_number_integer()) {
                std::cerr << "[ControlBridge] phrase needs integer bar\n";
                return std::nullopt;
            }
            cmd.type = ControlCommandType::Phrase;
            cmd.bar = j["bar"].get<int>();
            cmd.tempo = j.value("tempo", 120.0);
        }
        else if (type == "palette") {
            cmd.type = ControlCommandType::Palette;
            if (!parsePalette(j, cmd.palette)) {
                std::cerr << "[ControlBridge] palette needs hex colours\n";
                return std::nullopt;
            }
        }
        else if (type == "palette_url") {
            cmd.type = ControlCommandType::PaletteUrl;
            cmd.url = j.value("url", "");
            if (cmd.url.empty()) {
                std::cerr << "[ControlBridge] palette_url needs url\n";
                return std::nullopt;
            }
        }
        else if (type == "crossfade") {
            auto kind = parseSceneKind(j.value("scene", ""));
            if (!kind) {
                std::cerr << "[ControlBridge] Unknown scene: " << j.value("scene", "") << "\n";
                return std::nullopt;
            }
            cmd.type = ControlCommandType::Crossfade;
            cmd.scene = *kind;
            cmd.seconds = j.value("seconds", 2.0);
        }
        else if (type == "quality") {
            cmd.type = ControlCommandType::Quality;
            cmd.quality = qualityPatchFromJson(j);
        }
        else if (type == "post") {
            cmd.type = ControlCommandType::Post;
            cmd.post = postPatchFromJson(j);
        }
        else if (type == "accessibility") {
            cmd.type = ControlCommandType::Accessibility;
            cmd.accessibility = accessibilityPatchFromJson(j);
        }
        else {
            std::cerr << "[ControlBridge] Unknown message type: " << type << "\n";
            return std::nullopt;
        }
        return cmd;
    } catch (const json::exception& e) {
        std::cerr << "[ControlBridge] JSON parse error: " << e.what() << "\n";
        return std::nullopt;
    }
}

bool ControlBridge::handleMessage(const std::string& text) {
    auto cmd = parse(text);
    if (!cmd) return false;

    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.push_back(std::move(*cmd));
    return true;
}

size_t ControlBridge::queued() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}

// -----------------------------------------------------------------------------
// Applying
// -----------------------------------------------------------------------------

size_t ControlBridge::poll(SceneManager& manager, PaletteRequester& palettes) {
    std::deque<ControlCommand> batch;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        batch.swap(m_queue);
    }

    size_t applied = 0;
    for (const auto& cmd : batch) {
        if (apply(cmd, manager, palettes)) {
            applied++;
        }
    }
    return applied;
}

bool ControlBridge::apply(const ControlCommand& cmd, SceneManager& manager, PaletteRequester& palettes) {
    switch (cmd.type) {
        case ControlCommandType::SetMacro:
            return manager.setMacro(cmd.key, cmd.value);
        case ControlCommandType::Phrase:
            manager.onPhrase(cmd.bar, cmd.tempo);
            return true;
        case ControlCommandType::Palette:
            manager.setPalette(cmd.palette);
            return true;
        case ControlCommandType::PaletteUrl:
            palettes.request(cmd.url);
            return true;
        case ControlCommandType::Crossfade:
            try {
                manager.crossfadeTo(cmd.scene, cmd.seconds);
                return true;
            } catch (const std::exception& e) {
                std::cerr << "[ControlBridge] Crossfade to " << sceneKindName(cmd.scene)
                          << " failed: " << e.what() << "\n";
                return false;
            }
        case ControlCommandType::Quality:
            manager.setQuality(cmd.quality);
            return true;
        case ControlCommandType::Post:
            manager.setPost(cmd.post);
            return true;
        case ControlCommandType::Accessibility:
            manager.setAccessibility(cmd.accessibility);
            return true;
    }
    return false;
}

void ControlBridge::broadcastFps(double fps) {
    if (!m_running || !m_impl) return;

    json j;
    j["type"] = "fps";
    j["fps"] = fps;

    std::string msg = j.dump();

    // Broadcast to all clients
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    for (auto& client : m_impl->server.getClients()) {
        client->send(msg);
    }
}

} // namespace lucent
