#include <lucent/midi_macro_input.h>
#include <lucent/scene_manager.h>
#include <RtMidi.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace lucent {

// -----------------------------------------------------------------------------
// Implementation (pimpl)
// -----------------------------------------------------------------------------

class MidiMacroInput::Impl {
public:
    Impl() {
        try {
            m_midiIn = std::make_unique<RtMidiIn>();
        } catch (RtMidiError& error) {
            std::cerr << "[MidiMacroInput] " << error.getMessage() << std::endl;
        }
    }

    ~Impl() {
        if (m_midiIn && m_midiIn->isPortOpen()) {
            m_midiIn->closePort();
        }
    }

    std::unique_ptr<RtMidiIn> m_midiIn;
    std::string m_portName;
};

// -----------------------------------------------------------------------------
// MidiMacroInput
// -----------------------------------------------------------------------------

MidiMacroInput::MidiMacroInput() : m_impl(std::make_unique<Impl>()) {}

MidiMacroInput::~MidiMacroInput() = default;

std::vector<std::string> MidiMacroInput::listPorts() {
    std::vector<std::string> ports;
    try {
        RtMidiIn midiIn;
        unsigned int count = midiIn.getPortCount();
        for (unsigned int i = 0; i < count; ++i) {
            ports.push_back(midiIn.getPortName(i));
        }
    } catch (RtMidiError& error) {
        std::cerr << "[MidiMacroInput] listPorts: " << error.getMessage() << std::endl;
    }
    return ports;
}

bool MidiMacroInput::openPort(unsigned int portIndex) {
    if (!m_impl->m_midiIn) return false;

    try {
        if (m_impl->m_midiIn->isPortOpen()) {
            m_impl->m_midiIn->closePort();
        }

        if (portIndex >= m_impl->m_midiIn->getPortCount()) {
            std::cerr << "[MidiMacroInput] No port " << portIndex << std::endl;
            return false;
        }
        m_impl->m_midiIn->openPort(portIndex);
        m_impl->m_portName = m_impl->m_midiIn->getPortName(portIndex);
        // Ignore sysex, timing and active sensing
        m_impl->m_midiIn->ignoreTypes(true, true, true);
        std::cout << "[MidiMacroInput] Opened port " << m_impl->m_portName << std::endl;
        return true;
    } catch (RtMidiError& error) {
        std::cerr << "[MidiMacroInput] openPort: " << error.getMessage() << std::endl;
        return false;
    }
}

bool MidiMacroInput::openPortByName(const std::string& name) {
    if (!m_impl->m_midiIn) return false;

    try {
        unsigned int count = m_impl->m_midiIn->getPortCount();
        for (unsigned int i = 0; i < count; ++i) {
            if (portNameMatches(m_impl->m_midiIn->getPortName(i), name)) {
                return openPort(i);
            }
        }
        std::cerr << "[MidiMacroInput] No port matching '" << name << "' found" << std::endl;
    } catch (RtMidiError& error) {
        std::cerr << "[MidiMacroInput] openPortByName: " << error.getMessage() << std::endl;
    }
    return false;
}

void MidiMacroInput::closePort() {
    if (m_impl->m_midiIn && m_impl->m_midiIn->isPortOpen()) {
        m_impl->m_midiIn->closePort();
        m_impl->m_portName.clear();
    }
}

bool MidiMacroInput::isOpen() const {
    return m_impl->m_midiIn && m_impl->m_midiIn->isPortOpen();
}

std::string MidiMacroInput::portName() const {
    return m_impl->m_portName;
}

size_t MidiMacroInput::poll(SceneManager& manager) {
    if (!isOpen()) return 0;

    size_t written = 0;
    std::vector<unsigned char> message;
    try {
        while (true) {
            m_impl->m_midiIn->getMessage(&message);
            if (message.empty()) break;
            if (applyMessage(message, manager)) {
                written++;
            }
        }
    } catch (RtMidiError& error) {
        std::cerr << "[MidiMacroInput] poll: " << error.getMessage() << std::endl;
    }
    return written;
}

bool MidiMacroInput::portNameMatches(const std::string& portName, const std::string& query) {
    auto lower = [](std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    };
    return lower(portName).find(lower(query)) != std::string::npos;
}

std::optional<std::pair<std::string, float>> MidiMacroInput::mapControlChange(uint8_t controller, uint8_t value) {
    float v = std::min<uint8_t>(value, 127) / 127.0f;
    switch (controller) {
        case 1: return std::make_pair(std::string("intensity"), v);
        case 2: return std::make_pair(std::string("bloom"), v * 2.0f);
        case 3: return std::make_pair(std::string("glitch"), v);
        case 4: return std::make_pair(std::string("speed"), 0.1f + v * 1.9f);
        default: return std::nullopt;
    }
}

bool MidiMacroInput::applyMessage(const std::vector<unsigned char>& message, SceneManager& manager) {
    if (message.size() < 3) return false;

    uint8_t msgType = message[0] & 0xF0;
    if (msgType != 0xB0) return false;  // Control Change

    auto mapped = mapControlChange(message[1], message[2]);
    if (!mapped) return false;

    return manager.setMacro(mapped->first, mapped->second);
}

} // namespace lucent
