#pragma once

/**
 * @file midi_macro_input.h
 * @brief Maps MIDI control changes onto macros
 *
 * CC1 -> intensity, CC2 -> bloom (x2), CC3 -> glitch, CC4 -> speed
 * (0.1..2.0), on any channel. Messages are buffered by RtMidi and drained
 * on the main thread by poll().
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lucent {

class SceneManager;

class MidiMacroInput {
public:
    MidiMacroInput();
    ~MidiMacroInput();

    MidiMacroInput(const MidiMacroInput&) = delete;
    MidiMacroInput& operator=(const MidiMacroInput&) = delete;

    /// @brief Names of the available input ports (empty if MIDI is unavailable)
    static std::vector<std::string> listPorts();

    /// @return false if the port does not exist or could not be opened
    bool openPort(unsigned int portIndex);

    /// @brief Open the first port whose name contains @p name (case-insensitive)
    bool openPortByName(const std::string& name);

    void closePort();
    bool isOpen() const;
    std::string portName() const;

    /// @brief Drain pending messages into @p manager; returns macros written
    size_t poll(SceneManager& manager);

    /// @brief Case-insensitive substring match used by openPortByName()
    static bool portNameMatches(const std::string& portName, const std::string& query);

    /**
     * @brief Macro name and value for a control change
     * @return std::nullopt for unmapped controllers
     */
    static std::optional<std::pair<std::string, float>> mapControlChange(uint8_t controller, uint8_t value);

    /// @brief Apply one raw MIDI message; returns true if a macro was written
    static bool applyMessage(const std::vector<unsigned char>& message, SceneManager& manager);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace lucent
