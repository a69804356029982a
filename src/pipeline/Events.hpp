// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <variant>

namespace voicecore
{

/// @brief A microphone frame; only retained while a capture is open.
struct FrameCaptured
{
    AudioFrame frame;
};

struct WakeWordDetected
{
    std::string phrase;
    float confidence = 0.0f;
};

/// @brief Push-to-talk: an activation with full confidence.
struct ManualWake
{
};

struct SpeechStarted
{
};

/// @brief The speaker paused but is considered to still be speaking.
struct SpeechPaused
{
};

struct SpeechEnded
{
};

struct AudioDeviceFailed
{
    std::string detail;
};

struct AudioDeviceRecovered
{
};

/// @brief Typed user input that skips capture and transcription.
struct TextSubmitted
{
    std::string text;
};

/// @brief Everything the audio front end and the application may feed into the orchestrator.
using InputEvent = std::variant<FrameCaptured,
                                WakeWordDetected,
                                ManualWake,
                                SpeechStarted,
                                SpeechPaused,
                                SpeechEnded,
                                AudioDeviceFailed,
                                AudioDeviceRecovered,
                                TextSubmitted>;

} // namespace voicecore
