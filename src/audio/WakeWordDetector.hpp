// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>
#include <string>

namespace voicecore
{

struct WakeWordDetection
{
    std::string phrase;
    float confidence = 0.0f;
};

/// @brief Abstract activation-phrase spotter, fed one frame at a time.
///
/// Reports every candidate with its confidence; thresholding is up to the caller.
class WakeWordDetector
{
  public:
    virtual ~WakeWordDetector() = default;

    [[nodiscard]] virtual auto process(const AudioFrame& frame) -> Result<std::optional<WakeWordDetection>> = 0;

    virtual void reset() = 0;
};

} // namespace voicecore
