// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <voicecore/Config.hpp>

#include <memory>
#include <string>

namespace voicecore
{

/// @brief Wires the audio devices, detectors, providers and the orchestrator together.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Builds all components.
    /// @param withMicrophone False for text-only runs, which never open the capture device.
    [[nodiscard]] auto initialize(bool withMicrophone = true) -> VoidResult;

    /// @brief Runs the interactive console until "q" or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Submits one typed turn, waits until it is answered and spoken, and shuts down.
    /// @return Exit code (0 if the turn completed).
    [[nodiscard]] auto say(std::string text) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
