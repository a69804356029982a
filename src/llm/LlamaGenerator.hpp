// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/Sampler.hpp>
#include <provider/Provider.hpp>

#include <memory>
#include <string>

namespace voicecore
{

struct LlamaGeneratorConfig
{
    std::string modelPath;
    int contextSize = 4096;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
    SamplerConfig sampler;
};

/// @brief Local reply generation provider backed by llama.cpp.
///
/// The conversation is rendered with the model's chat template and every
/// generated piece is streamed as it is sampled. Cancellation is checked
/// between tokens.
class LlamaGenerator final: public GenerationProvider
{
  public:
    LlamaGenerator(std::string name, LlamaGeneratorConfig config);
    ~LlamaGenerator() override;

    [[nodiscard]] auto name() const -> const std::string& override { return _name; }
    [[nodiscard]] auto start() -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto streamRequest(const GenerationRequest& request,
                                     const ChunkCallback& onChunk,
                                     std::stop_token stop) -> VoidResult override;

  private:
    struct Impl;
    std::string _name;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
