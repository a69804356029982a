// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace voicecore
{

/// @brief Audio handed to a transcription provider.
struct TranscriptionRequest
{
    TurnId turn = NoTurn;
    std::vector<float> samples; ///< Mono float32 PCM.
    int sampleRate = 16000;
    std::string language = "en";
};

/// @brief A piece of transcribed text.
///
/// Providers stream any number of partial chunks and finish with exactly one
/// chunk whose isFinal flag is set and whose text is the complete transcript.
struct TranscriptChunk
{
    std::string text;
    bool isFinal = false;
    float confidence = 1.0f;
};

/// @brief Conversation handed to a generation provider. The last message is the user's.
struct GenerationRequest
{
    TurnId turn = NoTurn;
    std::vector<ChatMessage> messages;
};

/// @brief A piece of generated text, appended to the reply in order.
struct TextChunk
{
    std::string delta;
};

/// @brief Text handed to a synthesis provider.
struct SynthesisRequest
{
    TurnId turn = NoTurn;
    std::string text;
};

template <ProviderKind Kind>
struct ProviderTraits;

template <>
struct ProviderTraits<ProviderKind::Transcription>
{
    using Request = TranscriptionRequest;
    using Chunk = TranscriptChunk;
};

template <>
struct ProviderTraits<ProviderKind::Generation>
{
    using Request = GenerationRequest;
    using Chunk = TextChunk;
};

template <>
struct ProviderTraits<ProviderKind::Synthesis>
{
    using Request = SynthesisRequest;
    using Chunk = AudioChunk;
};

/// @brief Uniform interface of a transcription, generation or synthesis back-end.
///
/// One instance serves one request at a time from the manager's point of view,
/// but an abandoned request may still be winding down while a new one starts,
/// so implementations must tolerate overlapping streamRequest() calls.
template <ProviderKind Kind>
class Provider
{
  public:
    using Request = typename ProviderTraits<Kind>::Request;
    using Chunk = typename ProviderTraits<Kind>::Chunk;
    using ChunkCallback = std::function<void(const Chunk& chunk)>;

    static constexpr auto kind = Kind;

    virtual ~Provider() = default;

    /// @brief Returns the instance name used in status and logs.
    [[nodiscard]] virtual auto name() const -> const std::string& = 0;

    /// @brief Connects to the service or loads the model.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Disconnects and releases resources. Must be idempotent.
    virtual void stop() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Runs one request, delivering output chunks in order as they become available.
    ///
    /// Must return promptly with ErrorCode::Cancelled once @p stop is requested.
    /// @param request The input.
    /// @param onChunk Invoked for each output chunk, on the calling thread.
    /// @param stop Cancellation token.
    /// @return Success once the stream is complete, or the failure.
    [[nodiscard]] virtual auto streamRequest(const Request& request,
                                             const ChunkCallback& onChunk,
                                             std::stop_token stop) -> VoidResult = 0;
};

using TranscriptionProvider = Provider<ProviderKind::Transcription>;
using GenerationProvider = Provider<ProviderKind::Generation>;
using SynthesisProvider = Provider<ProviderKind::Synthesis>;

} // namespace voicecore
