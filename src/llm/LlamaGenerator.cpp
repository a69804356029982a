// SPDX-License-Identifier: Apache-2.0
#include "LlamaGenerator.hpp"

#include <core/Log.hpp>

#include <llama.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace voicecore
{

namespace
{
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    auto llamaLog = log::LineForwarder {};
    auto llamaLastLevel = std::atomic<log::Level> { log::Level::Debug };

    /// @brief Forwards llama.cpp logging to voicecore::log, one complete line at a time.
    ///
    /// Continuation fragments keep the level of the message they continue.
    void llamaLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        if (auto const mapped = mapGgmlLevel(level))
            llamaLastLevel = *mapped;
        llamaLog.feed(llamaLastLevel.load(), text);
    }

    struct SamplerDeleter
    {
        void operator()(llama_sampler* sampler) const { llama_sampler_free(sampler); }
    };

    using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

    auto makeSampler(const SamplerConfig& config) -> SamplerPtr
    {
        auto chain = SamplerPtr { llama_sampler_chain_init(llama_sampler_chain_default_params()) };
        llama_sampler_chain_add(chain.get(),
                                llama_sampler_init_penalties(config.repeatLastN, config.repeatPenalty, 0.0f, 0.0f));
        llama_sampler_chain_add(chain.get(), llama_sampler_init_top_k(config.topK));
        llama_sampler_chain_add(chain.get(), llama_sampler_init_top_p(config.topP, 1));
        if (config.minP > 0.0f)
            llama_sampler_chain_add(chain.get(), llama_sampler_init_min_p(config.minP, 1));
        llama_sampler_chain_add(chain.get(), llama_sampler_init_temp(config.temperature));
        llama_sampler_chain_add(
            chain.get(),
            llama_sampler_init_dist(config.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(config.seed)));
        return chain;
    }

} // namespace

struct LlamaGenerator::Impl
{
    LlamaGeneratorConfig config;
    mutable std::mutex mutex;
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;

    void release()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
        ctx = nullptr;
        model = nullptr;
    }

    ~Impl() { release(); }

    [[nodiscard]] auto renderPrompt(const std::vector<ChatMessage>& messages) const -> Result<std::string>
    {
        auto const* tmpl = llama_model_chat_template(model, nullptr);
        auto const chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

        // llama_chat_message only borrows the strings.
        auto roles = std::vector<std::string> {};
        roles.reserve(messages.size());
        auto llamaMessages = std::vector<llama_chat_message> {};
        llamaMessages.reserve(messages.size());
        for (auto const& message: messages)
        {
            roles.emplace_back(roleToString(message.role));
            llamaMessages.push_back(
                llama_chat_message { .role = roles.back().c_str(), .content = message.content.c_str() });
        }

        auto buffer = std::vector<char>(static_cast<size_t>(config.contextSize) * 4);
        auto length = llama_chat_apply_template(chatTemplate.c_str(),
                                                llamaMessages.data(),
                                                llamaMessages.size(),
                                                true,
                                                buffer.data(),
                                                static_cast<int32_t>(buffer.size()));
        if (length > static_cast<int32_t>(buffer.size()))
        {
            buffer.resize(static_cast<size_t>(length));
            length = llama_chat_apply_template(chatTemplate.c_str(),
                                               llamaMessages.data(),
                                               llamaMessages.size(),
                                               true,
                                               buffer.data(),
                                               static_cast<int32_t>(buffer.size()));
        }
        if (length < 0)
            return makeError(ErrorCode::GenerationError, "Failed to apply chat template");

        return std::string(buffer.data(), static_cast<size_t>(length));
    }
};

LlamaGenerator::LlamaGenerator(std::string name, LlamaGeneratorConfig config):
    _name(std::move(name)), _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

LlamaGenerator::~LlamaGenerator() = default;

auto LlamaGenerator::start() -> VoidResult
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->ctx)
        return {};

    auto const& config = _impl->config;
    if (auto valid = validateSampler(config.sampler); !valid)
        return makeError(ErrorCode::GenerationError, std::format("[{}] {}", _name, valid.error().message));

    log::info("[{}] Loading model: {}", _name, config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);

    auto modelParams = llama_model_default_params();
    modelParams.n_gpu_layers = config.gpuLayers >= 0 ? config.gpuLayers : 999;

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load model: {}", config.modelPath));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize);
    ctxParams.n_threads = config.threads > 0 ? config.threads : static_cast<int32_t>(std::thread::hardware_concurrency());
    ctxParams.n_threads_batch = ctxParams.n_threads;

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    _impl->model = model;
    _impl->ctx = ctx;
    log::info("[{}] Model loaded (context size: {})", _name, config.contextSize);
    return {};
}

void LlamaGenerator::stop()
{
    auto const lock = std::lock_guard { _impl->mutex };
    _impl->release();
}

auto LlamaGenerator::isConnected() const -> bool
{
    auto const lock = std::lock_guard { _impl->mutex };
    return _impl->ctx != nullptr;
}

auto LlamaGenerator::streamRequest(const GenerationRequest& request,
                                   const ChunkCallback& onChunk,
                                   std::stop_token stop) -> VoidResult
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (!_impl->ctx)
        return makeError(ErrorCode::GenerationError, "No model loaded");

    auto prompt = _impl->renderPrompt(request.messages);
    if (!prompt)
        return std::unexpected(prompt.error());

    auto const* vocab = llama_model_get_vocab(_impl->model);
    auto const contextSize = _impl->config.contextSize;
    auto tokens = std::vector<llama_token>(static_cast<size_t>(contextSize));
    auto const tokenCount = llama_tokenize(vocab,
                                           prompt->c_str(),
                                           static_cast<int32_t>(prompt->size()),
                                           tokens.data(),
                                           static_cast<int32_t>(tokens.size()),
                                           true,
                                           true);
    if (tokenCount < 0)
        return makeError(ErrorCode::GenerationError,
                         std::format("Prompt does not fit the context ({} tokens)", -tokenCount));
    tokens.resize(static_cast<size_t>(tokenCount));

    if (auto* memory = llama_get_memory(_impl->ctx))
        llama_memory_clear(memory, true);

    if (llama_decode(_impl->ctx, llama_batch_get_one(tokens.data(), tokenCount)) != 0)
        return makeError(ErrorCode::GenerationError, "Failed to decode prompt");

    auto sampler = makeSampler(_impl->config.sampler);
    auto const maxTokens = std::min(contextSize - tokenCount, _impl->config.sampler.maxTokens);

    for (auto i = 0; i < maxTokens; ++i)
    {
        if (stop.stop_requested())
            return makeError(ErrorCode::Cancelled, "Generation cancelled");

        auto token = llama_sampler_sample(sampler.get(), _impl->ctx, -1);
        if (llama_vocab_is_eog(vocab, token))
            break;

        auto piece = std::array<char, 256> {};
        auto const pieceLength =
            llama_token_to_piece(vocab, token, piece.data(), static_cast<int32_t>(piece.size()), 0, true);
        if (pieceLength > 0)
            onChunk(TextChunk { .delta = std::string(piece.data(), static_cast<size_t>(pieceLength)) });

        if (llama_decode(_impl->ctx, llama_batch_get_one(&token, 1)) != 0)
            return makeError(ErrorCode::GenerationError, "Failed to decode generated token");
    }

    return {};
}

} // namespace voicecore
