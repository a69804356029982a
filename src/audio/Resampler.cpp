// SPDX-License-Identifier: Apache-2.0
#include "Resampler.hpp"

#include <algorithm>

namespace voicecore
{

auto resampleLinear(std::span<const float> samples, int fromRate, int toRate) -> std::vector<float>
{
    if (fromRate == toRate || samples.empty() || fromRate <= 0 || toRate <= 0)
        return { samples.begin(), samples.end() };

    auto const ratio = static_cast<double>(fromRate) / toRate;
    auto const outCount = static_cast<std::size_t>(static_cast<double>(samples.size()) / ratio);
    auto out = std::vector<float>(outCount);
    for (auto i = std::size_t { 0 }; i < outCount; ++i)
    {
        auto const pos = static_cast<double>(i) * ratio;
        auto const index = std::min(static_cast<std::size_t>(pos), samples.size() - 1);
        auto const next = std::min(index + 1, samples.size() - 1);
        auto const frac = static_cast<float>(pos - static_cast<double>(index));
        out[i] = samples[index] + (samples[next] - samples[index]) * frac;
    }
    return out;
}

} // namespace voicecore
