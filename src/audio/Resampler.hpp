// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <span>
#include <vector>

namespace voicecore
{

/// @brief Linearly resamples mono PCM from @p fromRate to @p toRate.
///
/// Returns a copy of the input when the rates match or either rate is not positive.
[[nodiscard]] auto resampleLinear(std::span<const float> samples, int fromRate, int toRate) -> std::vector<float>;

} // namespace voicecore
