// SPDX-License-Identifier: Apache-2.0

// The one translation unit that compiles miniaudio. Capture and playback only
// use the device API, so the decoders, encoders and generators are left out.
#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_DECODING
#define MA_NO_ENCODING
#define MA_NO_GENERATION
#include <miniaudio.h>
