// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// Only the decoding API is used (AudioFileReader); device I/O and encoding are compiled out via
// MA_NO_DEVICE_IO / MA_NO_ENCODING, defined for the voxgate_core target in CMakeLists.txt.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
