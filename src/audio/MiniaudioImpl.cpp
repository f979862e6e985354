// SPDX-License-Identifier: Apache-2.0

// The miniaudio implementation is compiled here and nowhere else. AudioCapture,
// AudioPlayback and AudioDevices include <miniaudio.h> for declarations only.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
