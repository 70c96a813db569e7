// Audio output interface: at-most-one-active tone playback.

#ifndef TONEGRID_AUDIO_AUDIO_SINK_H
#define TONEGRID_AUDIO_AUDIO_SINK_H

#include "audio/tone_synth.h"

namespace tonegrid {

/// @brief Abstract non-blocking audio output.
///
/// The sink takes ownership of each submitted buffer. Submitting a new
/// buffer stops whatever this sink is still playing, so at most one tone
/// is audible at a time. Concrete implementation: SdlAudioSink.
class AudioSink {
 public:
  virtual ~AudioSink() = default;

  /// @brief Stop any playing tone and start the given one.
  /// @param buffer Stereo 16-bit PCM at the sink's sample rate.
  /// @return False if the device rejected the buffer.
  virtual bool replace(ToneBuffer&& buffer) = 0;

  /// @brief Stop playback without starting a new tone.
  virtual void stop() = 0;
};

}  // namespace tonegrid

#endif  // TONEGRID_AUDIO_AUDIO_SINK_H
