// SDL2 host: window, renderer, TTF fonts and queued audio with scoped release.

#ifndef TONEGRID_PLATFORM_SDL_PLATFORM_H
#define TONEGRID_PLATFORM_SDL_PLATFORM_H

#include <SDL.h>
#include <SDL_ttf.h>

#include <cstdint>
#include <memory>
#include <string>

#include "audio/audio_sink.h"
#include "platform/platform.h"
#include "render/display_sink.h"

namespace tonegrid {

// ---------------------------------------------------------------------------
// Scoped SDL handles
// ---------------------------------------------------------------------------

namespace sdl {

struct WindowDeleter {
  void operator()(SDL_Window* window) const { SDL_DestroyWindow(window); }
};
struct RendererDeleter {
  void operator()(SDL_Renderer* renderer) const { SDL_DestroyRenderer(renderer); }
};
struct FontDeleter {
  void operator()(TTF_Font* font) const { TTF_CloseFont(font); }
};
struct SurfaceDeleter {
  void operator()(SDL_Surface* surface) const { SDL_FreeSurface(surface); }
};
struct TextureDeleter {
  void operator()(SDL_Texture* texture) const { SDL_DestroyTexture(texture); }
};

using WindowPtr = std::unique_ptr<SDL_Window, WindowDeleter>;
using RendererPtr = std::unique_ptr<SDL_Renderer, RendererDeleter>;
using FontPtr = std::unique_ptr<TTF_Font, FontDeleter>;
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;
using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

/// @brief Holds SDL_Init / TTF_Init and undoes them on destruction.
class SubsystemGuard {
 public:
  SubsystemGuard() = default;
  ~SubsystemGuard();
  SubsystemGuard(const SubsystemGuard&) = delete;
  SubsystemGuard& operator=(const SubsystemGuard&) = delete;

  /// @brief Initialize video, audio and events, then SDL_ttf.
  /// @param error Set on failure.
  /// @return True on success.
  bool init(std::string& error);

 private:
  bool sdl_ready_ = false;
  bool ttf_ready_ = false;
};

}  // namespace sdl

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

/// @brief Queued SDL audio device playing one tone at a time.
class SdlAudioSink : public AudioSink {
 public:
  SdlAudioSink() = default;
  ~SdlAudioSink() override;
  SdlAudioSink(const SdlAudioSink&) = delete;
  SdlAudioSink& operator=(const SdlAudioSink&) = delete;

  /// @brief Open the default output device as stereo S16 at sample_rate.
  /// @param error Set on failure.
  /// @return True on success.
  bool open(int sample_rate, std::string& error);

  bool replace(ToneBuffer&& buffer) override;
  void stop() override;

 private:
  SDL_AudioDeviceID device_ = 0;
  int sample_rate_ = 0;
};

/// @brief SDL renderer drawing target with optional TTF labels.
class SdlDisplaySink : public DisplaySink {
 public:
  /// @param renderer Borrowed renderer (owned by SdlSession).
  explicit SdlDisplaySink(SDL_Renderer* renderer) : renderer_(renderer) {}

  /// @brief Load the medium and large label fonts from the first usable path.
  /// @return False if no font could be opened (labels are then skipped).
  bool loadFonts();

  void clear(const RgbColor& color) override;
  void fillRect(const PixelRect& rect, const RgbColor& color) override;
  void strokeRect(const PixelRect& rect, const RgbColor& color) override;
  void drawText(const std::string& text, FontClass font, int center_x,
                int center_y, const RgbColor& color) override;
  void present() override;

 private:
  SDL_Renderer* renderer_;
  sdl::FontPtr medium_font_;
  sdl::FontPtr large_font_;
};

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

/// @brief Window and event/clock source. Owns every SDL resource.
///
/// Members are declared so that destruction releases the audio device,
/// fonts, renderer and window before SDL itself is shut down, on every
/// exit path.
class SdlSession : public Platform {
 public:
  SdlSession() = default;
  ~SdlSession() override = default;
  SdlSession(const SdlSession&) = delete;
  SdlSession& operator=(const SdlSession&) = delete;

  /// @brief Initialize SDL, open the window, renderer, fonts and audio.
  /// @param title Window title.
  /// @param fullscreen Use the native desktop resolution.
  /// @param width Window width when not fullscreen.
  /// @param height Window height when not fullscreen.
  /// @param sample_rate Audio sample rate.
  /// @param error Set on failure.
  /// @return True on success; false means the caller must exit.
  bool open(const char* title, bool fullscreen, int width, int height,
            int sample_rate, std::string& error);

  uint32_t nowMs() override;
  InputEvent pollEvent() override;
  void waitForNextFrame(uint32_t frames_per_second) override;
  DisplaySize displaySize() override;

  SdlDisplaySink& display() { return *display_; }
  SdlAudioSink& audio() { return audio_; }

 private:
  sdl::SubsystemGuard subsystems_;
  sdl::WindowPtr window_;
  sdl::RendererPtr renderer_;
  std::unique_ptr<SdlDisplaySink> display_;
  SdlAudioSink audio_;
  uint32_t last_frame_ms_ = 0;
};

}  // namespace tonegrid

#endif  // TONEGRID_PLATFORM_SDL_PLATFORM_H
