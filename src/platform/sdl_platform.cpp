/// @file
/// @brief SDL2 implementation of the platform, display and audio interfaces.

#include "platform/sdl_platform.h"

#include <cstdio>
#include <string>
#include <utility>

namespace tonegrid {

namespace {

/// Candidate label fonts, first match wins.
constexpr const char* kFontPaths[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/System/Library/Fonts/Supplemental/Arial.ttf",
};

constexpr int kAudioBufferFrames = 512;

SDL_Rect toSdlRect(const PixelRect& rect) {
  SDL_Rect out;
  out.x = rect.x;
  out.y = rect.y;
  out.w = rect.width;
  out.h = rect.height;
  return out;
}

std::string sdlError(const char* what) {
  return std::string(what) + ": " + SDL_GetError();
}

}  // namespace

// ---------------------------------------------------------------------------
// SubsystemGuard
// ---------------------------------------------------------------------------

namespace sdl {

SubsystemGuard::~SubsystemGuard() {
  if (ttf_ready_) TTF_Quit();
  if (sdl_ready_) SDL_Quit();
}

bool SubsystemGuard::init(std::string& error) {
  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_EVENTS) != 0) {
    error = sdlError("SDL_Init");
    return false;
  }
  sdl_ready_ = true;
  if (TTF_Init() != 0) {
    error = std::string("TTF_Init: ") + TTF_GetError();
    return false;
  }
  ttf_ready_ = true;
  return true;
}

}  // namespace sdl

// ---------------------------------------------------------------------------
// SdlAudioSink
// ---------------------------------------------------------------------------

SdlAudioSink::~SdlAudioSink() {
  if (device_ != 0) SDL_CloseAudioDevice(device_);
}

bool SdlAudioSink::open(int sample_rate, std::string& error) {
  SDL_AudioSpec want;
  SDL_zero(want);
  want.freq = sample_rate;
  want.format = AUDIO_S16SYS;
  want.channels = tone::kChannels;
  want.samples = kAudioBufferFrames;
  want.callback = nullptr;  // Queued playback.

  SDL_AudioSpec have;
  // No allowed changes: SDL converts to the device format internally.
  device_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
  if (device_ == 0) {
    error = sdlError("SDL_OpenAudioDevice");
    return false;
  }
  sample_rate_ = sample_rate;
  SDL_PauseAudioDevice(device_, 0);
  return true;
}

bool SdlAudioSink::replace(ToneBuffer&& buffer) {
  if (device_ == 0) return false;
  if (buffer.sample_rate != sample_rate_ || buffer.channels != tone::kChannels) {
    std::fprintf(stderr, "[audio] WARNING: buffer format %dHz/%u ch, device %dHz/%u ch\n",
                 buffer.sample_rate, static_cast<unsigned>(buffer.channels),
                 sample_rate_, static_cast<unsigned>(tone::kChannels));
    return false;
  }
  SDL_ClearQueuedAudio(device_);
  if (buffer.empty()) return true;
  // SDL copies the data, so the buffer can be released on return.
  if (SDL_QueueAudio(device_, buffer.samples.data(),
                     static_cast<Uint32>(buffer.byteSize())) != 0) {
    std::fprintf(stderr, "[audio] %s\n", sdlError("SDL_QueueAudio").c_str());
    return false;
  }
  return true;
}

void SdlAudioSink::stop() {
  if (device_ != 0) SDL_ClearQueuedAudio(device_);
}

// ---------------------------------------------------------------------------
// SdlDisplaySink
// ---------------------------------------------------------------------------

bool SdlDisplaySink::loadFonts() {
  for (const char* path : kFontPaths) {
    sdl::FontPtr medium(TTF_OpenFont(path, fontPointSize(FontClass::Medium)));
    sdl::FontPtr large(TTF_OpenFont(path, fontPointSize(FontClass::Large)));
    if (medium && large) {
      medium_font_ = std::move(medium);
      large_font_ = std::move(large);
      return true;
    }
  }
  return false;
}

void SdlDisplaySink::clear(const RgbColor& color) {
  SDL_SetRenderDrawColor(renderer_, color.red, color.green, color.blue, 255);
  SDL_RenderClear(renderer_);
}

void SdlDisplaySink::fillRect(const PixelRect& rect, const RgbColor& color) {
  SDL_Rect sdl_rect = toSdlRect(rect);
  SDL_SetRenderDrawColor(renderer_, color.red, color.green, color.blue, 255);
  SDL_RenderFillRect(renderer_, &sdl_rect);
}

void SdlDisplaySink::strokeRect(const PixelRect& rect, const RgbColor& color) {
  SDL_Rect sdl_rect = toSdlRect(rect);
  SDL_SetRenderDrawColor(renderer_, color.red, color.green, color.blue, 255);
  SDL_RenderDrawRect(renderer_, &sdl_rect);
}

void SdlDisplaySink::drawText(const std::string& text, FontClass font,
                              int center_x, int center_y,
                              const RgbColor& color) {
  TTF_Font* ttf = font == FontClass::Large ? large_font_.get() : medium_font_.get();
  if (ttf == nullptr || text.empty()) return;

  SDL_Color sdl_color = {color.red, color.green, color.blue, 255};
  sdl::SurfacePtr surface(TTF_RenderUTF8_Blended(ttf, text.c_str(), sdl_color));
  if (!surface) return;
  sdl::TexturePtr texture(SDL_CreateTextureFromSurface(renderer_, surface.get()));
  if (!texture) return;

  SDL_Rect dest;
  dest.w = surface->w;
  dest.h = surface->h;
  dest.x = center_x - surface->w / 2;
  dest.y = center_y - surface->h / 2;
  SDL_RenderCopy(renderer_, texture.get(), nullptr, &dest);
}

void SdlDisplaySink::present() { SDL_RenderPresent(renderer_); }

// ---------------------------------------------------------------------------
// SdlSession
// ---------------------------------------------------------------------------

bool SdlSession::open(const char* title, bool fullscreen, int width, int height,
                      int sample_rate, std::string& error) {
  if (!subsystems_.init(error)) return false;

  // The tone is the core feature: no audio device means no run.
  if (!audio_.open(sample_rate, error)) return false;

  Uint32 flags = SDL_WINDOW_RESIZABLE;
  if (fullscreen) {
    SDL_DisplayMode mode;
    if (SDL_GetDesktopDisplayMode(0, &mode) != 0) {
      error = sdlError("SDL_GetDesktopDisplayMode");
      return false;
    }
    width = mode.w;
    height = mode.h;
    flags = SDL_WINDOW_FULLSCREEN_DESKTOP;
  }

  window_.reset(SDL_CreateWindow(title, SDL_WINDOWPOS_CENTERED,
                                 SDL_WINDOWPOS_CENTERED, width, height, flags));
  if (!window_) {
    error = sdlError("SDL_CreateWindow");
    return false;
  }
  renderer_.reset(SDL_CreateRenderer(window_.get(), -1, SDL_RENDERER_ACCELERATED));
  if (!renderer_) {
    error = sdlError("SDL_CreateRenderer");
    return false;
  }
  if (fullscreen) SDL_ShowCursor(SDL_DISABLE);

  display_ = std::make_unique<SdlDisplaySink>(renderer_.get());
  if (!display_->loadFonts()) {
    std::fprintf(stderr, "[sdl] WARNING: no label font found, labels disabled\n");
  }
  last_frame_ms_ = SDL_GetTicks();
  return true;
}

uint32_t SdlSession::nowMs() { return SDL_GetTicks(); }

InputEvent SdlSession::pollEvent() {
  SDL_Event sdl_event;
  while (SDL_PollEvent(&sdl_event) != 0) {
    InputEvent event;
    switch (sdl_event.type) {
      case SDL_QUIT:
        event.type = InputEventType::Quit;
        return event;
      case SDL_KEYDOWN:
        event.type = InputEventType::KeyDown;
        return event;
      case SDL_MOUSEBUTTONDOWN:
      case SDL_FINGERDOWN:
        event.type = InputEventType::PointerDown;
        return event;
      case SDL_WINDOWEVENT:
        if (sdl_event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
          DisplaySize size = displaySize();
          event.type = InputEventType::Resize;
          event.width = size.width;
          event.height = size.height;
          return event;
        }
        break;
      default:
        break;
    }
  }
  return InputEvent{};
}

void SdlSession::waitForNextFrame(uint32_t frames_per_second) {
  if (frames_per_second == 0) return;
  uint32_t frame_ms = 1000 / frames_per_second;
  uint32_t elapsed = SDL_GetTicks() - last_frame_ms_;
  if (elapsed < frame_ms) SDL_Delay(frame_ms - elapsed);
  last_frame_ms_ = SDL_GetTicks();
}

DisplaySize SdlSession::displaySize() {
  DisplaySize size;
  if (renderer_ && SDL_GetRendererOutputSize(renderer_.get(), &size.width,
                                             &size.height) == 0) {
    return size;
  }
  if (window_) SDL_GetWindowSize(window_.get(), &size.width, &size.height);
  return size;
}

}  // namespace tonegrid
