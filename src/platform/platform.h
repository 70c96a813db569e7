// Platform interface: clock, input events, frame pacing, display geometry.

#ifndef TONEGRID_PLATFORM_PLATFORM_H
#define TONEGRID_PLATFORM_PLATFORM_H

#include <cstdint>

namespace tonegrid {

/// @brief Kind of input event relevant to the screensaver.
enum class InputEventType : uint8_t {
  None,         ///< Queue empty.
  Quit,         ///< Window closed or termination requested.
  KeyDown,      ///< Any key pressed.
  PointerDown,  ///< Mouse button or touch pressed.
  Resize        ///< Display size changed.
};

/// @brief One input event. width/height are set for Resize only.
struct InputEvent {
  InputEventType type = InputEventType::None;
  int width = 0;
  int height = 0;
};

/// @brief Display size in pixels.
struct DisplaySize {
  int width = 0;
  int height = 0;
};

/// @brief True if the event ends the run loop.
constexpr bool isExitEvent(const InputEvent& event) {
  return event.type == InputEventType::Quit ||
         event.type == InputEventType::KeyDown ||
         event.type == InputEventType::PointerDown;
}

/// @brief Abstract host platform. Concrete implementation: SdlPlatform.
class Platform {
 public:
  virtual ~Platform() = default;

  /// @brief Monotonic milliseconds since platform start.
  virtual uint32_t nowMs() = 0;

  /// @brief Pop the next pending input event.
  /// @return Event with type None when the queue is empty.
  virtual InputEvent pollEvent() = 0;

  /// @brief Wait until the next frame is due at the given rate.
  virtual void waitForNextFrame(uint32_t frames_per_second) = 0;

  /// @brief Current drawable size.
  virtual DisplaySize displaySize() = 0;
};

}  // namespace tonegrid

#endif  // TONEGRID_PLATFORM_PLATFORM_H
