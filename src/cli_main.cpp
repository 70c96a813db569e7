/// @file
/// @brief CLI entry point for the tonegrid screensaver.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "core/rng_util.h"
#include "platform/sdl_platform.h"
#include "screensaver.h"
#include "screensaver_context.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  uint32_t seed = 0;
  bool windowed = false;
  int window_width = 1280;
  int window_height = 720;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("tonegrid - RGB grid screensaver with color-derived tones\n\n");
  std::printf("Usage: tonegrid [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --seed N         Random seed (0 = auto)\n");
  std::printf("  --windowed WxH   Run in a resizable window instead of fullscreen\n");
  std::printf("  --verbose        Log every added cell and its tone\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nAny key press, mouse click or window close exits.\n");
}

/// @brief Parse a "WxH" size string.
/// @return False if the string is malformed or either side is not positive.
bool parseSize(const char* text, int& width, int& height) {
  int parsed_w = 0;
  int parsed_h = 0;
  if (std::sscanf(text, "%dx%d", &parsed_w, &parsed_h) != 2) return false;
  if (parsed_w <= 0 || parsed_h <= 0) return false;
  width = parsed_w;
  height = parsed_h;
  return true;
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--windowed") == 0 && idx + 1 < argc) {
      opts.windowed = true;
      if (!parseSize(argv[++idx], opts.window_width, opts.window_height)) {
        std::fprintf(stderr, "Warning: bad size '%s', using %dx%d\n", argv[idx],
                     opts.window_width, opts.window_height);
      }
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown option '%s'\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Build a ScreensaverConfig from parsed CLI options.
/// @param opts Parsed command-line options.
/// @return ScreensaverConfig with the fixed constants and CLI choices.
tonegrid::ScreensaverConfig buildScreensaverConfig(const CliOptions& opts) {
  tonegrid::ScreensaverConfig config;
  config.seed = opts.seed;
  config.fullscreen = !opts.windowed;
  config.window_width = opts.window_width;
  config.window_height = opts.window_height;
  config.verbose = opts.verbose;
  return config;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }

  tonegrid::ScreensaverConfig config = buildScreensaverConfig(opts);

  tonegrid::SdlSession session;
  std::string error;
  if (!session.open("RGB Grid Screensaver", config.fullscreen,
                    config.window_width, config.window_height,
                    config.sample_rate, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  tonegrid::MtColorSource colors(config.seed);

  tonegrid::ScreensaverContext ctx;
  ctx.config = config;
  ctx.colors = &colors;
  ctx.audio = &session.audio();

  const tonegrid::GridLayout& layout = tonegrid::initGridFromDisplay(ctx, session);

  std::printf("tonegrid v0.1.0\n");
  std::printf("Grid:       %dx%d (%zu cells)\n", layout.cols, layout.rows,
              layout.capacity());
  std::printf("Cell size:  %.1fpx\n", layout.cell_size);
  std::printf("Interval:   %ums\n", config.interval_ms);
  std::printf("Seed:       %u%s\n", colors.seed(), config.seed == 0 ? " (auto)" : "");

  tonegrid::RunResult result =
      tonegrid::runScreensaver(ctx, session, session.display());

  if (config.verbose) {
    std::printf("Frames:     %llu\n", static_cast<unsigned long long>(result.frames));
    std::printf("Cells:      %u (%u silent)\n", result.triggers,
                result.silent_triggers);
  }
  return result.exit_code;
}
