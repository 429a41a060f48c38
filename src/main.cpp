#include <cstdio>
#include <cstring>
#include <memory>
#include <utility>

#include "config/FontConfig.h"
#include "display/FrameBuffer.h"
#include "display/PcfTextStyle.h"
#include "font/ByteSource.h"
#include "font/PcfFont.h"
#include "platform/Log.h"

using namespace PcfText;

// Exit codes
static const int EXIT_OK = 0;
static const int EXIT_USAGE = 1;
static const int EXIT_LOAD_FAILED = 2;

static const char* const TAG = "preview";

// Pixel values in the preview buffer
static const uint8_t PIXEL_ON = 1;
static const uint8_t PIXEL_OFF = 0;

// Forward declarations
void printUsage(const char* program);
bool parseBaseline(const char* name, Baseline& baseline);
void printBuffer(const FrameBuffer<uint8_t>& buffer, int anchor_row);

void printUsage(const char* program) {
  std::fprintf(stderr, "Usage: %s <font.pcf> <text> [top|bottom|middle|alphabetic]\n", program);
}

bool parseBaseline(const char* name, Baseline& baseline) {
  if (std::strcmp(name, "top") == 0) {
    baseline = Baseline::Top;
  } else if (std::strcmp(name, "bottom") == 0) {
    baseline = Baseline::Bottom;
  } else if (std::strcmp(name, "middle") == 0) {
    baseline = Baseline::Middle;
  } else if (std::strcmp(name, "alphabetic") == 0) {
    baseline = Baseline::Alphabetic;
  } else {
    return false;
  }
  return true;
}

// Dump the buffer as text, marking the row the text was anchored on
void printBuffer(const FrameBuffer<uint8_t>& buffer, int anchor_row) {
  for (int y = 0; y < buffer.getHeight(); y++) {
    for (int x = 0; x < buffer.getWidth(); x++) {
      std::putchar(buffer.getPixel(x, y) == PIXEL_ON ? FontConfig::PREVIEW_ON_CHAR : FontConfig::PREVIEW_OFF_CHAR);
    }
    if (y == anchor_row) {
      std::fputs(" <", stdout);
    }
    std::putchar('\n');
  }
}

int main(int argc, char** argv) {
  if (argc < 3 || argc > 4) {
    printUsage(argv[0]);
    return EXIT_USAGE;
  }

  Baseline baseline = Baseline::Top;
  if (argc == 4 && !parseBaseline(argv[3], baseline)) {
    std::fprintf(stderr, "Unknown baseline '%s'\n", argv[3]);
    printUsage(argv[0]);
    return EXIT_USAGE;
  }

  platform::setLogLevel(platform::LogLevel::Info);

  std::unique_ptr<FileByteSource> source = FileByteSource::open(argv[1]);
  if (!source) {
    PCF_LOGE(TAG, "Cannot open %s", argv[1]);
    return EXIT_LOAD_FAILED;
  }

  std::unique_ptr<PcfFont> font;
  Error error = PcfFont::load(std::move(source), font);
  if (error != Error::None) {
    PCF_LOGE(TAG, "Cannot load %s: %s", argv[1], errorName(error));
    return EXIT_LOAD_FAILED;
  }
  PCF_LOGI(TAG, "%s: ascent %d, descent %d, default char U+%04X",
           argv[1], font->ascent(), font->descent(), font->defaultChar());

  PcfTextStyle<uint8_t> style = PcfTextStyleBuilder<uint8_t>(*font)
      .textColor(PIXEL_ON)
      .backgroundColor(PIXEL_OFF)
      .build();

  // Anchor so the top of the line box lands inside the margin
  const int margin = FontConfig::PREVIEW_MARGIN;
  const Point position(margin, margin + style.baselineOffset(Baseline::Top) - style.baselineOffset(baseline));
  TextMetrics metrics = style.measureString(argv[2], position, baseline);
  PCF_LOGI(TAG, "Text box %ux%u", metrics.bounding_box.size.width, metrics.bounding_box.size.height);

  FrameBuffer<uint8_t> buffer(static_cast<int>(metrics.bounding_box.size.width) + 2 * margin,
                              static_cast<int>(metrics.bounding_box.size.height) + 2 * margin,
                              PIXEL_OFF);
  Point next = style.drawString(argv[2], position, baseline, buffer);
  if (next != metrics.next_position) {
    PCF_LOGW(TAG, "Drawn advance %d differs from measured %d", next.x, metrics.next_position.x);
  }

  printBuffer(buffer, position.y);
  return EXIT_OK;
}
