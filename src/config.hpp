#pragma once

/*here you can switch optional widget families and the default safety caps*/

#define TUIB_VERSION_MAJOR 0
#define TUIB_VERSION_MINOR 3
#define TUIB_VERSION_PATCH 0

#ifndef TUIB_ENABLE_SCROLLBAR
#define TUIB_ENABLE_SCROLLBAR 1
#endif

#ifndef TUIB_ENABLE_CANVAS
#define TUIB_ENABLE_CANVAS 1
#endif

#define TUIB_DEFAULT_MAX_WIDTH      400
#define TUIB_DEFAULT_MAX_HEIGHT     200
#define TUIB_DEFAULT_MAX_AREA       4000000
#define TUIB_DEFAULT_MAX_TEXT_LEN   8192
#define TUIB_DEFAULT_MAX_BATCH      100000

// size used when a session falls back to an offscreen terminal
#define TUIB_FALLBACK_COLS 80
#define TUIB_FALLBACK_ROWS 24

#define TUIB_LOGGER_NAME "tuibridge"
