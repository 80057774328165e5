/**
 * @file log.h
 * @brief Zero-cost logging - compile-time eliminated in production builds
 *
 * @details
 * Lightweight logging macros that compile to no-ops when disabled. On Arduino
 * targets the sink is the `Serial` port; host builds (unit tests, tools) print
 * to stdout.
 *
 * # Log Levels
 * - **ERROR**: Transfer aborted, device unusable for this cycle
 * - **WARN**: Retries, resends, ignored notifications
 * - **INFO**: Connection progress and block requests (default)
 * - **DEBUG**: Per-part traffic
 * - **TRACE**: Raw frames
 *
 * # Build Configuration
 * **Method 1: Symbolic flags (recommended)**
 * - `-DOEPL_LOG_LEVEL_TRACE` - Enable all logging (most verbose)
 * - `-DOEPL_LOG_LEVEL_DEBUG` - Enable DEBUG and above
 * - `-DOEPL_LOG_LEVEL_INFO` - Enable INFO and above (default)
 * - `-DOEPL_LOG_LEVEL_WARN` - Enable WARN and above
 * - `-DOEPL_LOG_LEVEL_ERROR` - Enable ERROR only
 * - `-DOEPL_LOG_LEVEL_NONE` or `-DOEPL_DISABLE_LOGGING` - Disable all logging
 *
 * **Method 2: Numeric level**
 * - `-DOEPL_LOG_LEVEL=5` (TRACE) ... `-DOEPL_LOG_LEVEL=0` (NONE)
 *
 * @note If multiple symbolic flags are set, the most verbose wins
 *
 * # Usage
 * @code
 * OEPL_LOG_INFO("Block %u: requesting %u parts\n", block, count);
 * OEPL_LOG_TRACE_BYTES("RX: ", frame.data.data(), frame.length);
 * @endcode
 */

#ifndef OEPL_LOG_H_
#define OEPL_LOG_H_

#if defined(ARDUINO)
  #include <Arduino.h>
  #define OEPL_LOG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
  #include <cstdio>
  #define OEPL_LOG_PRINTF(...) std::printf(__VA_ARGS__)
#endif

#ifndef OEPL_LOG_LEVEL
  #define OEPL_LOG_LEVEL 3  // INFO

  // Least to most verbose - last one wins
  #if defined(OEPL_DISABLE_LOGGING) || defined(OEPL_LOG_LEVEL_NONE)
    #undef OEPL_LOG_LEVEL
    #define OEPL_LOG_LEVEL 0
  #endif
  #ifdef OEPL_LOG_LEVEL_ERROR
    #undef OEPL_LOG_LEVEL
    #define OEPL_LOG_LEVEL 1
  #endif
  #ifdef OEPL_LOG_LEVEL_WARN
    #undef OEPL_LOG_LEVEL
    #define OEPL_LOG_LEVEL 2
  #endif
  #ifdef OEPL_LOG_LEVEL_INFO
    #undef OEPL_LOG_LEVEL
    #define OEPL_LOG_LEVEL 3
  #endif
  #ifdef OEPL_LOG_LEVEL_DEBUG
    #undef OEPL_LOG_LEVEL
    #define OEPL_LOG_LEVEL 4
  #endif
  #ifdef OEPL_LOG_LEVEL_TRACE
    #undef OEPL_LOG_LEVEL
    #define OEPL_LOG_LEVEL 5
  #endif
#endif

// Defined after OEPL_LOG_LEVEL is resolved so they don't clash with -D flags
#define OEPL_LOG_LEVEL_NONE  0
#define OEPL_LOG_LEVEL_ERROR 1
#define OEPL_LOG_LEVEL_WARN  2
#define OEPL_LOG_LEVEL_INFO  3
#define OEPL_LOG_LEVEL_DEBUG 4
#define OEPL_LOG_LEVEL_TRACE 5

#define OEPL_LOG_BYTES_IMPL(tag, prefix, data, size) do { \
    OEPL_LOG_PRINTF(tag "%s", prefix); \
    for (size_t _i = 0; _i < (size) && _i < 16; ++_i) { \
      OEPL_LOG_PRINTF("%02X ", ((const uint8_t*)(data))[_i]); \
    } \
    if ((size) > 16) OEPL_LOG_PRINTF("..."); \
    OEPL_LOG_PRINTF("\n"); \
  } while(0)

#if OEPL_LOG_LEVEL >= 1
  #define OEPL_LOG_ERROR(...) OEPL_LOG_PRINTF("OEPL:E " __VA_ARGS__)
#else
  #define OEPL_LOG_ERROR(...) ((void)0)
#endif

#if OEPL_LOG_LEVEL >= 2
  #define OEPL_LOG_WARN(...) OEPL_LOG_PRINTF("OEPL:W " __VA_ARGS__)
#else
  #define OEPL_LOG_WARN(...) ((void)0)
#endif

#if OEPL_LOG_LEVEL >= 3
  #define OEPL_LOG_INFO(...) OEPL_LOG_PRINTF("OEPL:I " __VA_ARGS__)
#else
  #define OEPL_LOG_INFO(...) ((void)0)
#endif

#if OEPL_LOG_LEVEL >= 4
  #define OEPL_LOG_DEBUG(...) OEPL_LOG_PRINTF("OEPL:D " __VA_ARGS__)
  #define OEPL_LOG_DEBUG_BYTES(prefix, data, size) OEPL_LOG_BYTES_IMPL("OEPL:D ", prefix, data, size)
#else
  #define OEPL_LOG_DEBUG(...) ((void)0)
  #define OEPL_LOG_DEBUG_BYTES(prefix, data, size) ((void)0)
#endif

#if OEPL_LOG_LEVEL >= 5
  #define OEPL_LOG_TRACE(...) OEPL_LOG_PRINTF("OEPL:T " __VA_ARGS__)
  #define OEPL_LOG_TRACE_BYTES(prefix, data, size) OEPL_LOG_BYTES_IMPL("OEPL:T ", prefix, data, size)
#else
  #define OEPL_LOG_TRACE(...) ((void)0)
  #define OEPL_LOG_TRACE_BYTES(prefix, data, size) ((void)0)
#endif

#endif // OEPL_LOG_H_
