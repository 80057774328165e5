/*
 * Serial console commands
 *
 *   addr 3c:60:55:84:a0:42   target tag address
 *   retries 200 1200         connect attempts and delay between them (ms)
 *   type 0x21                image data type announced to the tag
 *   cancel                   abort the upload in progress
 *
 * Parsing only; the sketch applies the command.
 */

#ifndef CONSOLE_COMMAND_H
#define CONSOLE_COMMAND_H

#include <stdint.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

struct ConsoleCommand {
  enum class Kind : uint8_t { none, address, retries, data_type, cancel, invalid, unknown };

  Kind kind = Kind::none;
  const char* address = nullptr;  // points into the parsed line
  uint32_t retries = 0;
  uint32_t delay_ms = 0;
  uint8_t data_type = 0;

  /**
   * Parse one NUL-terminated console line
   * @return Kind::invalid for a known command with bad arguments
   */
  static ConsoleCommand parse(const char* line) {
    ConsoleCommand cmd;
    if (line == nullptr || *line == '\0') return cmd;

    if (std::strncmp(line, "addr ", 5) == 0) {
      cmd.kind = Kind::address;
      cmd.address = line + 5;
    } else if (std::strncmp(line, "retries ", 8) == 0) {
      const char* cursor = line + 8;
      uint32_t retries = 0;
      uint32_t delay_ms = 0;
      if (parseNumber(cursor, 10, retries) && *cursor == ' '
          && parseNumber(cursor, 10, delay_ms) && *cursor == '\0' && retries > 0) {
        cmd.kind = Kind::retries;
        cmd.retries = retries;
        cmd.delay_ms = delay_ms;
      } else {
        cmd.kind = Kind::invalid;
      }
    } else if (std::strncmp(line, "type ", 5) == 0) {
      const char* cursor = line + 5;
      uint32_t value = 0;
      if (parseNumber(cursor, 0, value) && *cursor == '\0' && value <= 0xFF) {
        cmd.kind = Kind::data_type;
        cmd.data_type = static_cast<uint8_t>(value);
      } else {
        cmd.kind = Kind::invalid;
      }
    } else if (std::strcmp(line, "cancel") == 0) {
      cmd.kind = Kind::cancel;
    } else {
      cmd.kind = Kind::unknown;
    }
    return cmd;
  }

private:
  // Unsigned number at `cursor` (leading spaces skipped), advances past it
  static bool parseNumber(const char*& cursor, const int base, uint32_t& out) {
    while (*cursor == ' ') ++cursor;
    if (*cursor < '0' || *cursor > '9') return false;

    errno = 0;
    char* end = nullptr;
    const unsigned long value = std::strtoul(cursor, &end, base);
    if (end == cursor || errno == ERANGE || value > UINT32_MAX) return false;

    out = static_cast<uint32_t>(value);
    cursor = end;
    return true;
  }
};

#endif // CONSOLE_COMMAND_H
