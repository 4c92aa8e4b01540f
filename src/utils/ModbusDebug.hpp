/**
 * @file ModbusDebug.hpp
 * @brief WizModbus debug utilities
 */

#pragma once

#include "core/ModbusCore.h"
#include "core/ModbusFrame.hpp"

#ifndef WIZMODBUS_MAX_DEBUG_MSG_SIZE // Maximum length for a formatted debug message (including null terminator)
    #define WIZMODBUS_MAX_DEBUG_MSG_SIZE 256
#endif

namespace WizModbus {
namespace Debug {

/* @brief Context structure to capture call location information
 */
struct CallCtx {
    const char* file;
    const char* function;
    int line;

    CallCtx(const char* f = __builtin_FILE(),
            const char* func = __builtin_FUNCTION(),
            int l = __builtin_LINE())
        : file(f), function(func), line(l) {}
};

constexpr size_t MAX_DEBUG_MSG_SIZE = (size_t)WIZMODBUS_MAX_DEBUG_MSG_SIZE;

} // namespace Debug
} // namespace WizModbus

#ifdef WIZMODBUS_DEBUG

#include "utils/ModbusLogger.hpp"

namespace WizModbus {
namespace Debug {

/* @brief Strip the directories from a __FILE__ path
 * @param path The full path
 * @return Pointer to the filename inside path
 */
inline const char* getBasename(const char* path) {
    const char* basename = path;

    const char* lastSlash = strrchr(path, '/');
    if (lastSlash) basename = lastSlash + 1;

    const char* lastBackslash = strrchr(path, '\\');
    if (lastBackslash && lastBackslash > basename) basename = lastBackslash + 1;

    return basename;
}

/* @brief Log a simple debug message with context information
 * @param message Message to log
 * @param ctx Call context (file, function, line)
 */
inline void LOG_MSG(const char* message = "", CallCtx ctx = CallCtx()) {
    WizModbus::Logger::logf("[%s::%s:%d] %s\n", getBasename(ctx.file), ctx.function, ctx.line, message);
}

/* @brief Format and log a debug message with printf-style formatting
 * @param ctx Call context (file, function, line)
 * @param format Printf-style format string
 * @param args Arguments for the format string
 */
template<typename... Args>
inline void LOG_MSGF_CTX(CallCtx ctx, const char* format, Args&&... args) {
    char buffer[MAX_DEBUG_MSG_SIZE];

    int written = snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
    if (written < 0) return;

    const char* suffix = (written >= static_cast<int>(sizeof(buffer))) ? " ..." : "";

    WizModbus::Logger::logf("[%s::%s:%d] %s%s",
                            getBasename(ctx.file), ctx.function, ctx.line,
                            buffer, suffix);
}

/* @brief Macro to automatically capture call context
 * @param format Printf-style format string
 * @param args Arguments for the format string
 */
#define LOG_MSGF(format, ...) LOG_MSGF_CTX(WizModbus::Debug::CallCtx(), format, ##__VA_ARGS__)

/* @brief Dump an ADU as hex bytes (truncated to one log line)
 * @param bytes The bytes to dump
 * @param ctx Call context (file, function, line)
 */
inline void LOG_HEXDUMP(const ByteBuffer& bytes, CallCtx ctx = CallCtx()) {
    if (bytes.empty()) {
        WizModbus::Logger::logf("[%s::%s:%d] Hexdump:<empty>\n", getBasename(ctx.file), ctx.function, ctx.line);
        return;
    }

    char buffer[MAX_DEBUG_MSG_SIZE];
    size_t idx = 0;

    idx += snprintf(buffer + idx, sizeof(buffer) - idx, "Hexdump: ");

    for (uint8_t b : bytes) {
        if (idx + 4 >= sizeof(buffer)) { // "..." + null terminator
            idx += snprintf(buffer + idx, sizeof(buffer) - idx, "...");
            break;
        }
        idx += snprintf(buffer + idx, sizeof(buffer) - idx, "%02X ", b);
    }

    WizModbus::Logger::logf("[%s::%s:%d] %s", getBasename(ctx.file), ctx.function, ctx.line, buffer);
}

/* @brief Log a Modbus frame with context information
 * @param frame Modbus frame to log
 * @param desc Description of the frame (optional)
 * @param ctx Call context (file, function, line)
 */
inline void LOG_FRAME(const WizModbus::Frame& frame, const char* desc = "", CallCtx ctx = CallCtx()) {
    WizModbus::Logger::logf("[%s::%s:%d] %s:\n", getBasename(ctx.file), ctx.function, ctx.line, desc ? desc : "");

    WizModbus::Logger::logf("> Type           : %s\n", WizModbus::toString(frame.type));
    WizModbus::Logger::logf("> Function code  : 0x%02X (%s)\n", frame.fc, WizModbus::toString(frame.fc));
    WizModbus::Logger::logf("> Unit ID        : %d\n", frame.unitId);
    WizModbus::Logger::logf("> Register Addr  : %d\n", frame.regAddress);
    WizModbus::Logger::logf("> Register Count : %d\n", frame.regCount);

    if (frame.regCount > 0 && frame.exceptionCode == WizModbus::NULL_EXCEPTION) {
        char dataStr[MAX_DEBUG_MSG_SIZE];
        size_t idx = snprintf(dataStr, sizeof(dataStr), "> Data           : ");
        for (size_t i = 0; i < frame.regCount && i < FRAME_DATASIZE; i++) {
            if (idx + 8 >= sizeof(dataStr)) {
                snprintf(dataStr + idx, sizeof(dataStr) - idx, "...");
                break;
            }
            idx += snprintf(dataStr + idx, sizeof(dataStr) - idx, "0x%04X ", frame.data[i]);
        }
        WizModbus::Logger::logf("%s\n", dataStr);
    }

    if (frame.exceptionCode != WizModbus::NULL_EXCEPTION) {
        WizModbus::Logger::logf("> Exception      : 0x%02X (%s)\n", frame.exceptionCode, WizModbus::toString(frame.exceptionCode));
    }
}

} // namespace Debug
} // namespace WizModbus


#else // WIZMODBUS_DEBUG


namespace WizModbus {
namespace Debug {

    // Without WIZMODBUS_DEBUG, the LOG_xxx calls compile to no-op templates
    // (the optimizer drops them entirely)

    template<typename... Args>
    inline void LOG_MSG(Args&&...) {}

    template<typename... Args>
    inline void LOG_HEXDUMP(Args&&...) {}

    template<typename... Args>
    inline void LOG_FRAME(Args&&...) {}

    template<typename... Args>
    inline void LOG_MSGF(Args&&...) {}

} // namespace Debug
} // namespace WizModbus


#endif // WIZMODBUS_DEBUG
