/**
 * @file ModbusLogger.hpp
 * @brief Thread-safe & non-blocking log sink for WizModbus debug output
 */

#pragma once

#include <stdio.h>
#include <string.h>
#include <stdarg.h>
#include <cstdio>
#include <utility>

#ifndef NATIVE_TEST

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <freertos/event_groups.h>

#ifdef ESP_IDF_VERSION
    #include <driver/uart.h>
#endif

// =============================================================================
// LOG DESTINATION & CHUNK SIZE CONFIGURATION
// =============================================================================

// Default log destination (add user define flag to override)
#ifndef WIZMODBUS_LOG_OUTPUT
    #ifdef ESP_IDF_VERSION
        #define WIZMODBUS_LOG_OUTPUT UART_NUM_0
    #endif
#endif

#ifndef WIZMODBUS_LOG_CHUNK_SIZE
    #define WIZMODBUS_LOG_CHUNK_SIZE 128
#endif

#ifndef WIZMODBUS_LOG_FLUSH
    #ifdef ESP_IDF_VERSION
        #define WIZMODBUS_LOG_FLUSH() uart_wait_tx_done(WIZMODBUS_LOG_OUTPUT, pdMS_TO_TICKS(500))
    #else
        #define WIZMODBUS_LOG_FLUSH() fflush(stdout)
    #endif
#endif

#endif // NATIVE_TEST

namespace WizModbus {

#ifndef NATIVE_TEST

class Logger {

public:
    static constexpr size_t QUEUE_SIZE = 16;
    static constexpr size_t MAX_MSG_SIZE = 256;
    static constexpr size_t TASK_PRIORITY = 1;
    static constexpr uint32_t STACK_SIZE = 4096;
    static constexpr uint32_t CHECK_INTERVAL_MS = 100;

    static constexpr EventBits_t QUEUE_EMPTY_BIT = BIT0;

    struct LogMessage {
        char msg[MAX_MSG_SIZE];
    };

    // Lazily called by the first log message
    static void begin() {
        if (!initialized) {
            logQueue = xQueueCreate(QUEUE_SIZE, sizeof(LogMessage));
            queueEventGroup = xEventGroupCreate();

            BaseType_t taskCreated = xTaskCreatePinnedToCore(
                logTask,
                "WizLogTask",
                STACK_SIZE,
                NULL,
                TASK_PRIORITY,
                &logTaskHandle,
                1
            );

            if (logQueue && queueEventGroup && taskCreated == pdPASS) {
                xEventGroupSetBits(queueEventGroup, QUEUE_EMPTY_BIT);
                initialized = true;
            }
        }
    }

    static void logln(const char* message = "") {
        char buffer[MAX_MSG_SIZE];
        if (*message == '\0') {
            strcpy(buffer, "\r\n");
        } else {
            snprintf(buffer, sizeof(buffer), "%s\r\n", message);
        }
        sendToQueue(buffer);
    }

    template<typename... Args>
    static void logf(const char* format, Args&&... args) {
        char buffer[MAX_MSG_SIZE];
        int len = snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
        if (len < 0) return;

        if (len >= (int)MAX_MSG_SIZE) {
            len = MAX_MSG_SIZE - 1;
            buffer[len] = '\0';
            buffer[MAX_MSG_SIZE - 5] = '.';
            buffer[MAX_MSG_SIZE - 4] = '.';
            buffer[MAX_MSG_SIZE - 3] = '.';
        }

        // Exactly one trailing newline per message
        while (len > 0 && (buffer[len - 1] == '\n' || buffer[len - 1] == '\r')) {
            buffer[--len] = '\0';
        }
        if (len < (int)MAX_MSG_SIZE - 2) {
            buffer[len] = '\n';
            buffer[len + 1] = '\0';
        } else {
            buffer[MAX_MSG_SIZE - 2] = '\n';
            buffer[MAX_MSG_SIZE - 1] = '\0';
        }

        sendToQueue(buffer);
    }

    // Block until every queued message has been written out
    static void waitQueueFlushed() {
        if (!initialized) return;

        xEventGroupWaitBits(
            queueEventGroup,
            QUEUE_EMPTY_BIT,
            pdFALSE,  // Don't clear the bit
            pdTRUE,
            portMAX_DELAY
        );

        WIZMODBUS_LOG_FLUSH();
    }

private:
    inline static bool initialized = false;
    inline static QueueHandle_t logQueue = nullptr;
    inline static TaskHandle_t logTaskHandle = nullptr;
    inline static EventGroupHandle_t queueEventGroup = nullptr;

    static void sendToQueue(const char* message) {
        if (!initialized) begin();
        if (!initialized) return;

        LogMessage msg;
        strncpy(msg.msg, message, MAX_MSG_SIZE - 1);
        msg.msg[MAX_MSG_SIZE - 1] = '\0';

        xEventGroupClearBits(queueEventGroup, QUEUE_EMPTY_BIT);
        xQueueSend(logQueue, &msg, 0); // Message dropped if the queue is full
    }

    static void logTask(void* parameter) {
        LogMessage msg;
        while (true) {
            if (xQueueReceive(logQueue, &msg, pdMS_TO_TICKS(CHECK_INTERVAL_MS)) == pdTRUE) {
                writeOutput(msg.msg, strlen(msg.msg));

                if (uxQueueMessagesWaiting(logQueue) == 0) {
                    xEventGroupSetBits(queueEventGroup, QUEUE_EMPTY_BIT);
                }
            }
            vTaskDelay(pdMS_TO_TICKS(5));
        }
    }

// =============================================================================
// PLATFORM-SPECIFIC IMPLEMENTATIONS OF writeOutput()
// =============================================================================

    #if defined(ESP_IDF_VERSION)
        static void writeOutput(const char* data, size_t len) {
            const char* ptr = data;
            size_t remaining = len;

            while (remaining > 0) {
                size_t chunk = (remaining > WIZMODBUS_LOG_CHUNK_SIZE) ? WIZMODBUS_LOG_CHUNK_SIZE : remaining;
                int written = uart_write_bytes(WIZMODBUS_LOG_OUTPUT, ptr, chunk);

                if (written <= 0) {
                    vTaskDelay(pdMS_TO_TICKS(5)); // UART TX buffer full
                    continue;
                }

                ptr += written;
                remaining -= written;

                if (remaining > 0) {
                    vTaskDelay(pdMS_TO_TICKS(1));
                }
            }
        }

    #else
        static void writeOutput(const char* data, size_t len) {
            printf("%.*s", (int)len, data);
        }

    #endif
};

#else // NATIVE_TEST

/* @brief Synchronous stdout sink used by host builds (no scheduler available)
 */
class Logger {
public:
    template<typename... Args>
    static void logf(const char* format, Args&&... args) {
        printf(format, std::forward<Args>(args)...);
        size_t n = strlen(format);
        if (n == 0 || format[n - 1] != '\n') printf("\n");
    }

    static void logln(const char* message = "") {
        printf("%s\n", message);
    }

    static void waitQueueFlushed() {
        fflush(stdout);
    }
};

#endif // NATIVE_TEST

} // namespace WizModbus
