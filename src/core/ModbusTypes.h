/**
 * @file ModbusTypes.h
 * @brief Types used across WizModbus library
 */

#pragma once

#include <cstring>
#include <string>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <algorithm>

// Native builds (host tests) provide their own clock & locking primitives
#ifndef NATIVE_TEST

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include "freertos/portmacro.h"

// ===================================================================================
// TIMING MACROS
// ===================================================================================

inline uint32_t TIME_MS()           { return (xTaskGetTickCount() * portTICK_PERIOD_MS); }
inline void WAIT_MS(uint32_t ms)    { vTaskDelay(pdMS_TO_TICKS(ms)); }

// ===================================================================================
// FREERTOS SYNCHRONIZATION
// ===================================================================================

/* @brief RAII wrapper for a FreeRTOS mutex
* @note Offers a try-lock mechanism
*/
class Mutex {
public:
    Mutex() {
        _h = xSemaphoreCreateMutex();
        configASSERT(_h);
    }
    ~Mutex() {
        vSemaphoreDelete(_h);
    }
    // Non-copiable
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    /* @brief Try to lock the mutex
    * @return True if the mutex was locked, false otherwise
    */
    bool tryLock() {
        return xSemaphoreTake(_h, 0) == pdTRUE;
    }

    /* @brief Lock the mutex
    * @param wait The time to wait for the lock (in ticks)
    * @return True if the mutex was locked, false otherwise
    */
    bool lock(TickType_t wait = portMAX_DELAY) {
        return xSemaphoreTake(_h, wait) == pdTRUE;
    }

    /* @brief Unlock the mutex
    */
    void unlock() {
        BaseType_t ok = xSemaphoreGive(_h);
        configASSERT(ok == pdTRUE);
    }

private:
    SemaphoreHandle_t _h;
};


/* @brief RAII wrapper for a FreeRTOS lock (Mutex lock/unlock)
* @param m The Mutex to lock/unlock
* @param wait The time to wait for the lock (in ticks)
 */
class Lock {
public:
    explicit Lock(Mutex& m, TickType_t wait = portMAX_DELAY)
        : _m(m), _locked(_m.lock(wait)) {}

    ~Lock() { if (_locked) _m.unlock(); }

    bool isLocked() const { return _locked; }

private:
    Mutex& _m;
    volatile bool _locked;
};

#else

#include "ModbusNativePort.h"

#endif // NATIVE_TEST


// ===================================================================================
// BYTEBUFFER
// ===================================================================================

/* @brief "Vector-like" minimalistic facade on a raw static buffer
 * @note Used for every ADU that crosses the socket. It doesn't own the
 *       storage, it only references it.
 */
class ByteBuffer {
public:
    ByteBuffer() noexcept
    : _data(nullptr), _size(0), _cap(0) {}

    /* @brief Construct a read/write ByteBuffer.
     * @param ptr The pointer to the buffer.
     * @param capacity The capacity of the buffer.
     */
    ByteBuffer(uint8_t* ptr, size_t capacity) noexcept
        : _data(ptr), _size(0), _cap(capacity) {
        memset(_data, 0, _cap);
    }

    /* @brief Construct a READ-ONLY ByteBuffer.
     * @param ptr The pointer to the buffer.
     * @param size The size of the buffer.
     */
    ByteBuffer(const uint8_t* ptr, size_t size) noexcept
        : _data(const_cast<uint8_t*>(ptr)), _size(size), _cap(size) {
    }

    ByteBuffer(const ByteBuffer&) = delete;
    ByteBuffer& operator=(const ByteBuffer&) = delete;
    ByteBuffer(ByteBuffer&&) noexcept = default;
    ByteBuffer& operator=(ByteBuffer&&) noexcept = default;

    // READ-ONLY ACCESSORS

    const uint8_t* data() const { return _data; }
    size_t         size() const { return _size; }
    size_t     capacity() const { return _cap; }
    bool          empty() const { return _size == 0; }
    size_t   free_space() const { return _cap - _size; }
    const uint8_t& operator[](size_t i) const { return _data[i]; }

    // ITERATORS
    //
    // WARNING: the non-const iterators hand out the raw storage without any
    // capacity management. Reserve first with resize(), write through the
    // pointer (socket receive), then trim() to the number of bytes written.

    uint8_t*       begin()       { return _data; }
    uint8_t*       end()         { return _data + _size; }
    const uint8_t* begin() const { return _data; }
    const uint8_t* end()   const { return _data + _size; }

    // READ-ONLY SLICE

    ByteBuffer slice(size_t offset, size_t length) const {
        if (!_data || offset > _size) return ByteBuffer();
        if (offset + length > _size) length = _size - offset;
        return ByteBuffer(static_cast<const uint8_t*>(_data + offset), length);
    }

    // BASIC WRITING

    void clear() { _size = 0; }
    bool resize(size_t newSize) {
        if (newSize > _cap || !_data) return false;
        if (newSize > _size) memset(_data + _size, 0, newSize - _size);
        _size = newSize;
        return true;
    }
    bool trim(size_t new_size) {
        if (new_size > _cap || !_data) return false;
        if (new_size > _size) return false;
        _size = new_size;
        return true;
    }
    bool push_back(uint8_t b) {
        if (_size >= _cap || !_data) return false;
        _data[_size++] = b;
        return true;
    }
    bool push_back(const uint8_t* buf, size_t len) { // All bytes are written or none
        if (_size + len > _cap || !_data) return false;
        memcpy(_data + _size, buf, len);
        _size += len;
        return true;
    }

    // ARBITRARY POSITION WRITING

    bool write_at(size_t pos, uint8_t b) {
        if (pos >= _cap || !_data) return false;
        _data[pos] = b;
        if (pos >= _size) _size = pos + 1;
        return true;
    }

    // CONSUME THE FIRST N BYTES WHILE KEEPING THE CAPACITY

    bool pop_front(size_t n) {
        if (n > _size) return false;
        if (n) {
            memmove(_data, _data + n, _size - n);
            _size -= n;
        }
        return true;
    }

private:
    uint8_t* _data;
    size_t   _size;
    size_t   _cap;
};
