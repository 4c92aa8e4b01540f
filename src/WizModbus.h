/**
 * @file WizModbus.h
 * @brief Main include file for the WizModbus library
 */

#pragma once

// Core components
#include "core/ModbusCore.h"
#include "core/ModbusCodec.hpp"

// Drivers
#include "drivers/ModbusHAL_Socket.h"
#ifndef NATIVE_TEST
    #include "drivers/ModbusHAL_W5500.h"
#endif

// Interfaces
#include "interfaces/ModbusArpResolver.h"
#include "interfaces/ModbusConnection.h"

// Application components
#include "apps/ModbusClient.h"
