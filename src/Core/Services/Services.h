#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "ICache.h"
#include "IDecision.h"
#include "IDurableStore.h"
#include "IEnvironment.h"
#include "IEventBus.h"
#include "IGateway.h"
#include "IIrrigationScheduler.h"
#include "ILogger.h"
#include "IPump.h"
