#pragma once

/// @file txcopy.h
/// Umbrella header for the txcopy C++ API.

#include "error.h"
#include "types.h"
#include "log.h"
#include "process.h"
#include "tools.h"
#include "context.h"
#include "copy_step.h"
#include "trash.h"
#include "json.h"
#include "registry.h"
#include "transaction.h"
