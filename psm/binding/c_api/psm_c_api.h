#pragma once

// =============================================================================
// FILE: psm/binding/c_api/psm_c_api.h
// BRIEF: Umbrella header for the psm C API
// =============================================================================

#include "psm/binding/c_api/core/core.h"
#include "psm/binding/c_api/core/dense.h"
#include "psm/binding/c_api/binning.h"
#include "psm/binding/c_api/divergence.h"
#include "psm/binding/c_api/modality.h"
#include "psm/binding/c_api/switchy.h"
#include "psm/binding/c_api/io.h"
#include "psm/binding/c_api/threading.h"
