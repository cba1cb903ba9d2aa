/**
 * @file masterhand.h
 * @brief Main API header for MasterHand
 *
 * Include this file to access the gesture state machine and its I/O
 * boundaries.
 */

#ifndef MASTERHAND_H
#define MASTERHAND_H

// Version information
#define MASTERHAND_VERSION_MAJOR 1
#define MASTERHAND_VERSION_MINOR 0
#define MASTERHAND_VERSION_PATCH 0
#define MASTERHAND_VERSION_STRING "1.0.0"

// Core modules
#include "masterhand/core/types.hpp"
#include "masterhand/core/exception.h"
#include "masterhand/core/Logger.hpp"
#include "masterhand/core/config.h"

// Gesture recognition
#include "masterhand/gesture/GestureTypes.hpp"
#include "masterhand/gesture/HandGeometry.hpp"
#include "masterhand/gesture/SnapDetector.hpp"
#include "masterhand/gesture/HandStateStore.hpp"
#include "masterhand/gesture/GestureStateMachine.hpp"

// I/O boundaries
#include "masterhand/io/FramePayloadCodec.hpp"
#include "masterhand/io/FrameSource.hpp"
#include "masterhand/io/EventSink.hpp"
#include "masterhand/io/GesturePipeline.hpp"

#endif // MASTERHAND_H
