#pragma once

// Pupkit - Main header
// Include this in a host application

#include <pupkit/color.h>
#include <pupkit/breed_skeleton.h>
#include <pupkit/breed_registry.h>
#include <pupkit/dog_animation_state.h>
#include <pupkit/dog_expression.h>
#include <pupkit/dog_bone_transform.h>
#include <pupkit/dog_animation_controller.h>
#include <pupkit/dog_interaction_controller.h>
#include <pupkit/canvas.h>
#include <pupkit/dog_body_painter.h>
#include <pupkit/shadow_painter.h>
#include <pupkit/companion.h>
#include <pupkit/gesture_script.h>
#include <pupkit/image_writer.h>

namespace pupkit {

#define PUPKIT_VERSION_MAJOR 0
#define PUPKIT_VERSION_MINOR 1
#define PUPKIT_VERSION_PATCH 0

inline const char* version() { return "0.1.0"; }

} // namespace pupkit
