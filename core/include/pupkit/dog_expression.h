#pragma once

/**
 * @file dog_expression.h
 * @brief Facial expression derived from the animation state
 */

#include <pupkit/dog_animation_state.h>

namespace pupkit {

/**
 * @brief Facial expression
 *
 * Never stored on its own. Always obtained from expressionFromState().
 */
enum class DogExpression {
    Neutral,
    Happy,
    Excited,
    Curious,
    Loving,
    Sleepy
};

/**
 * @brief Constant face parameters of an expression
 */
struct ExpressionTraits {
    float eyeScale;        ///< Multiplier on the base eye radius
    float mouthOpenness;   ///< 0 = closed smile, 1 = wide open
    bool eyesOpen;
    bool showsTongue;
    bool showsBlush;
};

/// @brief Face parameters for an expression
const ExpressionTraits& traits(DogExpression expression);

/// @brief Total mapping from animation state to expression
DogExpression expressionFromState(DogAnimationState state);

const char* expressionName(DogExpression expression);

} // namespace pupkit
