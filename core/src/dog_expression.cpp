#include <pupkit/dog_expression.h>

namespace pupkit {

namespace {

//                                         eye    mouth  open   tongue blush
constexpr ExpressionTraits kNeutral   {1.00f, 0.0f,  true,  false, false};
constexpr ExpressionTraits kHappy     {1.05f, 0.7f,  true,  true,  true};
constexpr ExpressionTraits kExcited   {1.25f, 0.9f,  true,  false, false};
constexpr ExpressionTraits kCurious   {1.00f, 0.2f,  true,  false, false};
constexpr ExpressionTraits kLoving    {0.85f, 0.8f,  true,  true,  true};
constexpr ExpressionTraits kSleepy    {0.00f, 0.0f,  false, false, false};

} // namespace

const ExpressionTraits& traits(DogExpression expression) {
    switch (expression) {
        case DogExpression::Neutral: return kNeutral;
        case DogExpression::Happy:   return kHappy;
        case DogExpression::Excited: return kExcited;
        case DogExpression::Curious: return kCurious;
        case DogExpression::Loving:  return kLoving;
        case DogExpression::Sleepy:  return kSleepy;
    }
    return kNeutral;
}

DogExpression expressionFromState(DogAnimationState state) {
    switch (state) {
        case DogAnimationState::Idle:
        case DogAnimationState::Walking:
            return DogExpression::Neutral;
        case DogAnimationState::Sitting:
        case DogAnimationState::TailWag:
            return DogExpression::Happy;
        case DogAnimationState::HeadTilt:
            return DogExpression::Curious;
        case DogAnimationState::Petting:
            return DogExpression::Loving;
        case DogAnimationState::Zoomies:
            return DogExpression::Excited;
        case DogAnimationState::Sleeping:
            return DogExpression::Sleepy;
    }
    return DogExpression::Neutral;
}

const char* expressionName(DogExpression expression) {
    switch (expression) {
        case DogExpression::Neutral: return "neutral";
        case DogExpression::Happy:   return "happy";
        case DogExpression::Excited: return "excited";
        case DogExpression::Curious: return "curious";
        case DogExpression::Loving:  return "loving";
        case DogExpression::Sleepy:  return "sleepy";
    }
    return "neutral";
}

} // namespace pupkit
