// Dog Body Painter
// Outline-then-fill layered rendering driven by BreedSkeleton and DogExpression

#include <pupkit/dog_body_painter.h>
#include <pupkit/canvas.h>
#include <pupkit/color.h>
#include <algorithm>
#include <cmath>

namespace pupkit {

namespace {

constexpr float PI = 3.14159265358979323846f;
constexpr float TAU = 2.0f * PI;

const Color kOutline = Color::fromHex(0x1A1A1A);
const Color kIris = Color::fromHex(0x4A2800);
const Color kPupil = Color::fromHex(0x0A0A0A);
const Color kFaceLine = Color::fromHex(0x2C1A00);
const Color kMouthFill = Color::fromHex(0x8B1A1A).withAlpha(0.85f);
const Color kTongue = Color::fromHex(0xE8607A);
const Color kTongueCrease = Color::fromHex(0xC04060);
const Color kBlush = Color::fromHex(0xFF9999).withAlpha(0.45f);
const Color kSaddle = Color::fromHex(0x1A1A1A).withAlpha(0.70f);

// Spot layout as fractions of (torsoW, torsoH) around the torso center
const glm::vec3 kSpots[] = {
    { 0.30f, -0.18f, 0.10f},
    { 0.08f, -0.28f, 0.08f},
    {-0.12f, -0.10f, 0.11f},
    {-0.32f, -0.22f, 0.07f},
    { 0.20f,  0.08f, 0.07f},
    {-0.26f,  0.12f, 0.09f},
    {-0.02f,  0.22f, 0.06f},
};

void ovalPath(Canvas& c, float cx, float cy, float w, float h) {
    c.beginPath();
    c.ellipse(cx, cy, w * 0.5f, h * 0.5f, 0.0f, 0.0f, TAU);
    c.closePath();
}

void roundRectPath(Canvas& c, float x, float y, float w, float h, float r) {
    c.beginPath();
    c.roundRect(x, y, w, h, r);
}

// Outline pass then fill pass on the current path
void outlineAndFill(Canvas& c, float outlineW, const glm::vec4& fill) {
    c.strokeStyle(kOutline);
    c.lineWidth(outlineW);
    c.lineJoin(LineJoin::Round);
    c.lineCap(LineCap::Round);
    c.stroke();
    c.fillStyle(fill);
    c.fill();
}

void outlineAndFill(Canvas& c, float outlineW, const CanvasGradient& fill) {
    c.strokeStyle(kOutline);
    c.lineWidth(outlineW);
    c.lineJoin(LineJoin::Round);
    c.lineCap(LineCap::Round);
    c.stroke();
    c.fillStyle(fill);
    c.fill();
}

void fillPath(Canvas& c, const glm::vec4& color) {
    c.fillStyle(color);
    c.fill();
}

void strokeLine(Canvas& c, glm::vec2 a, glm::vec2 b, float width, const glm::vec4& color) {
    c.beginPath();
    c.moveTo(a.x, a.y);
    c.lineTo(b.x, b.y);
    c.strokeStyle(color);
    c.lineWidth(width);
    c.lineCap(LineCap::Round);
    c.stroke();
}

// Highlight toward the upper front of a box centered on the local origin
CanvasGradient bodyGradient(Canvas& c, const Color& base, const BodyMetrics& m) {
    float boxW = m.torsoW * 1.5f;
    float boxH = m.torsoH * 1.5f;
    glm::vec2 center(0.35f * boxW * 0.5f, -0.45f * boxH * 0.5f);
    float radius = 0.85f * std::min(boxW, boxH);

    auto gradient = c.createRadialGradient(center.x, center.y, 0.0f, center.x, center.y, radius);
    gradient.addColorStop(0.0f, base.highlight());
    gradient.addColorStop(1.0f, base);
    return gradient;
}

} // namespace

// -------------------------------------------------------------------------
// Metrics
// -------------------------------------------------------------------------

BodyMetrics BodyMetrics::compute(const glm::vec2& size, const BreedSkeleton& s) {
    BodyMetrics m;
    float ref = size.y * s.heightScale;
    m.torsoH = ref * 0.32f;
    m.torsoW = m.torsoH * s.torsoAspectRatio;
    m.legLen = ref * s.legLengthRatio * 1.1f;
    m.legThick = m.torsoW * s.legThicknessRatio * 0.30f;
    m.headR = m.torsoH * s.headSizeRatio * 0.60f;
    m.earW = m.headR * 0.50f;
    m.earH = m.headR * s.earHeightRatio;
    m.tailLen = m.torsoH * s.tailLengthRatio * 1.5f;
    m.muzzleW = m.headR * (s.hasFlatFace ? 0.60f : 0.55f + 0.55f * s.snoutLengthRatio);
    m.outlineW = std::clamp(size.x * 0.018f, 2.5f, 5.0f);
    m.offsetScale = size.y / 200.0f;

    // Extents around the torso center, with room for swinging legs and tail
    float above = std::max(m.torsoH * 0.32f + m.headR * 1.55f + std::max(m.earH, m.headR * 0.75f),
                           m.torsoH * 0.05f + m.tailLen * 1.15f);
    float below = m.torsoH * 0.40f + m.legLen * 1.04f + m.legThick * 0.9f;
    float front = std::max(m.torsoW * 0.36f + m.headR * 1.5f, m.torsoW * 0.25f + m.legLen * 0.75f);
    float rear = std::max(m.torsoW * 0.50f + m.tailLen * 1.05f, m.torsoW * 0.28f + m.legLen * 0.75f) +
                 m.legThick;

    // Ground sits above the bottom edge by the deepest crouch; the top keeps
    // room for the highest bounce
    m.groundY = size.y - 10.0f * m.offsetScale;
    float top = size.y * 0.04f + 8.0f * m.offsetScale;
    float fitV = (m.groundY - top - m.outlineW) / (above + below);
    float fitH = (size.x * 0.46f - m.outlineW) / std::max(front, rear);
    m.fit = std::clamp(std::min(fitV, fitH), 0.0f, 1.0f);

    m.torsoH *= m.fit;
    m.torsoW *= m.fit;
    m.legLen *= m.fit;
    m.legThick *= m.fit;
    m.headR *= m.fit;
    m.earW *= m.fit;
    m.earH *= m.fit;
    m.tailLen *= m.fit;
    m.muzzleW *= m.fit;
    m.reachBelow = below * m.fit;
    return m;
}

// -------------------------------------------------------------------------
// Painter
// -------------------------------------------------------------------------

DogBodyPainter::DogBodyPainter(const BreedSkeleton& skeleton, const DogBoneTransform& transform,
                               DogExpression expression)
    : m_skeleton(&skeleton)
    , m_transform(transform)
    , m_expression(expression) {}

bool DogBodyPainter::shouldRepaint(const DogBodyPainter& old) const {
    return old.m_expression != m_expression ||
           old.m_transform != m_transform ||
           (old.m_skeleton != m_skeleton && *old.m_skeleton != *m_skeleton);
}

void DogBodyPainter::paint(Canvas& canvas, const glm::vec2& size) const {
    if (!(size.x > 0.0f) || !(size.y > 0.0f)) {
        return;
    }
    BodyMetrics m = BodyMetrics::compute(size, *m_skeleton);
    const DogBoneTransform& t = m_transform;

    canvas.save();

    // The model is authored with the head toward +x
    if (!t.isFacingRight) {
        canvas.flipHorizontal(size.x);
    }

    float cx = size.x * 0.5f;
    float cy = m.groundY - m.reachBelow - t.verticalOffset * m.offsetScale;
    canvas.translate(cx, cy);
    canvas.rotate(-t.torsoAngle);

    // Far-side legs
    drawLeg(canvas, m, t.backLeftLegAngle, t.backLeftKneeAngle, m.torsoW * 0.28f, true);
    drawLeg(canvas, m, t.backRightLegAngle, t.backRightKneeAngle, -m.torsoW * 0.28f, true);

    drawTorso(canvas, m);
    drawTail(canvas, m);
    drawHead(canvas, m);

    // Near-side legs
    drawLeg(canvas, m, t.frontLeftLegAngle, t.frontLeftKneeAngle, m.torsoW * 0.25f, false);
    drawLeg(canvas, m, t.frontRightLegAngle, t.frontRightKneeAngle, -m.torsoW * 0.25f, false);

    canvas.restore();
}

// -------------------------------------------------------------------------
// Legs
// -------------------------------------------------------------------------

void DogBodyPainter::drawLeg(Canvas& canvas, const BodyMetrics& m, float angle, float kneeAngle,
                             float offsetX, bool isBack) const {
    float depth = isBack ? kDepthMultiplier : 1.0f;
    Color legColor = m_skeleton->primaryColor.scaled(depth);
    float outlineW = m.outlineW * depth;

    float upperLen = m.legLen * 0.52f;
    float lowerLen = m.legLen * 0.52f;
    float upperW = m.legThick * depth;
    float lowerW = upperW * 0.88f;

    canvas.save();
    canvas.translate(offsetX, m.torsoH * 0.40f);
    canvas.rotate(-angle);

    // Upper leg capsule
    roundRectPath(canvas, -upperW * 0.5f, 0.0f, upperW, upperLen, upperW * 0.5f);
    outlineAndFill(canvas, outlineW, legColor);

    // Lower leg
    canvas.translate(0.0f, upperLen);
    canvas.rotate(-kneeAngle);
    roundRectPath(canvas, -lowerW * 0.5f, 0.0f, lowerW, lowerLen, lowerW * 0.5f);
    outlineAndFill(canvas, outlineW, legColor);

    if (m_skeleton->hasPoodleFuzz) {
        // Pom at the ankle
        ovalPath(canvas, 0.0f, lowerLen * 0.78f, lowerW * 1.9f, lowerW * 1.5f);
        outlineAndFill(canvas, outlineW, m_skeleton->primaryColor.lighter(0.06f).scaled(depth));
    }

    canvas.translate(0.0f, lowerLen);
    drawPaw(canvas, m, depth, outlineW);

    canvas.restore();
}

void DogBodyPainter::drawPaw(Canvas& canvas, const BodyMetrics& m, float depth, float outlineW) const {
    float pr = m.legThick * depth * 0.75f;
    ovalPath(canvas, 0.0f, pr * 0.3f, pr * 2.2f, pr * 1.6f);
    outlineAndFill(canvas, outlineW, m_skeleton->secondaryColor.scaled(depth));

    Color toe = m_skeleton->accentColor.withAlpha(0.35f);
    for (float dx : {-pr * 0.40f, 0.0f, pr * 0.40f}) {
        strokeLine(canvas, {dx, 0.0f}, {dx, pr * 0.9f}, outlineW * 0.5f, toe);
    }
}

// -------------------------------------------------------------------------
// Torso
// -------------------------------------------------------------------------

void DogBodyPainter::drawTorso(Canvas& canvas, const BodyMetrics& m) const {
    roundRectPath(canvas, -m.torsoW * 0.5f, -m.torsoH * 0.5f, m.torsoW, m.torsoH, m.torsoH * 0.46f);
    outlineAndFill(canvas, m.outlineW, bodyGradient(canvas, m_skeleton->primaryColor, m));

    // Belly patch
    ovalPath(canvas, 0.0f, m.torsoH * 0.18f, m.torsoW * 0.60f, m.torsoH * 0.55f);
    fillPath(canvas, m_skeleton->secondaryColor);

    drawMarkings(canvas, m);
}

void DogBodyPainter::drawMarkings(Canvas& canvas, const BodyMetrics& m) const {
    const BreedSkeleton& s = *m_skeleton;

    if (s.breedId == "germanShepherd") {
        // Dark saddle across the back
        ovalPath(canvas, 0.0f, -m.torsoH * 0.05f, m.torsoW * 0.75f, m.torsoH * 0.55f);
        fillPath(canvas, kSaddle);
    }

    if (s.hasSpots) {
        canvas.fillStyle(s.accentColor);
        for (const auto& spot : kSpots) {
            canvas.fillCircle(spot.x * m.torsoW, spot.y * m.torsoH, spot.z * m.torsoW);
        }
    }

    if (s.hasPoodleFuzz) {
        // Chest ruff at the front of the torso
        ovalPath(canvas, m.torsoW * 0.40f, -m.torsoH * 0.05f, m.torsoH * 0.85f, m.torsoH * 0.95f);
        outlineAndFill(canvas, m.outlineW, s.primaryColor.lighter(0.06f));
    }
}

// -------------------------------------------------------------------------
// Tail
// -------------------------------------------------------------------------

void DogBodyPainter::drawTail(Canvas& canvas, const BodyMetrics& m) const {
    const BreedSkeleton& s = *m_skeleton;

    canvas.save();
    canvas.translate(-m.torsoW * 0.47f, -m.torsoH * 0.05f);
    canvas.rotate(-m_transform.tailAngle + (s.tailCurledOverBack ? PI * 0.55f : -PI * 0.12f));

    float L = m.tailLen;
    glm::vec2 tip;
    canvas.beginPath();
    canvas.moveTo(0.0f, 0.0f);
    if (s.tailCurledOverBack) {
        canvas.bezierCurveTo(-L * 0.5f, -L * 0.6f, -L * 0.8f, -L, 0.0f, -L * 1.1f);
        tip = {0.0f, -L * 1.1f};
    } else {
        canvas.quadraticCurveTo(-L * 0.3f, -L * 0.5f, L * 0.1f, -L);
        tip = {L * 0.1f, -L};
    }

    canvas.lineCap(LineCap::Round);
    canvas.lineJoin(LineJoin::Round);
    canvas.strokeStyle(kOutline);
    canvas.lineWidth(m.legThick + m.outlineW * 1.4f);
    canvas.stroke();
    canvas.strokeStyle(s.primaryColor);
    canvas.lineWidth(m.legThick);
    canvas.stroke();

    if (s.breedId == "goldenRetriever") {
        // Feathered plume
        canvas.strokeStyle(s.primaryColor.withAlpha(0.55f));
        canvas.lineWidth(m.legThick * 1.6f);
        canvas.stroke();
    }

    if (s.hasPoodleFuzz) {
        float r = m.legThick * 1.1f;
        ovalPath(canvas, tip.x, tip.y, r * 2.0f, r * 2.0f);
        outlineAndFill(canvas, m.outlineW, s.primaryColor.lighter(0.06f));
    }

    canvas.restore();
}

// -------------------------------------------------------------------------
// Head
// -------------------------------------------------------------------------

void DogBodyPainter::drawHead(Canvas& canvas, const BodyMetrics& m) const {
    const BreedSkeleton& s = *m_skeleton;

    canvas.save();
    canvas.translate(m.torsoW * 0.36f, -m.torsoH * 0.32f);
    canvas.rotate(0.12f - m_transform.headAngle);

    glm::vec2 hc(0.0f, -m.headR * 0.90f);

    drawEar(canvas, m, hc, -1.0f, true);

    ovalPath(canvas, hc.x, hc.y, m.headR * 2.0f, m.headR * 2.0f);
    outlineAndFill(canvas, m.outlineW, bodyGradient(canvas, s.primaryColor, m));

    if (s.hasPoodleFuzz) {
        // Topknot
        ovalPath(canvas, hc.x - m.headR * 0.10f, hc.y - m.headR * 0.95f, m.headR * 1.10f, m.headR * 0.80f);
        outlineAndFill(canvas, m.outlineW, s.primaryColor.lighter(0.06f));
    }
    if (s.hasSpots) {
        canvas.fillStyle(s.accentColor);
        canvas.fillCircle(hc.x - m.headR * 0.45f, hc.y - m.headR * 0.35f, m.headR * 0.16f);
    }

    drawMuzzle(canvas, m, hc);
    drawFace(canvas, m, hc);

    drawEar(canvas, m, hc, 1.0f, false);

    canvas.restore();
}

void DogBodyPainter::drawEar(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc,
                             float side, bool far) const {
    const BreedSkeleton& s = *m_skeleton;
    float depth = far ? kDepthMultiplier : 1.0f;
    float outlineW = m.outlineW * 0.8f * depth;
    Color coat = s.primaryColor.scaled(depth);

    canvas.save();
    // Near ear sits toward the back of the skull so it does not cover the eyes
    float earX = far ? hc.x + m.headR * 0.40f : hc.x - m.headR * 0.55f;
    canvas.translate(earX, hc.y - m.headR * 0.65f);

    if (s.earsFloppy) {
        canvas.rotate(side * 0.20f);
        ovalPath(canvas, 0.0f, m.earH * 0.30f, m.earW, m.earH);
        outlineAndFill(canvas, outlineW, coat);
        ovalPath(canvas, 0.0f, m.earH * 0.35f, m.earW * 0.55f, m.earH * 0.60f);
        fillPath(canvas, s.accentColor.withAlpha(0.25f));
    } else {
        canvas.rotate(side * 0.08f);
        canvas.beginPath();
        canvas.moveTo(0.0f, -m.earH);
        canvas.lineTo(-m.earW * 0.50f, 0.0f);
        canvas.lineTo(m.earW * 0.50f, 0.0f);
        canvas.closePath();
        outlineAndFill(canvas, outlineW, coat);

        canvas.beginPath();
        canvas.moveTo(0.0f, -m.earH * 0.75f);
        canvas.lineTo(-m.earW * 0.30f, -m.earH * 0.05f);
        canvas.lineTo(m.earW * 0.30f, -m.earH * 0.05f);
        canvas.closePath();
        fillPath(canvas, s.accentColor.withAlpha(0.30f));
    }

    canvas.restore();
}

void DogBodyPainter::drawMuzzle(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc) const {
    const BreedSkeleton& s = *m_skeleton;

    glm::vec2 center(hc.x + m.headR * 0.52f, hc.y + m.headR * 0.10f);
    float w = m.muzzleW;
    float h = w * 0.65f;

    ovalPath(canvas, center.x, center.y, w, h);
    outlineAndFill(canvas, m.outlineW * 0.7f, s.secondaryColor);

    if (s.hasFlatFace) {
        // Wrinkle above the nose
        canvas.beginPath();
        canvas.moveTo(center.x - w * 0.30f, center.y - h * 0.55f);
        canvas.quadraticCurveTo(center.x, center.y - h * 0.80f, center.x + w * 0.30f, center.y - h * 0.55f);
        canvas.strokeStyle(s.accentColor.withAlpha(0.5f));
        canvas.lineWidth(m.outlineW * 0.5f);
        canvas.lineCap(LineCap::Round);
        canvas.stroke();
    }

    // Nose
    ovalPath(canvas, center.x + w * 0.38f, center.y - h * 0.15f, m.headR * 0.28f, m.headR * 0.20f);
    fillPath(canvas, s.accentColor);
}

// -------------------------------------------------------------------------
// Face
// -------------------------------------------------------------------------

void DogBodyPainter::drawFace(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc) const {
    const ExpressionTraits& face = traits(m_expression);
    const BreedSkeleton& s = *m_skeleton;

    // Closed eyes keep the neutral size
    float eyeR = m.headR * 0.22f * (face.eyesOpen ? face.eyeScale : 1.0f);
    glm::vec2 eyes[2] = {
        {hc.x + m.headR * 0.28f, hc.y - m.headR * 0.22f},
        {hc.x - m.headR * 0.08f, hc.y - m.headR * 0.22f},
    };

    // Eyebrows
    float browRot[2] = {0.0f, 0.0f};
    if (m_expression == DogExpression::Curious) { browRot[0] = 0.25f;   browRot[1] = -0.10f; }
    if (m_expression == DogExpression::Excited) { browRot[0] = -0.15f;  browRot[1] = 0.15f; }
    float browW = eyeR * 1.10f;
    for (int i = 0; i < 2; ++i) {
        canvas.save();
        canvas.translate(eyes[i].x, eyes[i].y - eyeR * 1.6f);
        canvas.rotate(browRot[i]);
        strokeLine(canvas, {-browW * 0.5f, 0.0f}, {browW * 0.5f, 0.0f}, eyeR * 0.30f, s.accentColor);
        canvas.restore();
    }

    for (int i = 0; i < 2; ++i) {
        const glm::vec2& e = eyes[i];
        if (!face.eyesOpen) {
            // Closed lid arc
            canvas.beginPath();
            canvas.moveTo(e.x - eyeR, e.y);
            canvas.quadraticCurveTo(e.x, e.y + eyeR * 0.8f, e.x + eyeR, e.y);
            canvas.strokeStyle(kFaceLine);
            canvas.lineWidth(eyeR * 0.35f);
            canvas.lineCap(LineCap::Round);
            canvas.stroke();
            continue;
        }

        float tilt = 0.0f;
        if (m_expression == DogExpression::Curious) {
            tilt = i == 0 ? -0.15f : 0.08f;
        }

        canvas.save();
        canvas.translate(e.x, e.y);
        canvas.rotate(tilt);

        ovalPath(canvas, 0.0f, 0.0f, eyeR * 2.1f, eyeR * 2.0f);
        fillPath(canvas, Color::White);
        canvas.strokeStyle(kOutline);
        canvas.lineWidth(eyeR * 0.18f);
        canvas.stroke();

        canvas.fillStyle(kIris);
        canvas.fillCircle(0.0f, 0.0f, eyeR * 0.75f);
        canvas.fillStyle(kPupil);
        canvas.fillCircle(-eyeR * 0.05f, eyeR * 0.05f, eyeR * 0.45f);
        canvas.fillStyle(Color::White);
        canvas.fillCircle(eyeR * 0.22f, -eyeR * 0.22f, eyeR * 0.18f);
        if (m_expression == DogExpression::Excited) {
            canvas.fillCircle(-eyeR * 0.18f, -eyeR * 0.30f, eyeR * 0.10f);
        }

        canvas.restore();
    }

    drawMouth(canvas, m, hc);

    if (face.showsTongue) {
        glm::vec2 tc(hc.x + m.headR * 0.22f, hc.y + m.headR * 0.38f);
        float tw = m.headR * 0.32f;
        float th = m.headR * 0.30f;
        ovalPath(canvas, tc.x, tc.y, tw, th);
        fillPath(canvas, kTongue);
        strokeLine(canvas, {tc.x, tc.y - th * 0.25f}, {tc.x, tc.y + th * 0.30f}, tw * 0.12f, kTongueCrease);
    }

    if (face.showsBlush) {
        float br = m.headR * 0.28f;
        canvas.fillStyle(kBlush);
        canvas.fillCircle(hc.x + m.headR * 0.70f, hc.y + m.headR * 0.18f, br);
        canvas.fillCircle(hc.x - m.headR * 0.30f, hc.y + m.headR * 0.18f, br);
    }
}

void DogBodyPainter::drawMouth(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc) const {
    float open = traits(m_expression).mouthOpenness;
    float mouthX = hc.x + m.headR * 0.48f;
    float mouthY = hc.y + m.headR * 0.28f;
    float mouthW = m.headR * 0.55f;

    if (open >= 0.1f) {
        // Open mouth scaled by openness
        canvas.beginPath();
        canvas.moveTo(mouthX, mouthY);
        canvas.quadraticCurveTo(mouthX - mouthW * 0.5f, mouthY + m.headR * (0.15f + open * 0.40f),
                                mouthX - mouthW, mouthY);
        canvas.quadraticCurveTo(mouthX - mouthW * 0.5f, mouthY + m.headR * (0.05f + open * 0.35f),
                                mouthX, mouthY);
        canvas.closePath();
        fillPath(canvas, kMouthFill);
    }

    float dip = open < 0.1f ? 0.14f : 0.15f + open * 0.40f;
    canvas.beginPath();
    canvas.moveTo(mouthX, mouthY);
    canvas.quadraticCurveTo(mouthX - mouthW * 0.5f, mouthY + m.headR * dip, mouthX - mouthW, mouthY);
    canvas.strokeStyle(kFaceLine);
    canvas.lineWidth(m.headR * 0.10f);
    canvas.lineCap(LineCap::Round);
    canvas.stroke();
}

} // namespace pupkit
