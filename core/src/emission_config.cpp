// Ember - Emission configuration

#include <ember/emission_config.h>
#include <algorithm>

namespace ember {

namespace {

constexpr float kExtentFloor = 0.0f;
constexpr float kRotationFloor = -360.0f;

void repairPair(float& lower, float& upper, float floor) {
    lower = std::max(lower, floor);
    if (upper - lower < kMinGap) {
        upper = lower + kNudge;
    }
}

} // namespace

const char* shapeName(EmissionShape shape) {
    switch (shape) {
        case EmissionShape::Point:    return "point";
        case EmissionShape::Cube:     return "cube";
        case EmissionShape::Sphere:   return "sphere";
        case EmissionShape::Square:   return "square";
        case EmissionShape::Circle:   return "circle";
        case EmissionShape::Cylinder: return "cylinder";
        default:                      return "point";
    }
}

bool shapeFromName(const std::string& name, EmissionShape& out) {
    if (name == "point")    { out = EmissionShape::Point;    return true; }
    if (name == "cube")     { out = EmissionShape::Cube;     return true; }
    if (name == "sphere")   { out = EmissionShape::Sphere;   return true; }
    if (name == "square")   { out = EmissionShape::Square;   return true; }
    if (name == "circle")   { out = EmissionShape::Circle;   return true; }
    if (name == "cylinder") { out = EmissionShape::Cylinder; return true; }
    return false;
}

const char* directionName(VelocityDirection dir) {
    return dir == VelocityDirection::Tangential ? "tangential" : "radial";
}

bool directionFromName(const std::string& name, VelocityDirection& out) {
    if (name == "radial")     { out = VelocityDirection::Radial;     return true; }
    if (name == "tangential") { out = VelocityDirection::Tangential; return true; }
    return false;
}

const char* rotationModeName(RotationMode mode) {
    return mode == RotationMode::Random ? "random" : "fixed";
}

bool rotationModeFromName(const std::string& name, RotationMode& out) {
    if (name == "fixed")  { out = RotationMode::Fixed;  return true; }
    if (name == "random") { out = RotationMode::Random; return true; }
    return false;
}

void editLowerBound(float& lower, float& upper, float value, float floor) {
    lower = std::max(value, floor);
    if (upper - lower < kMinGap) {
        upper = lower + kNudge;
    }
}

void editUpperBound(float& lower, float& upper, float value, float floor) {
    upper = std::max(value, floor + kMinGap);
    if (upper - lower < kMinGap) {
        lower = std::max(floor, upper - kNudge);
    }
}

uint32_t EmissionConfig::capacity() const {
    return std::clamp<uint32_t>(maxParticles, 1, kMaxCapacity);
}

void EmissionConfig::normalize() {
    repairPair(innerLength, outerLength, kExtentFloor);
    cubeLength = outerLength;
    repairPair(innerRadius, outerRadius, kExtentFloor);
    repairPair(squareInnerSize, squareSize, kExtentFloor);
    repairPair(circleInnerRadius, circleOuterRadius, kExtentFloor);
    repairPair(cylinderInnerRadius, cylinderOuterRadius, kExtentFloor);
    repairPair(minSpeed, maxSpeed, kExtentFloor);
    repairPair(minSize, maxSize, kExtentFloor);
    repairPair(minRotation, maxRotation, kRotationFloor);

    cylinderHeight = std::max(cylinderHeight, 0.0f);
    lifetime = std::max(lifetime, 0.01f);
    emissionRate = std::max(emissionRate, 0.0f);
    emissionDuration = std::max(emissionDuration, 0.0f);
    maxParticles = capacity();
    particleCount = std::clamp(particleCount, 0, static_cast<int>(capacity()));
    opacity = std::clamp(opacity, 0.0f, 1.0f);
}

void EmissionConfig::setInnerLength(float v) {
    editLowerBound(innerLength, outerLength, v, kExtentFloor);
    cubeLength = outerLength;
}

void EmissionConfig::setOuterLength(float v) {
    editUpperBound(innerLength, outerLength, v, kExtentFloor);
    cubeLength = outerLength;
}

void EmissionConfig::setInnerRadius(float v)   { editLowerBound(innerRadius, outerRadius, v, kExtentFloor); }
void EmissionConfig::setOuterRadius(float v)   { editUpperBound(innerRadius, outerRadius, v, kExtentFloor); }
void EmissionConfig::setSquareInnerSize(float v) { editLowerBound(squareInnerSize, squareSize, v, kExtentFloor); }
void EmissionConfig::setSquareSize(float v)    { editUpperBound(squareInnerSize, squareSize, v, kExtentFloor); }
void EmissionConfig::setCircleInnerRadius(float v) { editLowerBound(circleInnerRadius, circleOuterRadius, v, kExtentFloor); }
void EmissionConfig::setCircleOuterRadius(float v) { editUpperBound(circleInnerRadius, circleOuterRadius, v, kExtentFloor); }
void EmissionConfig::setCylinderInnerRadius(float v) { editLowerBound(cylinderInnerRadius, cylinderOuterRadius, v, kExtentFloor); }
void EmissionConfig::setCylinderOuterRadius(float v) { editUpperBound(cylinderInnerRadius, cylinderOuterRadius, v, kExtentFloor); }
void EmissionConfig::setMinSpeed(float v)      { editLowerBound(minSpeed, maxSpeed, v, kExtentFloor); }
void EmissionConfig::setMaxSpeed(float v)      { editUpperBound(minSpeed, maxSpeed, v, kExtentFloor); }
void EmissionConfig::setMinSize(float v)       { editLowerBound(minSize, maxSize, v, kExtentFloor); }
void EmissionConfig::setMaxSize(float v)       { editUpperBound(minSize, maxSize, v, kExtentFloor); }
void EmissionConfig::setMinRotation(float v)   { editLowerBound(minRotation, maxRotation, v, kRotationFloor); }
void EmissionConfig::setMaxRotation(float v)   { editUpperBound(minRotation, maxRotation, v, kRotationFloor); }

} // namespace ember
