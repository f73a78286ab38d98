// Ember - Emission shape sampling

#include <ember/emitter.h>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace ember {

namespace {

constexpr float kNearZero = 0.0001f;

glm::vec3 rotateX(const glm::vec3& v, float rad) {
    float c = std::cos(rad), s = std::sin(rad);
    return {v.x, v.y * c - v.z * s, v.y * s + v.z * c};
}

glm::vec3 rotateY(const glm::vec3& v, float rad) {
    float c = std::cos(rad), s = std::sin(rad);
    return {v.x * c + v.z * s, v.y, -v.x * s + v.z * c};
}

glm::vec3 rotateZ(const glm::vec3& v, float rad) {
    float c = std::cos(rad), s = std::sin(rad);
    return {v.x * c - v.y * s, v.x * s + v.y * c, v.z};
}

} // namespace

Emitter::Emitter(const EmissionConfig& config, std::mt19937& rng)
    : m_config(config), m_rng(rng) {}

float Emitter::uniform() {
    // 24 random mantissa bits: exactly representable, strictly below 1
    return static_cast<float>(m_rng() >> 8) * (1.0f / 16777216.0f);
}

float Emitter::uniform(float lo, float hi) {
    return lo + (hi - lo) * uniform();
}

int Emitter::pick(int n) {
    std::uniform_int_distribution<int> dist(0, n - 1);
    return dist(m_rng);
}

glm::vec3 Emitter::sample() {
    glm::vec3 p = sampleLocal();
    p = rotate(p);
    return p + translation();
}

glm::vec3 Emitter::sampleLocal() {
    switch (m_config.emissionShape) {
        case EmissionShape::Cube:     return sampleCube();
        case EmissionShape::Sphere:   return sampleSphere();
        case EmissionShape::Square:   return sampleSquare();
        case EmissionShape::Circle:   return sampleCircle();
        case EmissionShape::Cylinder: return sampleCylinder();
        case EmissionShape::Point:
        default:
            return glm::vec3(0.0f);
    }
}

glm::vec3 Emitter::sampleCube() {
    float inner = m_config.innerLength;
    float outer = m_config.outerLength;

    if (inner <= 0.0f) {
        return {(uniform() - 0.5f) * outer,
                (uniform() - 0.5f) * outer,
                (uniform() - 0.5f) * outer};
    }

    // Point on a face of the unit cube, then scaled by a length drawn
    // linearly between inner and outer
    int face = pick(6);
    float u = uniform() - 0.5f;
    float v = uniform() - 0.5f;
    glm::vec3 p;
    switch (face) {
        case 0:  p = {u, v, 0.5f};  break;
        case 1:  p = {u, v, -0.5f}; break;
        case 2:  p = {0.5f, u, v};  break;
        case 3:  p = {-0.5f, u, v}; break;
        case 4:  p = {u, 0.5f, v};  break;
        default: p = {u, -0.5f, v}; break;
    }
    float length = uniform(inner, outer);
    return p * length;
}

glm::vec3 Emitter::sampleSphere() {
    float theta = uniform() * glm::two_pi<float>();
    float phi = std::acos(2.0f * uniform() - 1.0f);
    glm::vec3 dir{std::sin(phi) * std::cos(theta),
                  std::sin(phi) * std::sin(theta),
                  std::cos(phi)};

    float radius;
    if (m_config.innerRadius <= 0.0f) {
        radius = m_config.outerRadius * std::cbrt(uniform());
    } else {
        radius = uniform(m_config.innerRadius, m_config.outerRadius);
    }
    return dir * radius;
}

glm::vec3 Emitter::sampleSquare() {
    float inner = m_config.squareInnerSize;
    float outer = m_config.squareSize;

    if (inner <= 0.0f) {
        return {uniform(-outer, outer), uniform(-outer, outer), 0.0f};
    }

    int side = pick(4);
    float size = uniform(inner, outer);
    float along = uniform(-size, size);
    switch (side) {
        case 0:  return {along, size, 0.0f};
        case 1:  return {size, along, 0.0f};
        case 2:  return {along, -size, 0.0f};
        default: return {-size, along, 0.0f};
    }
}

glm::vec3 Emitter::sampleCircle() {
    float angle = uniform() * glm::two_pi<float>();
    float radius;
    if (m_config.circleInnerRadius <= 0.0f) {
        radius = m_config.circleOuterRadius * std::sqrt(uniform());
    } else {
        radius = uniform(m_config.circleInnerRadius, m_config.circleOuterRadius);
    }
    return {std::cos(angle) * radius, std::sin(angle) * radius, 0.0f};
}

glm::vec3 Emitter::sampleCylinder() {
    float angle = uniform() * glm::two_pi<float>();
    float radius;
    if (m_config.cylinderInnerRadius <= 0.0f) {
        radius = m_config.cylinderOuterRadius * std::sqrt(uniform());
    } else {
        radius = uniform(m_config.cylinderInnerRadius, m_config.cylinderOuterRadius);
    }
    float y = (uniform() - 0.5f) * m_config.cylinderHeight;
    return {std::cos(angle) * radius, y, std::sin(angle) * radius};
}

glm::vec3 Emitter::rotate(const glm::vec3& v) const {
    glm::vec3 r = v;
    if (m_config.shapeRotationX != 0.0f) r = rotateX(r, glm::radians(m_config.shapeRotationX));
    if (m_config.shapeRotationY != 0.0f) r = rotateY(r, glm::radians(m_config.shapeRotationY));
    if (m_config.shapeRotationZ != 0.0f) r = rotateZ(r, glm::radians(m_config.shapeRotationZ));
    return r;
}

glm::vec3 Emitter::inverseRotate(const glm::vec3& v) const {
    glm::vec3 r = v;
    if (m_config.shapeRotationZ != 0.0f) r = rotateZ(r, -glm::radians(m_config.shapeRotationZ));
    if (m_config.shapeRotationY != 0.0f) r = rotateY(r, -glm::radians(m_config.shapeRotationY));
    if (m_config.shapeRotationX != 0.0f) r = rotateX(r, -glm::radians(m_config.shapeRotationX));
    return r;
}

glm::vec3 Emitter::translation() const {
    return {m_config.shapeTranslationX, m_config.shapeTranslationY, m_config.shapeTranslationZ};
}

glm::vec3 Emitter::randomUnitVector() {
    float theta = uniform() * glm::two_pi<float>();
    float phi = std::acos(2.0f * uniform() - 1.0f);
    return {std::sin(phi) * std::cos(theta),
            std::sin(phi) * std::sin(theta),
            std::cos(phi)};
}

glm::vec3 Emitter::direction(const glm::vec3& position) {
    glm::vec3 rel = position - translation();
    float length = glm::length(rel);
    if (length <= kNearZero) {
        return randomUnitVector();
    }

    if (m_config.emissionShape == EmissionShape::Circle &&
        m_config.circleVelocityDirection == VelocityDirection::Tangential) {
        glm::vec3 local = inverseRotate(rel);
        float xy = std::sqrt(local.x * local.x + local.y * local.y);
        if (xy > kNearZero) {
            return rotate(glm::vec3(-local.y / xy, local.x / xy, 0.0f));
        }
    } else if (m_config.emissionShape == EmissionShape::Cylinder &&
               m_config.cylinderVelocityDirection == VelocityDirection::Tangential) {
        glm::vec3 local = inverseRotate(rel);
        float xz = std::sqrt(local.x * local.x + local.z * local.z);
        if (xz > kNearZero) {
            return rotate(glm::vec3(-local.z / xz, 0.0f, local.x / xz));
        }
        // On the axis: any tangent in the XZ plane will do
        float angle = uniform() * glm::two_pi<float>();
        return rotate(glm::vec3(std::cos(angle), 0.0f, std::sin(angle)));
    }

    return rel / length;
}

float Emitter::speed() {
    if (m_config.randomSpeed) {
        return uniform(m_config.minSpeed, m_config.maxSpeed);
    }
    return m_config.particleSpeed;
}

glm::vec3 Emitter::velocity(const glm::vec3& position) {
    glm::vec3 v = direction(position) * speed();
    if (m_config.overrideXVelocity) v.x = m_config.xVelocity;
    if (m_config.overrideYVelocity) v.y = m_config.yVelocity;
    if (m_config.overrideZVelocity) v.z = m_config.zVelocity;
    return v;
}

float Emitter::lifetime() {
    float base = m_config.lifetime;
    return base + (uniform() * 0.4f - 0.2f) * base;
}

glm::vec3 Emitter::color() const {
    return m_config.colorTransitionEnabled ? m_config.startColor : m_config.particleColor;
}

EmittedParticle Emitter::emit() {
    EmittedParticle p;
    p.position = sample();
    p.velocity = velocity(p.position);
    p.color = color();
    p.age = 0.0f;
    p.lifetime = lifetime();
    return p;
}

} // namespace ember
