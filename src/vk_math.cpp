#include "vk_math.h"

#include <cmath>
#include <numbers>

namespace vkg {

float3 make_float3(float x, float y, float z) { return float3{x, y, z}; }
float3 operator+(const float3& a, const float3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
float3 operator-(const float3& a, const float3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
float3 operator*(const float3& a, float s) { return {a.x * s, a.y * s, a.z * s}; }
float3 operator/(const float3& a, float s) { return {a.x / s, a.y / s, a.z / s}; }
float dot(const float3& a, const float3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
float length(const float3& a) { return std::sqrt(dot(a, a)); }

float3 normalize(const float3& a) {
    const float len = length(a);
    return len > 0.0f ? a / len : float3{};
}

float4x4 make_identity() {
    float4x4 r{};
    r.m[0] = r.m[5] = r.m[10] = r.m[15] = 1.0f;
    return r;
}

float4x4 mul(const float4x4& a, const float4x4& b) {
    float4x4 r{};
    for (int c = 0; c < 4; ++c) {
        for (int row = 0; row < 4; ++row) {
            float s = 0.0f;
            for (int k = 0; k < 4; ++k) s += a.m[k * 4 + row] * b.m[c * 4 + k];
            r.m[c * 4 + row] = s;
        }
    }
    return r;
}

float4x4 make_translation(const float3& t) {
    float4x4 r = make_identity();
    r.m[12] = t.x;
    r.m[13] = t.y;
    r.m[14] = t.z;
    return r;
}

float4x4 make_scale(const float3& s) {
    float4x4 r{};
    r.m[0]  = s.x;
    r.m[5]  = s.y;
    r.m[10] = s.z;
    r.m[15] = 1.0f;
    return r;
}

float4x4 make_perspective(float fovy_rad, float aspect, float znear, float zfar) {
    const float f = 1.0f / std::tan(fovy_rad * 0.5f);
    float4x4 r{};
    r.m[0]  = f / aspect;
    r.m[5]  = f;
    r.m[10] = zfar / (znear - zfar);
    r.m[11] = -1.0f;
    r.m[14] = -(zfar * znear) / (zfar - znear);
    return r;
}

float radians(float degrees) { return degrees * std::numbers::pi_v<float> / 180.0f; }

} // namespace vkg
