// ============================================================================
// vkguide renderer - Minimal math helpers
// Column-major 4x4 matrices and small vectors laid out exactly like their GLSL
// counterparts so they can be memcpy'd into uniform / storage / push-constant
// memory.
// ============================================================================
#ifndef VKGUIDE_VK_MATH_H
#define VKGUIDE_VK_MATH_H

#include <array>

namespace vkg {

struct float2 { float x{}, y{}; };
struct float3 { float x{}, y{}, z{}; };
struct float4 { float x{}, y{}, z{}, w{}; };
struct float4x4 { std::array<float, 16> m{}; }; // m[col * 4 + row]

static_assert(sizeof(float2) == 8);
static_assert(sizeof(float3) == 12);
static_assert(sizeof(float4) == 16);
static_assert(sizeof(float4x4) == 64);

float3 make_float3(float x, float y, float z);
float3 operator+(const float3& a, const float3& b);
float3 operator-(const float3& a, const float3& b);
float3 operator*(const float3& a, float s);
float3 operator/(const float3& a, float s);
float  dot(const float3& a, const float3& b);
float  length(const float3& a);
float3 normalize(const float3& a); // Zero vector stays zero

float4x4 make_identity();
float4x4 mul(const float4x4& a, const float4x4& b); // a * b
float4x4 make_translation(const float3& t);
float4x4 make_scale(const float3& s);

// Right handed, depth 0..1. Y is not flipped; callers targeting Vulkan
// clip space negate m[5].
float4x4 make_perspective(float fovy_rad, float aspect, float znear, float zfar);

float radians(float degrees);

} // namespace vkg

#endif // VKGUIDE_VK_MATH_H
