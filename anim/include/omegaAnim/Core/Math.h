#include "Core.h"

#include <cmath>

#ifndef OMEGAANIM_CORE_MATH_H
#define OMEGAANIM_CORE_MATH_H

namespace OmegaAnim {

    inline float lerp(float a,float b,float t){
        return a + ((b - a) * t);
    }

    inline double lerp(double a,double b,float t){
        return a + ((b - a) * double(t));
    }

    inline float clamp01(float v){
        return std::clamp(v,0.f,1.f);
    }

    struct OMEGAANIM_EXPORT Vec2 {
        float x = 0.f,y = 0.f;

        Vec2 operator+(const Vec2 & rhs) const { return {x + rhs.x,y + rhs.y}; }
        Vec2 operator-(const Vec2 & rhs) const { return {x - rhs.x,y - rhs.y}; }
        Vec2 operator*(float s) const { return {x * s,y * s}; }
        Vec2 & operator+=(const Vec2 & rhs){ x += rhs.x; y += rhs.y; return *this; }
        bool operator==(const Vec2 & rhs) const { return x == rhs.x && y == rhs.y; }
        bool operator!=(const Vec2 & rhs) const { return !(*this == rhs); }
    };

    struct OMEGAANIM_EXPORT Vec3 {
        float x = 0.f,y = 0.f,z = 0.f;

        Vec3 operator+(const Vec3 & rhs) const { return {x + rhs.x,y + rhs.y,z + rhs.z}; }
        Vec3 operator-(const Vec3 & rhs) const { return {x - rhs.x,y - rhs.y,z - rhs.z}; }
        Vec3 operator*(float s) const { return {x * s,y * s,z * s}; }
        Vec3 & operator+=(const Vec3 & rhs){ x += rhs.x; y += rhs.y; z += rhs.z; return *this; }
        bool operator==(const Vec3 & rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
        bool operator!=(const Vec3 & rhs) const { return !(*this == rhs); }
        float length() const;
    };

    /// @brief A unit quaternion describing a 3D rotation.
    /// Composition is multiplication; `a * b` applies `b` first, then `a`.
    struct OMEGAANIM_EXPORT Quat {
        float x = 0.f,y = 0.f,z = 0.f,w = 1.f;

        static Quat Identity();
        static Quat FromAxisAngle(const Vec3 & axis,float radians);
        static Quat FromRotationZ(float radians);

        Quat operator*(const Quat & rhs) const;
        float dot(const Quat & rhs) const;
        Quat inverse() const;
        Quat normalized() const;
        /// @brief Spherical interpolation along the shortest arc.
        Quat slerp(const Quat & rhs,float t) const;
        Vec3 rotate(const Vec3 & v) const;
        /// @returns The rotation angle in radians, in [0, 2pi).
        float angle() const;
        /// @brief Component-wise comparison that treats `q` and `-q` as the same rotation.
        bool approxEquals(const Quat & rhs,float epsilon = 1e-5f) const;
    };

    /// @brief A linear (non premultiplied) RGBA color.
    struct OMEGAANIM_EXPORT Color {
        float r = 0.f,g = 0.f,b = 0.f,a = 0.f;

        static Color Rgba(float r,float g,float b,float a = 1.f);
        static Color Rgb8(std::uint8_t r,std::uint8_t g,std::uint8_t b);

        bool operator==(const Color & rhs) const { return r == rhs.r && g == rhs.g && b == rhs.b && a == rhs.a; }
        bool operator!=(const Color & rhs) const { return !(*this == rhs); }
    };

    /// @brief An audio volume, either a linear amplitude or a level in decibels.
    struct OMEGAANIM_EXPORT Volume {
        enum class Unit : std::uint8_t {
            Linear,
            Decibels
        } unit = Unit::Linear;
        float value = 1.f;

        /// Lowest representable level; anything quieter is silence.
        static constexpr float SilenceDb = -96.f;

        static Volume Linear(float amplitude);
        static Volume Decibels(float db);

        /// @returns The level in decibels, floored at SilenceDb.
        float decibels() const;
        /// @returns The linear amplitude.
        float linear() const;
        bool approxEquals(const Volume & rhs,float epsilon = 1e-4f) const;
    };

}

#endif
