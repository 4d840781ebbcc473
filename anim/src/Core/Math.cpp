#include "omegaAnim/Core/Math.h"

namespace OmegaAnim {

float Vec3::length() const{
    return std::sqrt((x * x) + (y * y) + (z * z));
}

Quat Quat::Identity(){
    return Quat{0.f,0.f,0.f,1.f};
}

Quat Quat::FromAxisAngle(const Vec3 & axis,float radians){
    float len = axis.length();
    if(len == 0.f){
        return Identity();
    }
    float s = std::sin(radians * 0.5f) / len;
    return Quat{axis.x * s,axis.y * s,axis.z * s,std::cos(radians * 0.5f)};
}

Quat Quat::FromRotationZ(float radians){
    return FromAxisAngle(Vec3{0.f,0.f,1.f},radians);
}

Quat Quat::operator*(const Quat & rhs) const{
    return Quat{
        (w * rhs.x) + (x * rhs.w) + (y * rhs.z) - (z * rhs.y),
        (w * rhs.y) - (x * rhs.z) + (y * rhs.w) + (z * rhs.x),
        (w * rhs.z) + (x * rhs.y) - (y * rhs.x) + (z * rhs.w),
        (w * rhs.w) - (x * rhs.x) - (y * rhs.y) - (z * rhs.z)
    };
}

float Quat::dot(const Quat & rhs) const{
    return (x * rhs.x) + (y * rhs.y) + (z * rhs.z) + (w * rhs.w);
}

Quat Quat::inverse() const{
    float n = dot(*this);
    if(n == 0.f){
        return Identity();
    }
    return Quat{-x / n,-y / n,-z / n,w / n};
}

Quat Quat::normalized() const{
    float n = std::sqrt(dot(*this));
    if(n == 0.f){
        return Identity();
    }
    return Quat{x / n,y / n,z / n,w / n};
}

Quat Quat::slerp(const Quat & rhs,float t) const{
    Quat end = rhs;
    float cosTheta = dot(rhs);
    if(cosTheta < 0.f){
        end = Quat{-rhs.x,-rhs.y,-rhs.z,-rhs.w};
        cosTheta = -cosTheta;
    }

    /// Nearly parallel; fall back to normalized lerp.
    if(cosTheta > 0.9995f){
        Quat out {
            lerp(x,end.x,t),
            lerp(y,end.y,t),
            lerp(z,end.z,t),
            lerp(w,end.w,t)
        };
        return out.normalized();
    }

    float theta = std::acos(std::clamp(cosTheta,-1.f,1.f));
    float sinTheta = std::sin(theta);
    float a = std::sin((1.f - t) * theta) / sinTheta;
    float b = std::sin(t * theta) / sinTheta;
    return Quat{
        (x * a) + (end.x * b),
        (y * a) + (end.y * b),
        (z * a) + (end.z * b),
        (w * a) + (end.w * b)
    };
}

Vec3 Quat::rotate(const Vec3 & v) const{
    Quat p {v.x,v.y,v.z,0.f};
    Quat r = (*this) * p * inverse();
    return Vec3{r.x,r.y,r.z};
}

float Quat::angle() const{
    return 2.f * std::acos(std::clamp(w,-1.f,1.f));
}

bool Quat::approxEquals(const Quat & rhs,float epsilon) const{
    return std::fabs(std::fabs(dot(rhs)) - 1.f) <= epsilon;
}

Color Color::Rgba(float r,float g,float b,float a){
    return Color{r,g,b,a};
}

Color Color::Rgb8(std::uint8_t r,std::uint8_t g,std::uint8_t b){
    return Color{float(r) / 255.f,float(g) / 255.f,float(b) / 255.f,1.f};
}

Volume Volume::Linear(float amplitude){
    return Volume{Unit::Linear,amplitude};
}

Volume Volume::Decibels(float db){
    return Volume{Unit::Decibels,db};
}

float Volume::decibels() const{
    if(unit == Unit::Decibels){
        return value;
    }
    if(value <= 0.f){
        return SilenceDb;
    }
    return std::max(20.f * std::log10(value),SilenceDb);
}

float Volume::linear() const{
    if(unit == Unit::Linear){
        return value;
    }
    if(value <= SilenceDb){
        return 0.f;
    }
    return std::pow(10.f,value / 20.f);
}

bool Volume::approxEquals(const Volume & rhs,float epsilon) const{
    if(unit == rhs.unit){
        return std::fabs(value - rhs.value) <= epsilon;
    }
    return std::fabs(decibels() - rhs.decibels()) <= epsilon;
}

}
