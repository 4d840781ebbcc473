#include "omegaAnim/Core/Math.h"

#include <type_traits>

#ifndef OMEGAANIM_ANIMATION_ANIMATIONVALUE_H
#define OMEGAANIM_ANIMATION_ANIMATIONVALUE_H

namespace OmegaAnim {

    /// @brief The value algebra an animatable type must provide.
    /// @paragraph Every specialization supplies four static operations:
    /// \n - lerp(a,b,t) -> T. `t` is not clamped; eased curves may overshoot.
    /// \n - difference(a,b) -> T. The inverse of accumulate, so that
    ///      `accumulate(difference(a,b),b)` yields `a`.
    /// \n - accumulate(self,delta). In-place group combine (add for linear types,
    ///      compose for rotations, gain for volumes).
    /// \n - identity() -> T. The neutral element used as the delta evaluator's basis.
    template<typename T>
    struct AnimationValue {
        static_assert(std::is_arithmetic_v<T>,"AnimationValue is not specialized for this type.");

        static T lerp(const T & a,const T & b,float t){
            if constexpr(std::is_same_v<T,float>){
                return OmegaAnim::lerp(a,b,t);
            }
            else if constexpr(std::is_floating_point_v<T>){
                return static_cast<T>(OmegaAnim::lerp(double(a),double(b),t));
            }
            else {
                return static_cast<T>(std::lround(OmegaAnim::lerp(double(a),double(b),t)));
            }
        }
        static T difference(const T & a,const T & b){
            return a - b;
        }
        static void accumulate(T & self,const T & delta){
            self += delta;
        }
        static T identity(){
            return T(0);
        }
    };

    template<>
    struct AnimationValue<Vec2> {
        static Vec2 lerp(const Vec2 & a,const Vec2 & b,float t){
            return Vec2{OmegaAnim::lerp(a.x,b.x,t),OmegaAnim::lerp(a.y,b.y,t)};
        }
        static Vec2 difference(const Vec2 & a,const Vec2 & b){
            return a - b;
        }
        static void accumulate(Vec2 & self,const Vec2 & delta){
            self += delta;
        }
        static Vec2 identity(){
            return Vec2{};
        }
    };

    template<>
    struct AnimationValue<Vec3> {
        static Vec3 lerp(const Vec3 & a,const Vec3 & b,float t){
            return Vec3{OmegaAnim::lerp(a.x,b.x,t),OmegaAnim::lerp(a.y,b.y,t),OmegaAnim::lerp(a.z,b.z,t)};
        }
        static Vec3 difference(const Vec3 & a,const Vec3 & b){
            return a - b;
        }
        static void accumulate(Vec3 & self,const Vec3 & delta){
            self += delta;
        }
        static Vec3 identity(){
            return Vec3{};
        }
    };

    /// Rotations form a group under multiplication.
    template<>
    struct AnimationValue<Quat> {
        static Quat lerp(const Quat & a,const Quat & b,float t){
            return a.slerp(b,t);
        }
        static Quat difference(const Quat & a,const Quat & b){
            return (a * b.inverse()).normalized();
        }
        static void accumulate(Quat & self,const Quat & delta){
            self = (self * delta).normalized();
        }
        static Quat identity(){
            return Quat::Identity();
        }
    };

    template<>
    struct AnimationValue<Color> {
        static Color lerp(const Color & a,const Color & b,float t){
            return Color{
                OmegaAnim::lerp(a.r,b.r,t),
                OmegaAnim::lerp(a.g,b.g,t),
                OmegaAnim::lerp(a.b,b.b,t),
                OmegaAnim::lerp(a.a,b.a,t)};
        }
        static Color difference(const Color & a,const Color & b){
            return Color{a.r - b.r,a.g - b.g,a.b - b.b,a.a - b.a};
        }
        static void accumulate(Color & self,const Color & delta){
            self.r += delta.r;
            self.g += delta.g;
            self.b += delta.b;
            self.a += delta.a;
        }
        static Color identity(){
            return Color{};
        }
    };

    /// Linear volumes compose by gain; anything involving decibels composes by
    /// adding levels, floored at Volume::SilenceDb.
    template<>
    struct OMEGAANIM_EXPORT AnimationValue<Volume> {
        static Volume lerp(const Volume & a,const Volume & b,float t);
        static Volume difference(const Volume & a,const Volume & b);
        static void accumulate(Volume & self,const Volume & delta);
        static Volume identity();
    };

    /// @brief `start` moved forward by `delta`.
    template<typename T>
    T forwardsDelta(const T & start,const T & delta){
        T out = start;
        AnimationValue<T>::accumulate(out,delta);
        return out;
    }

    /// @brief `start` moved backward by `delta`, so that forwardsDelta undoes it.
    template<typename T>
    T backwardsDelta(const T & start,const T & delta){
        T out = start;
        AnimationValue<T>::accumulate(out,AnimationValue<T>::difference(AnimationValue<T>::identity(),delta));
        return out;
    }

}

#endif
