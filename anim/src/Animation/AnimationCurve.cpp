#include "omegaAnim/Animation/AnimationCurve.h"

namespace OmegaAnim {

namespace {

constexpr float Pi = 3.14159265358979323846f;

float bezierComponent(float p1,float p2,float t){
    /// One-dimensional cubic bezier with fixed endpoints 0 and 1.
    const float mt = 1.f - t;
    return (3.f * mt * mt * t * p1) + (3.f * mt * t * t * p2) + (t * t * t);
}

float bezierDerivative(float p1,float p2,float t){
    const float mt = 1.f - t;
    return (3.f * mt * mt * p1) + (6.f * mt * t * (p2 - p1)) + (3.f * t * t * (1.f - p2));
}

/// Finds the bezier parameter whose x equals `x`. Newton first, bisection if it stalls.
float solveBezierX(float x1,float x2,float x){
    float t = x;
    for(int i = 0;i < 8;i++){
        const float err = bezierComponent(x1,x2,t) - x;
        if(std::fabs(err) < 1e-6f){
            return t;
        }
        const float d = bezierDerivative(x1,x2,t);
        if(std::fabs(d) < 1e-6f){
            break;
        }
        t -= err / d;
    }

    float lo = 0.f,hi = 1.f;
    t = x;
    for(int i = 0;i < 32;i++){
        const float v = bezierComponent(x1,x2,t);
        if(std::fabs(v - x) < 1e-6f){
            break;
        }
        if(v < x){
            lo = t;
        }
        else {
            hi = t;
        }
        t = (lo + hi) * 0.5f;
    }
    return t;
}

float bounceOut(float t){
    const float n1 = 7.5625f;
    const float d1 = 2.75f;
    if(t < 1.f / d1){
        return n1 * t * t;
    }
    else if(t < 2.f / d1){
        t -= 1.5f / d1;
        return (n1 * t * t) + 0.75f;
    }
    else if(t < 2.5f / d1){
        t -= 2.25f / d1;
        return (n1 * t * t) + 0.9375f;
    }
    t -= 2.625f / d1;
    return (n1 * t * t) + 0.984375f;
}

float easeIn(EaseFamily family,float t){
    switch(family){
        case EaseFamily::Quadratic:
            return t * t;
        case EaseFamily::Cubic:
            return t * t * t;
        case EaseFamily::Quartic:
            return t * t * t * t;
        case EaseFamily::Quintic:
            return t * t * t * t * t;
        case EaseFamily::Sine:
            return 1.f - std::cos((t * Pi) * 0.5f);
        case EaseFamily::Exponential:
            return t <= 0.f ? 0.f : std::pow(2.f,(10.f * t) - 10.f);
        case EaseFamily::Circular:
            return 1.f - std::sqrt(1.f - (t * t));
        case EaseFamily::Back: {
            const float c1 = 1.70158f;
            const float c3 = c1 + 1.f;
            return (c3 * t * t * t) - (c1 * t * t);
        }
        case EaseFamily::Elastic: {
            if(t <= 0.f || t >= 1.f){
                return t;
            }
            const float c4 = (2.f * Pi) / 3.f;
            return -std::pow(2.f,(10.f * t) - 10.f) * std::sin(((t * 10.f) - 10.75f) * c4);
        }
        case EaseFamily::Bounce:
            return 1.f - bounceOut(1.f - t);
    }
    return t;
}

/// Out and InOut are derived from the In shape by reflection.
float ease(EaseFamily family,EaseMode mode,float t){
    switch(mode){
        case EaseMode::In:
            return easeIn(family,t);
        case EaseMode::Out:
            return 1.f - easeIn(family,1.f - t);
        case EaseMode::InOut:
            if(t < 0.5f){
                return easeIn(family,2.f * t) * 0.5f;
            }
            return 1.f - (easeIn(family,2.f - (2.f * t)) * 0.5f);
    }
    return t;
}

}

SharedHandle<AnimationCurve> AnimationCurve::Linear(float start_h,float end_h) {
    auto curve = SharedHandle<AnimationCurve>(new AnimationCurve{Type::Linear,start_h,end_h});
    return curve;
}

SharedHandle<AnimationCurve> AnimationCurve::Linear(){
    return Linear(0.f,1.f);
}

SharedHandle<AnimationCurve> AnimationCurve::EaseIn(){
    return CubicBezier({0.42f,0.0f},{1.0f,1.0f});
}

SharedHandle<AnimationCurve> AnimationCurve::EaseOut(){
    return CubicBezier({0.0f,0.0f},{0.58f,1.0f});
}

SharedHandle<AnimationCurve> AnimationCurve::EaseInOut(){
    return CubicBezier({0.42f,0.0f},{0.58f,1.0f});
}

SharedHandle<AnimationCurve> AnimationCurve::Ease(){
    return CubicBezier({0.25f,0.1f},{0.25f,1.0f});
}

SharedHandle<AnimationCurve> AnimationCurve::Quadratic(CurvePoint a){
    auto curve = SharedHandle<AnimationCurve>(new AnimationCurve{Type::QuadraticBezier,0.f,1.f});
    curve->a = a;
    return curve;
}

SharedHandle<AnimationCurve> AnimationCurve::CubicBezier(CurvePoint a,CurvePoint b){
    auto curve = SharedHandle<AnimationCurve>(new AnimationCurve{Type::CubicBezier,0.f,1.f});
    curve->a = CurvePoint{clamp01(a.x),a.y};
    curve->b = CurvePoint{clamp01(b.x),b.y};
    return curve;
}

SharedHandle<AnimationCurve> AnimationCurve::Named(EaseFamily family,EaseMode mode){
    auto curve = SharedHandle<AnimationCurve>(new AnimationCurve{Type::Ease,0.f,1.f});
    curve->family = family;
    curve->mode = mode;
    return curve;
}

float AnimationCurve::sample(float t) const{
    const float x = clamp01(t);
    switch(type){
        case Type::Linear:
            return lerp(start_h,end_h,x);
        case Type::QuadraticBezier: {
            /// Elevated to a cubic so x stays solvable the same way.
            const float c1x = (2.f / 3.f) * a.x;
            const float c2x = (1.f / 3.f) + ((2.f / 3.f) * a.x);
            const float c1y = (2.f / 3.f) * a.y;
            const float c2y = (1.f / 3.f) + ((2.f / 3.f) * a.y);
            return bezierComponent(c1y,c2y,solveBezierX(c1x,c2x,x));
        }
        case Type::CubicBezier:
            return bezierComponent(a.y,b.y,solveBezierX(a.x,b.x,x));
        case Type::Ease:
            if(x <= 0.f){
                return 0.f;
            }
            if(x >= 1.f){
                return 1.f;
            }
            return ease(family,mode,x);
    }
    return x;
}

}
