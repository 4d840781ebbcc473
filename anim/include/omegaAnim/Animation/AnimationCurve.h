#include "omegaAnim/Core/Math.h"

#ifndef OMEGAANIM_ANIMATION_ANIMATIONCURVE_H
#define OMEGAANIM_ANIMATION_ANIMATIONCURVE_H

namespace OmegaAnim {

    struct CurvePoint {
        float x = 0.f,y = 0.f;
    };

    enum class EaseFamily : std::uint8_t {
        Quadratic,
        Cubic,
        Quartic,
        Quintic,
        Sine,
        Exponential,
        Circular,
        Back,
        Elastic,
        Bounce
    };

    enum class EaseMode : std::uint8_t {
        In,
        Out,
        InOut
    };

    /// @brief Represents an easing curve used to remap normalized progress.
    /// It is defined in a 1 x 1 coordinate space: x is elapsed progress, y is eased progress.
    /// @paragraph There are four types of curves.
    /// \n - Linear -> A straight line from (0,start_h) to (1,end_h).
    /// \n - Quadratic -> A bezier curve with one control point in addition to a start and end.
    /// \n - Cubic -> A bezier with two additional control points, solved for x like CSS `cubic-bezier()`.
    /// \n - Ease -> A named closed-form easing function.
    struct OMEGAANIM_EXPORT AnimationCurve {
        enum class Type : int {
            Linear,
            CubicBezier,
            QuadraticBezier,
            Ease
        } type;

        float start_h;
        float end_h;

        CurvePoint a = {0,0},b = {0,0};

        EaseFamily family = EaseFamily::Quadratic;
        EaseMode mode = EaseMode::In;
    public:
        /// @brief Samples the curve at normalized time `t`.
        /// @paragraph `t` is clamped to [0,1]; the result is not, since Back and Elastic overshoot.
        /// @returns The eased progress.
        float sample(float t) const;

        /// @brief Create a Linear AnimationCurve.
        /// @returns AnimationCurve
        static SharedHandle<AnimationCurve> Linear(float start_h,float end_h);
        static SharedHandle<AnimationCurve> Linear();
        static SharedHandle<AnimationCurve> EaseIn();
        static SharedHandle<AnimationCurve> EaseOut();
        static SharedHandle<AnimationCurve> EaseInOut();
        /// @brief The CSS `ease` preset.
        static SharedHandle<AnimationCurve> Ease();

        /// @brief Create a Quadratic Bezier AnimationCurve.
        /// @param a The 'A' control point used in the curve.
        /// @returns AnimationCurve
        static SharedHandle<AnimationCurve> Quadratic(CurvePoint a);

        /// @brief Create a Cubic Bezier AnimationCurve.
        /// @param a The 'A' control point used in the curve.
        /// @param b The 'B' control point used in the curve.
        /// @returns AnimationCurve
        static SharedHandle<AnimationCurve> CubicBezier(CurvePoint a,CurvePoint b);

        /// @brief Create a named easing curve, e.g. `Named(EaseFamily::Back,EaseMode::Out)`.
        static SharedHandle<AnimationCurve> Named(EaseFamily family,EaseMode mode);
    };

    OMEGACOMMON_SHARED_CLASS(AnimationCurve);

    /// @brief Evaluates a curve, treating a null curve as linear.
    inline float sampleCurve(const AnimationCurvePtr & curve,float t){
        if(curve == nullptr){
            return t;
        }
        return curve->sample(t);
    }

}

#endif
