#include "omegaAnim/Core/Core.h"

#ifndef OMEGAANIM_ANIMATION_TIMEDRIVER_H
#define OMEGAANIM_ANIMATION_TIMEDRIVER_H

namespace OmegaAnim {

    class Playhead;

    enum class PlaybackState : std::uint8_t {
        Play,
        Pause
    };

    enum class RepeatMode : std::uint8_t {
        /// Jump back to the start. Overshoot past the end is dropped.
        Restart,
        /// Reverse direction at each end.
        PingPong
    };

    struct PlaybackMode {
        enum class Kind : std::uint8_t {
            Once,
            Repeat
        } kind = Kind::Once;
        RepeatMode repeat = RepeatMode::Restart;

        static PlaybackMode Once();
        static PlaybackMode Repeat(RepeatMode repeat);

        bool operator==(const PlaybackMode & rhs) const;
    };

    /// @brief Advances a playhead with wall-clock time.
    class OMEGAANIM_EXPORT TimeDriver {
    public:
        float speed = 1.f;
        PlaybackState state = PlaybackState::Play;
        PlaybackMode mode = PlaybackMode::Once();

        TimeDriver() = default;
        explicit TimeDriver(PlaybackMode mode,float speed = 1.f);

        void play();
        void pause();
        bool playing() const;

        /// @brief Moves `playhead` by `deltaSeconds * speed` while playing.
        void drive(Playhead & playhead,float deltaSeconds) const;

        /// @brief Reacts to the end of the sequence it drives.
        void onSequenceCompleted(Playhead & playhead);
    };

}

#endif
