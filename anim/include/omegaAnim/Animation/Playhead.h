#include "omegaAnim/Core/Core.h"

#ifndef OMEGAANIM_ANIMATION_PLAYHEAD_H
#define OMEGAANIM_ANIMATION_PLAYHEAD_H

namespace OmegaAnim {

    class AnimationScene;

    /// @brief A local time window on one leaf, in seconds within [0, duration].
    /// `start > end` describes reverse playback over the window.
    struct PlayheadMove {
        float start = 0.f;
        float end = 0.f;
    };

    /// @brief A position along a composition tree, attached to its root.
    class OMEGAANIM_EXPORT Playhead {
        float position = 0.f;
        float previousPosition = 0.f;
    public:
        float get() const;
        void set(float position);
        /// @brief Moves the playhead without producing any movement on the next update.
        void jumpTo(float position);
        /// @returns The position as of the last processed update.
        float previous() const;
        bool moved() const;
        /// @brief Returns the previous position and advances it to the current one.
        /// Only the runtime calls this, once per traced update.
        float advance();
    };

    /// @brief One movement emitted by the tracer.
    struct PlayheadStep {
        NodeId playhead = InvalidNode;
        NodeId leaf = InvalidNode;
        PlayheadMove move {};
        bool started = false;
        bool ended = false;
        std::size_t stage = 0;
    };

    /// @brief A node that finished during a forward trace, settled at the end of `stage`.
    struct NodeCompletion {
        NodeId node = InvalidNode;
        std::size_t stage = 0;
        bool composite = false;
    };

    struct OMEGAANIM_EXPORT TraceResult {
        NodeId playhead = InvalidNode;
        float previous = 0.f;
        float current = 0.f;
        bool forward = true;
        /// Set when a backward move crosses a tree containing a Parallel composite.
        bool unsupported = false;
        OmegaCommon::Vector<OmegaCommon::Vector<PlayheadStep>> stages {};
        OmegaCommon::Vector<NodeCompletion> completions {};

        std::size_t stepCount() const;
        /// @returns Every step in stage order.
        OmegaCommon::Vector<PlayheadStep> flatten() const;
    };

    /// @brief Maps a playhead move into staged per-leaf movements.
    /// @paragraph Leaves are visited in tree order. A Sequence lays its children end to end;
    /// a Parallel starts every child at its own offset. Each leaf a single move runs through
    /// gets its own stage, so completion side effects of one leaf settle before the next is touched.
    /// Subtrees owning their own playhead are skipped.
    class OMEGAANIM_EXPORT PlayheadTracer {
    public:
        static TraceResult trace(const AnimationScene & scene,NodeId playheadNode,float previous,float current);
        static TraceResult traceForward(const AnimationScene & scene,NodeId playheadNode,float previous,float current);
        /// @note Only Sequence nesting is supported; a Parallel anywhere under the
        /// playhead marks the result unsupported and yields no steps.
        static TraceResult traceBackward(const AnimationScene & scene,NodeId playheadNode,float previous,float current);
    };

}

#endif
