#include "omegaAnim/Core/Tuning.h"

#include "Evaluators.h"

#ifndef OMEGAANIM_ANIMATION_ANIMATIONRUNTIME_H
#define OMEGAANIM_ANIMATION_ANIMATIONRUNTIME_H

namespace OmegaAnim {

    class AnimationRuntime;

    /// @brief Receives the signals an AnimationRuntime produces.
    /// Override only what you need.
    class OMEGAANIM_EXPORT AnimationObserver {
        bool hasAssignment = false;
        friend class AnimationRuntime;
    public:
        /// @brief Called when a playhead enters its sequence.
        virtual void sequenceStarted(AnimationScene & scene,NodeId playhead);
        /// @brief Called when a playhead leaves its sequence.
        virtual void sequenceCompleted(AnimationScene & scene,NodeId playhead);
        /// @brief Called for every movement applied to a leaf, before evaluation.
        virtual void movementApplied(AnimationScene & scene,NodeId leaf,PlayheadMove move);
        /// @brief Called when a node carrying an event tag reaches its end.
        virtual void animationEvent(AnimationScene & scene,NodeId node,const OmegaCommon::String & tag);
        virtual ~AnimationObserver() = default;
    };

    OMEGACOMMON_SHARED_CLASS(AnimationObserver);

    /// @brief Runs one update of every playhead in a scene.
    /// @paragraph Order per update: drivers advance, playheads are traced, then each stage
    /// applies its movements, runs the evaluators in registration order, drains deferred
    /// mutations, fires callbacks and events, applies completion policies and finally
    /// emits sequence signals. Stage N is fully settled before stage N+1 starts.
    class OMEGAANIM_EXPORT AnimationRuntime {
        AnimationScene & scene;
        RuntimeTuning tuning;
        OmegaCommon::Vector<AnimationObserverPtr> observers;

        void runStage(std::size_t stage,const OmegaCommon::Vector<TraceResult> & traces,TickReport & report);
        void dispatchCallback(NodeId node);
        void dispatchEvent(NodeId node);
        void settleCompletion(const NodeCompletion & completion);
        void emitSignal(NodeId playhead,SequenceSignal signal,TickReport & report);
        void recordFailure(TickReport & report,NodeFailure failure);
    public:
        explicit AnimationRuntime(AnimationScene & scene);
        AnimationRuntime(AnimationScene & scene,const RuntimeTuning & tuning);

        const RuntimeTuning & runtimeTuning() const;

        void addObserver(AnimationObserverPtr observer);
        void removeObserver(AnimationObserverPtr observer);

        /// @brief Advances every driven playhead by `deltaSeconds` and applies the result.
        TickReport update(float deltaSeconds);
    };

}

#endif
