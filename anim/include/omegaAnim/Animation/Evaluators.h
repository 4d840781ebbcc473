#include "AnimationScene.h"

#ifndef OMEGAANIM_ANIMATION_EVALUATORS_H
#define OMEGAANIM_ANIMATION_EVALUATORS_H

namespace OmegaAnim {

    /// @brief A mutation queued during a stage and applied once every evaluator has run.
    struct DeferredMutation {
        NodeId node = InvalidNode;
        std::function<Status(AnimationScene &)> apply {};
        /// Evaluated again for `node` after `apply` succeeds.
        AnimationEvaluator *retry = nullptr;
    };

    /// @brief Per-stage scratch state shared by the evaluators of one stage.
    class OMEGAANIM_EXPORT StageContext {
        OmegaCommon::Vector<DeferredMutation> pending;
        bool retrying = false;
        bool traceEnabled = false;
        std::size_t stageIndex = 0;
    public:
        StageContext(std::size_t stageIndex,bool traceEnabled);

        void defer(NodeId node,std::function<Status(AnimationScene &)> apply,AnimationEvaluator *retry = nullptr);
        /// @brief True while re-running an evaluator after its deferred mutation.
        bool isRetry() const;
        bool tracing() const;
        std::size_t stage() const;

        /// @brief Applies every queued mutation in order, then its retry.
        /// Mutations on removed nodes are skipped.
        /// @returns The failures, one per node.
        OmegaCommon::Vector<NodeFailure> drain(AnimationScene & scene,std::size_t & skipped);
    };

    namespace detail {
        OMEGAANIM_EXPORT void traceEvaluator(const StageContext & context,const OmegaCommon::String & message);

        inline float progress(float local,float duration){
            return duration == 0.f ? 1.f : local / duration;
        }
    }

    /// @brief Interpolates a node's field from a captured start value to its keyframe.
    /// @paragraph The start value is fetched on first use: the keyframe of the nearest
    /// earlier leaf animating the same field of the same target, else the live field value.
    /// The fetch runs as a deferred mutation and the node is evaluated once more after it.
    /// A fetch that finds neither fails the node with MissingStartValue.
    template<typename T>
    class KeyframeEvaluator final : public AnimationEvaluator {
        static Status fetchStartValue(AnimationScene & scene,NodeId node){
            auto channel = scene.channel<T>(node);
            if(channel == nullptr || channel->startValue.has_value()){
                return Status::Ok();
            }
            const NodeId lensOwner = channel->lensOwner;
            auto target = scene.target(node);

            NodeId root = scene.governingPlayhead(node);
            auto order = scene.leaves(root == InvalidNode ? node : root);
            auto self = std::find(order.begin(),order.end(),node);
            while(self != order.begin()){
                --self;
                auto prior = scene.channel<T>(*self);
                if(prior == nullptr || !prior->keyframe.has_value()){
                    continue;
                }
                if(prior->lensOwner == lensOwner && scene.target(*self) == target){
                    channel->startValue = prior->keyframe;
                    return Status::Ok();
                }
            }

            auto lens = scene.lens<T>(node);
            if(lens == nullptr || target == nullptr){
                return Status::MissingStartValue(OmegaCommon::fmtString("node @{0}: no earlier keyframe and nothing to sample",node));
            }
            T live {};
            Status status = lens->get(*target,live);
            if(!status.ok()){
                return Status::MissingStartValue(
                        OmegaCommon::fmtString("node @{0}: no earlier keyframe and '@{1}' could not be sampled through @{2}: @{3}",
                                               node,target->name(),lens->describe(),status.reason));
            }
            channel->startValue = live;
            return Status::Ok();
        }
    public:
        bool handles(const AnimationScene & scene,NodeId node) const override{
            auto channel = scene.channel<T>(node);
            return channel != nullptr && channel->keyframe.has_value() && scene.movement(node).has_value();
        }

        Status evaluate(AnimationScene & scene,StageContext & context,NodeId node) override{
            auto channel = scene.channel<T>(node);
            auto movement = scene.movement(node);
            if(channel == nullptr || !channel->keyframe.has_value() || !movement.has_value()){
                return Status::Ok();
            }

            auto lens = scene.lens<T>(node);
            if(lens == nullptr){
                return Status::FieldMissing(OmegaCommon::fmtString("node @{0} has no lens for its keyframe",node));
            }
            auto target = scene.target(node);
            if(target == nullptr){
                return Status::FieldMissing(OmegaCommon::fmtString("node @{0} has no animation target",node));
            }

            if(!channel->startValue.has_value()){
                if(context.isRetry()){
                    return Status::MissingStartValue(OmegaCommon::fmtString("node @{0}: start value still unset after fetch",node));
                }
                detail::traceEvaluator(context,OmegaCommon::fmtString("defer start value fetch for node @{0}",node));
                context.defer(node,[node](AnimationScene & s){
                    return fetchStartValue(s,node);
                },this);
                return Status::Ok();
            }

            const float t = sampleCurve(scene.curve(node),detail::progress(movement->end,scene.duration(node)));
            T value = AnimationValue<T>::lerp(*channel->startValue,*channel->keyframe,t);
            return lens->set(*target,value);
        }

        const char *name() const override{
            return "KeyframeEvaluator";
        }
    };

    /// @brief Adds the eased share of a node's delta covered by its movement window.
    /// Both ends of the window are recomputed from the identity value on every call,
    /// so no state is kept and reversed windows undo what forward windows applied.
    template<typename T>
    class DeltaEvaluator final : public AnimationEvaluator {
    public:
        bool handles(const AnimationScene & scene,NodeId node) const override{
            auto channel = scene.channel<T>(node);
            return channel != nullptr && channel->delta.has_value() && scene.movement(node).has_value();
        }

        Status evaluate(AnimationScene & scene,StageContext & context,NodeId node) override{
            (void)context;
            auto channel = scene.channel<T>(node);
            auto movement = scene.movement(node);
            if(channel == nullptr || !channel->delta.has_value() || !movement.has_value()){
                return Status::Ok();
            }
            if(movement->start == movement->end){
                return Status::Ok();
            }

            auto lens = scene.lens<T>(node);
            if(lens == nullptr){
                return Status::FieldMissing(OmegaCommon::fmtString("node @{0} has no lens for its delta",node));
            }
            auto target = scene.target(node);
            if(target == nullptr){
                return Status::FieldMissing(OmegaCommon::fmtString("node @{0} has no animation target",node));
            }

            const float duration = scene.duration(node);
            auto curve = scene.curve(node);
            const float startEased = sampleCurve(curve,detail::progress(movement->start,duration));
            const float endEased = sampleCurve(curve,detail::progress(movement->end,duration));

            const T basis = AnimationValue<T>::identity();
            T startValue = AnimationValue<T>::lerp(basis,*channel->delta,startEased);
            T endValue = AnimationValue<T>::lerp(basis,*channel->delta,endEased);
            T applied = AnimationValue<T>::difference(endValue,startValue);

            T field {};
            Status status = lens->get(*target,field);
            if(!status.ok()){
                return status;
            }
            AnimationValue<T>::accumulate(field,applied);
            return lens->set(*target,field);
        }

        const char *name() const override{
            return "DeltaEvaluator";
        }
    };

    template<typename T>
    void AnimationScene::setKeyframe(NodeId id,T value){
        auto node = find(id);
        if(node == nullptr){
            return;
        }
        auto channel = ensureChannel<T>(*node);
        channel->keyframe = std::move(value);
        channel->startValue.reset();
        ensureEvaluator<KeyframeEvaluator<T>>();
    }

    template<typename T>
    void AnimationScene::addDelta(NodeId id,T value){
        auto node = find(id);
        if(node == nullptr){
            return;
        }
        ensureChannel<T>(*node)->delta = std::move(value);
        ensureEvaluator<DeltaEvaluator<T>>();
    }

}

#endif
