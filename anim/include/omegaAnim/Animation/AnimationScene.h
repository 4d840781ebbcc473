#include "omegaAnim/Core/Status.h"

#include "AnimationValue.h"
#include "AnimationCurve.h"
#include "AnimationTarget.h"
#include "FieldLens.h"
#include "Playhead.h"
#include "TimeDriver.h"

#ifndef OMEGAANIM_ANIMATION_ANIMATIONSCENE_H
#define OMEGAANIM_ANIMATION_ANIMATIONSCENE_H

namespace OmegaAnim {

    class AnimationScene;
    class StageContext;

    enum class CompositionKind : std::uint8_t {
        Sequence,
        Parallel,
        Leaf
    };

    /// @brief What happens to a node once forward playback completes it.
    enum class CompletionPolicy : std::uint8_t {
        Preserve,
        /// Strip keyframes, deltas, callback and event; timing is kept.
        Remove,
        /// Remove the node and its whole subtree; its span stays in the parent's timing.
        Despawn
    };

    typedef std::function<void(AnimationScene &,NodeId)> AnimationCallback;

    /// @brief Applies one value type's animations to the nodes of a stage.
    class OMEGAANIM_EXPORT AnimationEvaluator {
    public:
        /// @returns True if `node` carries an animation this evaluator applies.
        virtual bool handles(const AnimationScene & scene,NodeId node) const = 0;
        virtual Status evaluate(AnimationScene & scene,StageContext & context,NodeId node) = 0;
        virtual const char *name() const = 0;
        virtual ~AnimationEvaluator() = default;
    };

    OMEGACOMMON_SHARED_CLASS(AnimationEvaluator);

    namespace detail {

        struct ChannelBase {
            /// Node whose own lens is visible here; InvalidNode when none.
            NodeId lensOwner = InvalidNode;

            virtual bool hasOwnLens() const = 0;
            virtual bool hasAnimation() const = 0;
            virtual void clearAnimation() = 0;
            virtual void clearStartValue() = 0;
            /// @brief A fresh channel for a new child, inheriting only the lens owner.
            virtual SharedHandle<ChannelBase> inherit() const = 0;
            virtual ~ChannelBase() = default;
        };

        template<typename T>
        struct Channel final : public ChannelBase {
            FieldLensPtr<T> ownLens {};
            Core::Optional<T> keyframe {};
            Core::Optional<T> delta {};
            Core::Optional<T> startValue {};

            bool hasOwnLens() const override {
                return ownLens != nullptr;
            }
            bool hasAnimation() const override {
                return keyframe.has_value() || delta.has_value();
            }
            void clearAnimation() override {
                keyframe.reset();
                delta.reset();
                startValue.reset();
            }
            void clearStartValue() override {
                startValue.reset();
            }
            SharedHandle<ChannelBase> inherit() const override {
                auto child = std::make_shared<Channel<T>>();
                child->lensOwner = lensOwner;
                return child;
            }
        };

        struct AnimationNode {
            NodeId id = InvalidNode;
            NodeId parent = InvalidNode;
            OmegaCommon::Vector<NodeId> children {};
            CompositionKind kind = CompositionKind::Sequence;
            float duration = 0.f;
            /// Span of despawned earlier siblings still held in a Sequence parent's timing.
            float leadingGap = 0.f;
            /// Span of despawned children held after the last child (Sequence) or as a minimum (Parallel).
            float trailingGap = 0.f;
            AnimationCurvePtr curve {};
            CompletionPolicy completion = CompletionPolicy::Preserve;

            AnimationTargetPtr ownTarget {};
            NodeId targetOwner = InvalidNode;

            OmegaCommon::MapVec<std::type_index,SharedHandle<ChannelBase>> channels {};

            AnimationCallback callback {};
            bool callbackFired = false;
            Core::Optional<OmegaCommon::String> eventTag {};
            bool eventFired = false;

            Core::Optional<PlayheadMove> movement {};
            Core::Optional<Playhead> playhead {};
            Core::Optional<TimeDriver> driver {};
        };
    }

    /// @brief Owns every animation node, organized as one or more composition trees.
    /// @paragraph A node with no children is a leaf regardless of its kind.
    /// Lenses and targets are inherited from the nearest ancestor that sets one.
    /// Each root created with createRoot() carries a playhead.
    class OMEGAANIM_EXPORT AnimationScene {
        NodeId nextId = 1;
        OmegaCommon::Map<NodeId,detail::AnimationNode> nodes;
        OmegaCommon::Vector<AnimationEvaluatorPtr> evaluatorList;
        OmegaCommon::SetVec<std::type_index> evaluatorKeys;

        detail::AnimationNode *find(NodeId id);
        const detail::AnimationNode *find(NodeId id) const;

        template<typename T>
        detail::Channel<T> *ensureChannel(detail::AnimationNode & node){
            auto key = std::type_index(typeid(T));
            auto found = node.channels.find(key);
            if(found != node.channels.end()){
                return static_cast<detail::Channel<T> *>(found->second.get());
            }
            auto channel = std::make_shared<detail::Channel<T>>();
            if(node.parent != InvalidNode){
                auto parentChannel = channel_impl<T>(node.parent);
                if(parentChannel != nullptr){
                    channel->lensOwner = parentChannel->lensOwner;
                }
            }
            node.channels[key] = channel;
            return channel.get();
        }

        template<typename T>
        detail::Channel<T> *channel_impl(NodeId id) const{
            auto node = find(id);
            if(node == nullptr){
                return nullptr;
            }
            auto found = node->channels.find(std::type_index(typeid(T)));
            if(found == node->channels.end()){
                return nullptr;
            }
            return static_cast<detail::Channel<T> *>(found->second.get());
        }

        /// Pushes the lens owner of `from` down its subtree, stopping below nodes with their own lens.
        template<typename T>
        void propagateLens(NodeId from){
            auto origin = channel_impl<T>(from);
            if(origin == nullptr){
                return;
            }
            const NodeId owner = origin->lensOwner;
            OmegaCommon::Vector<NodeId> worklist {from};
            while(!worklist.empty()){
                NodeId current = worklist.back();
                worklist.pop_back();
                auto node = find(current);
                if(node == nullptr){
                    continue;
                }
                for(auto child : node->children){
                    auto childNode = find(child);
                    if(childNode == nullptr){
                        continue;
                    }
                    auto childChannel = ensureChannel<T>(*childNode);
                    if(childChannel->hasOwnLens()){
                        continue;
                    }
                    childChannel->lensOwner = owner;
                    worklist.push_back(child);
                }
            }
        }

        void propagateTarget(NodeId from);
        void registerEvaluator(std::type_index key,const std::function<AnimationEvaluatorPtr()> & factory);
        void collectLeavesInto(NodeId node,NodeId playheadNode,OmegaCommon::Vector<NodeId> & out) const;
    public:
        AnimationScene() = default;
        AnimationScene(const AnimationScene &) = delete;
        AnimationScene & operator=(const AnimationScene &) = delete;

        /// @name Tree authoring
        /// @{

        /// @brief Creates a root node with a playhead, animating `target`.
        NodeId createRoot(AnimationTargetPtr target,CompositionKind kind = CompositionKind::Sequence);
        /// @brief Appends a node under `parent`.
        /// @returns The new node, or InvalidNode if `parent` does not exist.
        NodeId createNode(NodeId parent,CompositionKind kind = CompositionKind::Sequence,float duration = 0.f);
        NodeId createLeaf(NodeId parent,float duration,AnimationCurvePtr curve = nullptr);
        /// @brief Removes `node` and its subtree, including any playheads and drivers on them.
        /// Later siblings move up to fill the removed span.
        bool removeNode(NodeId node);
        /// @brief Removes `node` and its subtree like removeNode(), but its span stays in the
        /// parent's timing so later siblings keep their start offsets.
        bool despawnNode(NodeId node);

        bool contains(NodeId node) const;
        std::size_t nodeCount() const;
        OmegaCommon::Vector<NodeId> roots() const;
        NodeId parent(NodeId node) const;
        const OmegaCommon::Vector<NodeId> & children(NodeId node) const;
        CompositionKind kind(NodeId node) const;
        bool isLeaf(NodeId node) const;

        void setDuration(NodeId node,float seconds);
        /// @returns The node's own duration; composites report their authored value.
        float duration(NodeId node) const;
        /// @brief Timing span used by traversal: a leaf's duration, the sum of a
        /// Sequence's children, the max of a Parallel's children.
        /// Spans held for despawned children are included.
        float layoutDuration(NodeId node) const;
        /// @returns The span held ahead of `node` for despawned earlier siblings.
        float leadingGap(NodeId node) const;
        /// @returns The span held by `node` for despawned children past (or under) its remaining ones.
        float trailingGap(NodeId node) const;

        void setCurve(NodeId node,AnimationCurvePtr curve);
        AnimationCurvePtr curve(NodeId node) const;

        void setCompletion(NodeId node,CompletionPolicy policy);
        CompletionPolicy completion(NodeId node) const;
        /// @}

        /// @name Targets
        /// @{
        void setTarget(NodeId node,AnimationTargetPtr target);
        /// @returns The target resolved for `node` from itself or its nearest ancestor.
        AnimationTargetPtr target(NodeId node) const;
        NodeId targetOwner(NodeId node) const;
        /// @}

        /// @name Lenses
        /// @{
        template<typename T>
        void setLens(NodeId id,FieldLensPtr<T> lens){
            auto node = find(id);
            if(node == nullptr || lens == nullptr){
                return;
            }
            auto channel = ensureChannel<T>(*node);
            channel->ownLens = std::move(lens);
            channel->lensOwner = id;
            propagateLens<T>(id);
        }

        /// @returns The lens visible at `node`, or nullptr.
        template<typename T>
        FieldLensPtr<T> lens(NodeId id) const{
            auto channel = channel_impl<T>(id);
            if(channel == nullptr || channel->lensOwner == InvalidNode){
                return nullptr;
            }
            auto owner = channel_impl<T>(channel->lensOwner);
            if(owner == nullptr){
                return nullptr;
            }
            return owner->ownLens;
        }

        template<typename T>
        NodeId lensOwner(NodeId id) const{
            auto channel = channel_impl<T>(id);
            return channel == nullptr ? InvalidNode : channel->lensOwner;
        }
        /// @}

        /// @name Animations
        /// @{

        /// @brief Animates the node's field to `value` (absolute).
        /// Defined in Evaluators.h.
        template<typename T>
        void setKeyframe(NodeId node,T value);

        /// @brief Offsets the node's field by `value` over its duration (additive).
        /// Defined in Evaluators.h.
        template<typename T>
        void addDelta(NodeId node,T value);

        template<typename T>
        Core::Optional<T> keyframe(NodeId id) const{
            auto channel = channel_impl<T>(id);
            return channel == nullptr ? Core::Optional<T>{} : channel->keyframe;
        }

        template<typename T>
        Core::Optional<T> delta(NodeId id) const{
            auto channel = channel_impl<T>(id);
            return channel == nullptr ? Core::Optional<T>{} : channel->delta;
        }

        template<typename T>
        Core::Optional<T> startValue(NodeId id) const{
            auto channel = channel_impl<T>(id);
            return channel == nullptr ? Core::Optional<T>{} : channel->startValue;
        }

        template<typename T>
        void setStartValue(NodeId id,T value){
            auto node = find(id);
            if(node == nullptr){
                return;
            }
            ensureChannel<T>(*node)->startValue = std::move(value);
        }

        template<typename T>
        detail::Channel<T> *channel(NodeId id){
            return channel_impl<T>(id);
        }

        template<typename T>
        const detail::Channel<T> *channel(NodeId id) const{
            return channel_impl<T>(id);
        }

        /// @brief Clears cached keyframe start values on `node` and its subtree.
        void resetStartValues(NodeId node);
        /// @brief Strips every keyframe, delta, callback and event from `node`.
        void clearAnimations(NodeId node);
        /// @}

        /// @name Callbacks and events
        /// @{
        void setCallback(NodeId node,AnimationCallback callback);
        bool hasCallback(NodeId node) const;
        void setEvent(NodeId node,OmegaCommon::String tag);
        Core::Optional<OmegaCommon::String> event(NodeId node) const;
        /// @}

        /// @name Playheads and drivers
        /// @{
        bool attachPlayhead(NodeId node);
        Playhead *playhead(NodeId node);
        const Playhead *playhead(NodeId node) const;
        OmegaCommon::Vector<NodeId> playheadNodes() const;
        /// @returns The nearest node at or above `node` carrying a playhead.
        NodeId governingPlayhead(NodeId node) const;

        TimeDriver *attachDriver(NodeId node,TimeDriver driver = {});
        TimeDriver *driver(NodeId node);
        const TimeDriver *driver(NodeId node) const;
        /// @}

        /// @brief Leaves under `playheadNode` in tree order, skipping subtrees with their own playhead.
        OmegaCommon::Vector<NodeId> leaves(NodeId playheadNode) const;
        /// @returns True if a Parallel composite sits anywhere in the playhead's traversal.
        bool containsParallel(NodeId playheadNode) const;

        void setMovement(NodeId node,PlayheadMove move);
        Core::Optional<PlayheadMove> movement(NodeId node) const;

        const OmegaCommon::Vector<AnimationEvaluatorPtr> & evaluators() const;

        /// @brief Registers `Evaluator` once per concrete evaluator type.
        template<class Evaluator>
        void ensureEvaluator(){
            registerEvaluator(std::type_index(typeid(Evaluator)),[]{
                return std::static_pointer_cast<AnimationEvaluator>(std::make_shared<Evaluator>());
            });
        }

        /// Used by the runtime to settle callbacks.
        detail::AnimationNode *node(NodeId id);
    };

}

#endif
