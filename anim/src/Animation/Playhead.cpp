#include "omegaAnim/Animation/Playhead.h"
#include "omegaAnim/Animation/AnimationScene.h"

namespace OmegaAnim {

float Playhead::get() const{
    return position;
}

void Playhead::set(float position){
    this->position = position;
}

void Playhead::jumpTo(float position){
    this->position = position;
    previousPosition = position;
}

float Playhead::previous() const{
    return previousPosition;
}

bool Playhead::moved() const{
    return position != previousPosition;
}

float Playhead::advance(){
    float prev = previousPosition;
    previousPosition = position;
    return prev;
}

std::size_t TraceResult::stepCount() const{
    std::size_t count = 0;
    for(auto & stage : stages){
        count += stage.size();
    }
    return count;
}

OmegaCommon::Vector<PlayheadStep> TraceResult::flatten() const{
    OmegaCommon::Vector<PlayheadStep> out;
    for(auto & stage : stages){
        out.insert(out.end(),stage.begin(),stage.end());
    }
    return out;
}

namespace {

    struct WalkResult {
        bool complete = false;
        std::size_t nextStage = 0;
    };

    class ForwardWalk {
        const AnimationScene & scene;
        NodeId playheadNode;
        float previous;
        float current;
        TraceResult & result;
        bool emittedAny = false;

        void emit(NodeId leaf,PlayheadMove move,std::size_t stage){
            if(result.stages.size() <= stage){
                result.stages.resize(stage + 1);
            }
            PlayheadStep step {};
            step.playhead = playheadNode;
            step.leaf = leaf;
            step.move = move;
            step.stage = stage;
            step.started = !emittedAny && previous <= 0.f;
            emittedAny = true;
            result.stages[stage].push_back(step);
        }

        WalkResult walkLeaf(NodeId node,float offset,std::size_t stage){
            const float duration = scene.layoutDuration(node);
            const float nodeStart = offset;
            const float nodeEnd = nodeStart + duration;

            /// Already behind the playhead.
            if(previous > nodeEnd){
                return {true,stage};
            }
            /// Not reached yet.
            if(current < nodeStart){
                return {false,stage};
            }

            PlayheadMove move {};
            move.start = std::max(previous - nodeStart,0.f);
            move.end = std::min(current - nodeStart,duration);
            emit(node,move,stage);

            const bool complete = current >= nodeEnd;
            if(complete){
                result.completions.push_back(NodeCompletion{node,stage,false});
            }
            return {complete,stage + 1};
        }

        WalkResult walkComposite(NodeId node,float offset,std::size_t stage){
            const bool parallel = scene.kind(node) == CompositionKind::Parallel;
            float cursor = offset;
            std::size_t nextStage = stage;
            bool complete = true;

            for(auto child : scene.children(node)){
                auto childPlayhead = scene.playhead(child);
                if(childPlayhead != nullptr){
                    continue;
                }
                if(parallel){
                    WalkResult r = walk(child,offset,stage);
                    nextStage = std::max(nextStage,r.nextStage);
                    complete = complete && r.complete;
                }
                else {
                    cursor += scene.leadingGap(child);
                    WalkResult r = walk(child,cursor,nextStage);
                    nextStage = r.nextStage;
                    if(!r.complete){
                        return {false,nextStage};
                    }
                    cursor += scene.layoutDuration(child);
                }
            }

            /// Despawned children still hold their span at the end.
            const float gap = scene.trailingGap(node);
            if(gap > 0.f){
                complete = complete && current >= (parallel ? offset + gap : cursor + gap);
            }

            const float nodeEnd = offset + scene.layoutDuration(node);
            if(complete && previous <= nodeEnd){
                std::size_t settleStage = nextStage > stage ? nextStage - 1 : stage;
                result.completions.push_back(NodeCompletion{node,settleStage,true});
            }
            return {complete,nextStage};
        }
    public:
        ForwardWalk(const AnimationScene & scene,NodeId playheadNode,float previous,float current,TraceResult & result):
        scene(scene),playheadNode(playheadNode),previous(previous),current(current),result(result){

        }

        WalkResult walk(NodeId node,float offset,std::size_t stage){
            if(scene.isLeaf(node)){
                return walkLeaf(node,offset,stage);
            }
            return walkComposite(node,offset,stage);
        }

        void run(){
            WalkResult r = walk(playheadNode,0.f,0);
            const float total = scene.layoutDuration(playheadNode);
            if(r.complete && previous <= total){
                /// The last emitted step carries the end of the sequence.
                for(auto it = result.stages.rbegin();it != result.stages.rend();++it){
                    if(!it->empty()){
                        it->back().ended = true;
                        break;
                    }
                }
            }
        }
    };

    struct TimedLeaf {
        NodeId leaf;
        float start;
    };

    /// Leaves of a Sequence-only tree with their start offsets, in tree order.
    void collectTimedLeaves(const AnimationScene & scene,NodeId node,float offset,OmegaCommon::Vector<TimedLeaf> & out){
        if(scene.isLeaf(node)){
            out.push_back(TimedLeaf{node,offset});
            return;
        }
        float cursor = offset;
        for(auto child : scene.children(node)){
            if(scene.playhead(child) != nullptr){
                continue;
            }
            cursor += scene.leadingGap(child);
            collectTimedLeaves(scene,child,cursor,out);
            cursor += scene.layoutDuration(child);
        }
    }

}

TraceResult PlayheadTracer::traceForward(const AnimationScene & scene,NodeId playheadNode,float previous,float current){
    TraceResult result {};
    result.playhead = playheadNode;
    result.previous = previous;
    result.current = current;
    result.forward = true;
    if(!scene.contains(playheadNode)){
        return result;
    }
    ForwardWalk walk(scene,playheadNode,previous,current,result);
    walk.run();
    return result;
}

TraceResult PlayheadTracer::traceBackward(const AnimationScene & scene,NodeId playheadNode,float previous,float current){
    TraceResult result {};
    result.playhead = playheadNode;
    result.previous = previous;
    result.current = current;
    result.forward = false;
    if(!scene.contains(playheadNode)){
        return result;
    }
    if(scene.containsParallel(playheadNode)){
        result.unsupported = true;
        return result;
    }

    struct Swept {
        NodeId leaf;
        bool firstLeaf;
        PlayheadMove move;
    };
    OmegaCommon::Vector<Swept> swept;

    OmegaCommon::Vector<TimedLeaf> timed;
    collectTimedLeaves(scene,playheadNode,0.f,timed);
    bool firstLeaf = true;
    for(auto & entry : timed){
        const float duration = scene.layoutDuration(entry.leaf);
        const float nodeStart = entry.start;
        const float nodeEnd = nodeStart + duration;

        if(previous > nodeStart && current <= nodeEnd){
            PlayheadMove move {};
            move.start = std::clamp(previous - nodeStart,0.f,duration);
            move.end = std::clamp(current - nodeStart,0.f,duration);
            swept.push_back(Swept{entry.leaf,firstLeaf,move});
        }
        firstLeaf = false;
    }

    const float total = scene.layoutDuration(playheadNode);
    std::size_t stage = 0;
    for(auto it = swept.rbegin();it != swept.rend();++it,++stage){
        PlayheadStep step {};
        step.playhead = playheadNode;
        step.leaf = it->leaf;
        step.move = it->move;
        step.stage = stage;
        step.started = stage == 0 && previous >= total;
        step.ended = current <= 0.f && it->firstLeaf;
        result.stages.push_back({step});
    }
    return result;
}

TraceResult PlayheadTracer::trace(const AnimationScene & scene,NodeId playheadNode,float previous,float current){
    if(current < previous){
        return traceBackward(scene,playheadNode,previous,current);
    }
    return traceForward(scene,playheadNode,previous,current);
}

}
