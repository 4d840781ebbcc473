#include "omegaAnim/Animation/AnimationRuntime.h"

#include "../Core/Trace.h"

namespace OmegaAnim {

void AnimationObserver::sequenceStarted(AnimationScene & scene,NodeId playhead){
    (void)scene;
    (void)playhead;
}

void AnimationObserver::sequenceCompleted(AnimationScene & scene,NodeId playhead){
    (void)scene;
    (void)playhead;
}

void AnimationObserver::movementApplied(AnimationScene & scene,NodeId leaf,PlayheadMove move){
    (void)scene;
    (void)leaf;
    (void)move;
}

void AnimationObserver::animationEvent(AnimationScene & scene,NodeId node,const OmegaCommon::String & tag){
    (void)scene;
    (void)node;
    (void)tag;
}

AnimationRuntime::AnimationRuntime(AnimationScene & scene):AnimationRuntime(scene,RuntimeTuning::fromEnvironment()){

}

AnimationRuntime::AnimationRuntime(AnimationScene & scene,const RuntimeTuning & tuning):scene(scene),tuning(tuning){

}

const RuntimeTuning & AnimationRuntime::runtimeTuning() const{
    return tuning;
}

void AnimationRuntime::addObserver(AnimationObserverPtr observer){
    if(observer != nullptr && !observer->hasAssignment){
        observers.push_back(observer);
        observer->hasAssignment = true;
    }
}

void AnimationRuntime::removeObserver(AnimationObserverPtr observer){
    auto it = observers.begin();
    while(it != observers.end()){
        if(*it == observer){
            observers.erase(it);
            observer->hasAssignment = false;
            break;
        }
        ++it;
    }
}

void AnimationRuntime::recordFailure(TickReport & report,NodeFailure failure){
    if(failure.status.code == ErrorCode::NodeRemoved){
        ++report.skippedSteps;
        detail::trace(tuning.trace,"node @{0} removed mid-stage, skipped",failure.node);
        return;
    }
    OmegaCommon::LogV("OmegaAnim: node @{0} failed with @{1}: @{2}",failure.node,failure.status.code,failure.status.reason);
    report.failures.push_back(std::move(failure));
}

void AnimationRuntime::dispatchCallback(NodeId id){
    auto node = scene.node(id);
    if(node == nullptr || !node->callback || node->callbackFired){
        return;
    }
    node->callbackFired = true;
    detail::trace(tuning.trace,"callback on node @{0}",id);
    /// Copied so the callback may replace or remove itself.
    AnimationCallback callback = node->callback;
    callback(scene,id);
}

void AnimationRuntime::dispatchEvent(NodeId id){
    auto node = scene.node(id);
    if(node == nullptr || !node->eventTag.has_value() || node->eventFired){
        return;
    }
    node->eventFired = true;
    OmegaCommon::String tag = *node->eventTag;
    detail::trace(tuning.trace,"event '@{0}' on node @{1}",tag,id);
    auto targets = observers;
    for(auto & observer : targets){
        observer->animationEvent(scene,id,tag);
    }
}

void AnimationRuntime::settleCompletion(const NodeCompletion & completion){
    if(!scene.contains(completion.node)){
        return;
    }
    if(completion.composite){
        dispatchCallback(completion.node);
        dispatchEvent(completion.node);
        if(!scene.contains(completion.node)){
            return;
        }
    }
    switch(scene.completion(completion.node)){
        case CompletionPolicy::Preserve:
            break;
        case CompletionPolicy::Remove:
            detail::trace(tuning.trace,"completion: strip animations from node @{0}",completion.node);
            scene.clearAnimations(completion.node);
            break;
        case CompletionPolicy::Despawn:
            detail::trace(tuning.trace,"completion: despawn node @{0}",completion.node);
            scene.despawnNode(completion.node);
            break;
    }
}

void AnimationRuntime::emitSignal(NodeId playhead,SequenceSignal signal,TickReport & report){
    report.signals.push_back(SignalRecord{playhead,signal});
    auto targets = observers;
    if(signal == SequenceSignal::Started){
        detail::trace(tuning.trace,"playhead @{0}: sequence started",playhead);
        for(auto & observer : targets){
            observer->sequenceStarted(scene,playhead);
        }
        return;
    }

    detail::trace(tuning.trace,"playhead @{0}: sequence completed",playhead);
    for(auto & observer : targets){
        observer->sequenceCompleted(scene,playhead);
    }
    auto driver = scene.driver(playhead);
    auto head = scene.playhead(playhead);
    if(driver != nullptr && head != nullptr){
        driver->onSequenceCompleted(*head);
    }
}

void AnimationRuntime::runStage(std::size_t stage,const OmegaCommon::Vector<TraceResult> & traces,TickReport & report){
    StageContext context(stage,tuning.trace);
    OmegaCommon::Vector<NodeId> moved;
    OmegaCommon::Vector<const PlayheadStep *> steps;

    for(auto & result : traces){
        if(stage >= result.stages.size()){
            continue;
        }
        for(auto & step : result.stages[stage]){
            steps.push_back(&step);
            /// A new pass over the sequence re-arms its one-shot callbacks and events.
            if(step.started){
                OmegaCommon::Vector<NodeId> worklist {step.playhead};
                while(!worklist.empty()){
                    auto node = scene.node(worklist.back());
                    worklist.pop_back();
                    if(node == nullptr){
                        continue;
                    }
                    node->callbackFired = false;
                    node->eventFired = false;
                    worklist.insert(worklist.end(),node->children.begin(),node->children.end());
                }
            }
            if(!scene.contains(step.leaf)){
                recordFailure(report,NodeFailure{step.leaf,Status::NodeRemoved(step.leaf)});
                continue;
            }
            scene.setMovement(step.leaf,step.move);
            moved.push_back(step.leaf);
            ++report.stepCount;
            detail::trace(tuning.trace,"stage @{0}: node @{1} moved @{2} -> @{3}",stage,step.leaf,step.move.start,step.move.end);
            auto targets = observers;
            for(auto & observer : targets){
                observer->movementApplied(scene,step.leaf,step.move);
            }
        }
    }

    auto evaluators = scene.evaluators();
    for(auto & evaluator : evaluators){
        for(auto node : moved){
            if(!scene.contains(node) || !evaluator->handles(scene,node)){
                continue;
            }
            Status status = evaluator->evaluate(scene,context,node);
            if(!status.ok()){
                recordFailure(report,NodeFailure{node,status});
            }
        }
    }

    for(auto & failure : context.drain(scene,report.skippedSteps)){
        recordFailure(report,failure);
    }

    for(auto id : moved){
        auto node = scene.node(id);
        if(node == nullptr || !node->movement.has_value()){
            continue;
        }
        if(node->movement->end >= node->duration){
            dispatchCallback(id);
            dispatchEvent(id);
        }
        else {
            node->callbackFired = false;
            node->eventFired = false;
        }
    }

    for(auto & result : traces){
        for(auto & completion : result.completions){
            if(completion.stage == stage){
                settleCompletion(completion);
            }
        }
    }

    for(auto step : steps){
        if(step->started){
            emitSignal(step->playhead,SequenceSignal::Started,report);
        }
        if(step->ended){
            emitSignal(step->playhead,SequenceSignal::Completed,report);
        }
    }
}

TickReport AnimationRuntime::update(float deltaSeconds){
    TickReport report {};
    float delta = deltaSeconds;
    if(tuning.maxTickDelta > 0.0){
        const float limit = static_cast<float>(tuning.maxTickDelta);
        delta = std::clamp(delta,-limit,limit);
    }

    auto playheadNodes = scene.playheadNodes();
    for(auto id : playheadNodes){
        auto driver = scene.driver(id);
        auto playhead = scene.playhead(id);
        if(driver != nullptr && playhead != nullptr){
            driver->drive(*playhead,delta);
        }
    }

    OmegaCommon::Vector<TraceResult> traces;
    std::size_t stageCount = 0;
    for(auto id : playheadNodes){
        auto playhead = scene.playhead(id);
        if(playhead == nullptr || !playhead->moved()){
            continue;
        }
        const float previous = playhead->advance();
        const float current = playhead->get();
        TraceResult result = PlayheadTracer::trace(scene,id,previous,current);
        detail::trace(tuning.trace,"playhead @{0}: @{1} -> @{2}, @{3} stage(s)",id,previous,current,result.stages.size());
        if(result.unsupported){
            detail::trace(tuning.trace,"playhead @{0}: reverse playback through a Parallel composite is not supported",id);
            report.unsupportedReverse.push_back(id);
        }
        stageCount = std::max(stageCount,result.stages.size());
        for(auto & completion : result.completions){
            stageCount = std::max(stageCount,completion.stage + 1);
        }
        traces.push_back(std::move(result));
    }

    report.stageCount = stageCount;
    if(stageCount > tuning.stageWarnThreshold){
        OmegaCommon::LogV("OmegaAnim: update needs @{0} stages (warn threshold @{1})",stageCount,tuning.stageWarnThreshold);
    }

    for(std::size_t stage = 0;stage < stageCount;stage++){
        runStage(stage,traces,report);
    }
    return report;
}

}
