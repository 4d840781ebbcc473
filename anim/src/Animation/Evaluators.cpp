#include "omegaAnim/Animation/Evaluators.h"

#include "../Core/Trace.h"

namespace OmegaAnim {

StageContext::StageContext(std::size_t stageIndex,bool traceEnabled):traceEnabled(traceEnabled),stageIndex(stageIndex){

}

void StageContext::defer(NodeId node,std::function<Status(AnimationScene &)> apply,AnimationEvaluator *retry){
    pending.push_back(DeferredMutation{node,std::move(apply),retry});
}

bool StageContext::isRetry() const{
    return retrying;
}

bool StageContext::tracing() const{
    return traceEnabled;
}

std::size_t StageContext::stage() const{
    return stageIndex;
}

OmegaCommon::Vector<NodeFailure> StageContext::drain(AnimationScene & scene,std::size_t & skipped){
    OmegaCommon::Vector<NodeFailure> failures;
    /// Entries appended while draining are applied in the same pass.
    for(std::size_t i = 0;i < pending.size();i++){
        DeferredMutation mutation = pending[i];
        if(!scene.contains(mutation.node)){
            ++skipped;
            detail::trace(traceEnabled,"stage @{0}: deferred mutation on removed node @{1} skipped",stageIndex,mutation.node);
            continue;
        }
        Status status = mutation.apply(scene);
        if(!status.ok()){
            failures.push_back(NodeFailure{mutation.node,status});
            continue;
        }
        if(mutation.retry != nullptr){
            retrying = true;
            status = mutation.retry->evaluate(scene,*this,mutation.node);
            retrying = false;
            if(!status.ok()){
                failures.push_back(NodeFailure{mutation.node,status});
            }
        }
    }
    pending.clear();
    return failures;
}

namespace detail {
    void traceEvaluator(const StageContext & context,const OmegaCommon::String & message){
        emitTrace(context.tracing(),OmegaCommon::fmtString("stage @{0}: @{1}",context.stage(),message));
    }
}

}
