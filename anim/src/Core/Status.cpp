#include "omegaAnim/Core/Status.h"

namespace OmegaAnim {

const char *errorCodeName(ErrorCode code){
    switch(code){
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::FieldMissing:
            return "FieldMissing";
        case ErrorCode::MissingStartValue:
            return "MissingStartValue";
        case ErrorCode::NodeRemoved:
            return "NodeRemoved";
    }
    return "Unknown";
}

Status Status::Ok(){
    return Status{};
}

Status Status::FieldMissing(const OmegaCommon::String & reason){
    return Status{ErrorCode::FieldMissing,reason};
}

Status Status::MissingStartValue(const OmegaCommon::String & reason){
    return Status{ErrorCode::MissingStartValue,reason};
}

Status Status::NodeRemoved(NodeId node){
    return Status{ErrorCode::NodeRemoved,OmegaCommon::fmtString("node @{0} was removed",node)};
}

bool TickReport::hasSignal(NodeId playhead,SequenceSignal signal) const{
    return std::any_of(signals.begin(),signals.end(),[&](const SignalRecord & record){
        return record.playhead == playhead && record.signal == signal;
    });
}

const NodeFailure *TickReport::failureFor(NodeId node) const{
    for(auto & failure : failures){
        if(failure.node == node){
            return &failure;
        }
    }
    return nullptr;
}

}
