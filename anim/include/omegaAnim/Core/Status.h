#include "Core.h"

#ifndef OMEGAANIM_CORE_STATUS_H
#define OMEGAANIM_CORE_STATUS_H

namespace OmegaAnim {

    enum class ErrorCode : std::uint8_t {
        Ok,
        /// The animation target lacks the component or field a lens expects.
        FieldMissing,
        /// A keyframe could not resolve its start value after the deferred fetch.
        MissingStartValue,
        /// A stage step referenced a node that no longer exists. Skipped, never fatal.
        NodeRemoved
    };

    OMEGAANIM_EXPORT const char *errorCodeName(ErrorCode code);

    /// @brief The result of a lens access or an evaluator invocation.
    struct OMEGAANIM_EXPORT Status {
        ErrorCode code = ErrorCode::Ok;
        OmegaCommon::String reason {};

        bool ok() const {
            return code == ErrorCode::Ok;
        }
        explicit operator bool() const {
            return ok();
        }

        static Status Ok();
        static Status FieldMissing(const OmegaCommon::String & reason);
        static Status MissingStartValue(const OmegaCommon::String & reason);
        static Status NodeRemoved(NodeId node);
    };

    /// @brief A failure isolated to one node during a tick.
    struct NodeFailure {
        NodeId node = InvalidNode;
        Status status {};
    };

    enum class SequenceSignal : std::uint8_t {
        Started,
        Completed
    };

    struct SignalRecord {
        NodeId playhead = InvalidNode;
        SequenceSignal signal = SequenceSignal::Started;
    };

    /// @brief Summary of one AnimationRuntime::update call.
    struct OMEGAANIM_EXPORT TickReport {
        OmegaCommon::Vector<NodeFailure> failures {};
        OmegaCommon::Vector<SignalRecord> signals {};
        /// Playheads that moved backwards over a tree with a Parallel composite.
        OmegaCommon::Vector<NodeId> unsupportedReverse {};
        std::size_t stageCount = 0;
        std::size_t stepCount = 0;
        std::size_t skippedSteps = 0;

        bool ok() const {
            return failures.empty();
        }
        bool hasSignal(NodeId playhead,SequenceSignal signal) const;
        const NodeFailure *failureFor(NodeId node) const;
    };

}

namespace OmegaCommon {
    template<>
    struct FormatProvider<OmegaAnim::ErrorCode> {
        static void format(std::ostream & os,const OmegaAnim::ErrorCode & object){
            os << OmegaAnim::errorCodeName(object);
        }
    };
}

#endif
