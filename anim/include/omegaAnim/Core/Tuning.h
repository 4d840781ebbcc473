#include "Core.h"

#ifndef OMEGAANIM_CORE_TUNING_H
#define OMEGAANIM_CORE_TUNING_H

namespace OmegaAnim {

    /// @brief Runtime knobs, read once from the environment.
    /// \n OMEGAANIM_TRACE                 -> trace (bool, default off)
    /// \n OMEGAANIM_MAX_TICK_DELTA        -> maxTickDelta seconds (0 = unlimited, [0,60])
    /// \n OMEGAANIM_STAGE_WARN_THRESHOLD  -> stageWarnThreshold ([1,100000])
    struct OMEGAANIM_EXPORT RuntimeTuning {
        bool trace = false;
        double maxTickDelta = 0.0;
        std::uint64_t stageWarnThreshold = 64;

        static const RuntimeTuning & fromEnvironment();
    };

}

#endif
