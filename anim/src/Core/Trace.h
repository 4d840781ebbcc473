#include "omegaAnim/Core/Core.h"

#ifndef OMEGAANIM_SRC_CORE_TRACE_H
#define OMEGAANIM_SRC_CORE_TRACE_H

namespace OmegaAnim::detail {

    static inline void emitTrace(bool enabled,const OmegaCommon::String & message){
        if(enabled){
            std::cout << "[OmegaAnimTrace] " << message << std::endl;
        }
    }

    template<class ..._Args>
    static inline void trace(bool enabled,const char *fmt,_Args && ...args){
        if(enabled){
            emitTrace(true,OmegaCommon::fmtString(fmt,std::forward<_Args>(args)...));
        }
    }

}

#endif
