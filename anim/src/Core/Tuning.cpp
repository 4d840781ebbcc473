#include "omegaAnim/Core/Tuning.h"

#include <cmath>
#include <cstdlib>

namespace OmegaAnim {

    namespace {
        static double readEnvDoubleClamp(const char *name,double fallback,double minValue,double maxValue){
            const char *raw = std::getenv(name);
            if(raw == nullptr || raw[0] == '\0'){
                return fallback;
            }
            char *endPtr = nullptr;
            const auto parsed = std::strtod(raw,&endPtr);
            if(endPtr == raw || !std::isfinite(parsed)){
                return fallback;
            }
            return std::clamp(parsed,minValue,maxValue);
        }

        static bool readEnvBool(const char *name,bool fallback){
            const char *raw = std::getenv(name);
            if(raw == nullptr || raw[0] == '\0'){
                return fallback;
            }
            return raw[0] != '0';
        }

        static std::uint64_t readEnvU64Clamp(const char *name,std::uint64_t fallback,std::uint64_t minValue,std::uint64_t maxValue){
            const char *raw = std::getenv(name);
            if(raw == nullptr || raw[0] == '\0'){
                return fallback;
            }
            char *endPtr = nullptr;
            const auto parsed = std::strtoull(raw,&endPtr,10);
            if(endPtr == raw){
                return fallback;
            }
            return std::clamp<std::uint64_t>(parsed,minValue,maxValue);
        }
    }

    const RuntimeTuning & RuntimeTuning::fromEnvironment(){
        static const RuntimeTuning tuning = []{
            RuntimeTuning cfg {};
            cfg.trace = readEnvBool("OMEGAANIM_TRACE",cfg.trace);
            cfg.maxTickDelta = readEnvDoubleClamp(
                    "OMEGAANIM_MAX_TICK_DELTA",
                    cfg.maxTickDelta,
                    0.0,
                    60.0);
            cfg.stageWarnThreshold = readEnvU64Clamp(
                    "OMEGAANIM_STAGE_WARN_THRESHOLD",
                    cfg.stageWarnThreshold,
                    1,
                    100000);
            return cfg;
        }();
        return tuning;
    }

}
