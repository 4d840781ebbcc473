#include <omega-common/common.h>

#include <cstdint>
#include <functional>
#include <typeindex>

#ifndef OMEGAANIM_CORE_CORE_H
#define OMEGAANIM_CORE_CORE_H

#ifdef _WIN32
#ifdef OMEGAANIM__BUILD__
#define OMEGAANIM_EXPORT __declspec(dllexport)
#else
#define OMEGAANIM_EXPORT __declspec(dllimport)
#endif
#else
#define OMEGAANIM_EXPORT
#endif

namespace OmegaAnim {

    namespace Core {
        template<class T>
        using Optional = OmegaCommon::Optional<T>;

        template<class T>
        using SharedPtr = SharedHandle<T>;
    }

    /// @brief Stable identity of a node inside an AnimationScene.
    typedef std::uint64_t NodeId;

    constexpr NodeId InvalidNode = 0;

}

#endif
