#include "omegaAnim/Core/Core.h"

#ifndef OMEGAANIM_ANIMATION_ANIMATIONTARGET_H
#define OMEGAANIM_ANIMATION_ANIMATIONTARGET_H

namespace OmegaAnim {

    /// @brief An object whose fields are animated.
    /// Holds at most one component per C++ type; lenses reach fields through those components.
    class OMEGAANIM_EXPORT AnimationTarget {
        OmegaCommon::String _name;
        OmegaCommon::MapVec<std::type_index,SharedHandle<void>> components;
    public:
        explicit AnimationTarget(OmegaCommon::String name = {});

        const OmegaCommon::String & name() const;

        /// @brief Inserts (or replaces) a component.
        /// @returns A reference to the stored component.
        template<class C>
        C & insert(C component){
            auto stored = std::make_shared<C>(std::move(component));
            C & ref = *stored;
            components[std::type_index(typeid(C))] = std::static_pointer_cast<void>(stored);
            return ref;
        }

        /// @returns The component, or nullptr when absent.
        template<class C>
        C *get(){
            auto found = components.find(std::type_index(typeid(C)));
            if(found == components.end()){
                return nullptr;
            }
            return static_cast<C *>(found->second.get());
        }

        template<class C>
        const C *get() const{
            auto found = components.find(std::type_index(typeid(C)));
            if(found == components.end()){
                return nullptr;
            }
            return static_cast<const C *>(found->second.get());
        }

        template<class C>
        bool has() const{
            return components.find(std::type_index(typeid(C))) != components.end();
        }

        template<class C>
        bool remove(){
            return components.erase(std::type_index(typeid(C))) > 0;
        }

        std::size_t componentCount() const;

        static SharedHandle<AnimationTarget> Create(OmegaCommon::String name = {});
    };

    OMEGACOMMON_SHARED_CLASS(AnimationTarget);

}

#endif
