#include "omegaAnim/Core/Status.h"
#include "AnimationTarget.h"

#ifndef OMEGAANIM_ANIMATION_FIELDLENS_H
#define OMEGAANIM_ANIMATION_FIELDLENS_H

namespace OmegaAnim {

    /// @brief Type-erased read/write access to one field of type T on an AnimationTarget.
    template<typename T>
    class FieldLens {
    public:
        virtual Status get(AnimationTarget & target,T & out) const = 0;
        virtual Status set(AnimationTarget & target,const T & value) const = 0;
        /// @brief Human readable description used in traces and failure reasons.
        virtual OmegaCommon::String describe() const = 0;
        virtual ~FieldLens() = default;
    };

    template<typename T>
    using FieldLensPtr = SharedHandle<FieldLens<T>>;

    /// @brief A lens that reaches a field through a component of type C.
    template<class C,typename T>
    class ComponentFieldLens final : public FieldLens<T> {
        std::function<T *(C &)> accessor;
        OmegaCommon::String label;

        Status missing(AnimationTarget & target) const{
            return Status::FieldMissing(OmegaCommon::fmtString("target '@{0}' has no component for lens @{1}",
                                                               target.name(),label));
        }
    public:
        ComponentFieldLens(std::function<T *(C &)> accessor,OmegaCommon::String label):
        accessor(std::move(accessor)),label(std::move(label)){

        }

        Status get(AnimationTarget & target,T & out) const override{
            C *component = target.get<C>();
            if(component == nullptr){
                return missing(target);
            }
            T *field = accessor(*component);
            if(field == nullptr){
                return missing(target);
            }
            out = *field;
            return Status::Ok();
        }

        Status set(AnimationTarget & target,const T & value) const override{
            C *component = target.get<C>();
            if(component == nullptr){
                return missing(target);
            }
            T *field = accessor(*component);
            if(field == nullptr){
                return missing(target);
            }
            *field = value;
            return Status::Ok();
        }

        OmegaCommon::String describe() const override{
            return label;
        }
    };

    /// @brief Builds a lens for a direct member, e.g. `makeFieldLens(&Transform::translation)`.
    template<class C,typename T>
    FieldLensPtr<T> makeFieldLens(T C::*member,OmegaCommon::String label = "field"){
        return std::make_shared<ComponentFieldLens<C,T>>([member](C & component) -> T * {
            return &(component.*member);
        },std::move(label));
    }

    /// @brief Builds a lens from an accessor, for nested or conditional fields.
    /// The accessor may return nullptr to report the field as missing.
    template<class C,typename T>
    FieldLensPtr<T> makeFieldLens(std::function<T *(C &)> accessor,OmegaCommon::String label = "accessor"){
        return std::make_shared<ComponentFieldLens<C,T>>(std::move(accessor),std::move(label));
    }

}

#define OMEGAANIM_LENS(component,field) ::OmegaAnim::makeFieldLens(&component::field,#component "." #field)

#endif
