#include "omegaAnim/Animation/AnimationTarget.h"

namespace OmegaAnim {

AnimationTarget::AnimationTarget(OmegaCommon::String name):_name(std::move(name)){

}

const OmegaCommon::String & AnimationTarget::name() const{
    return _name;
}

std::size_t AnimationTarget::componentCount() const{
    return components.size();
}

SharedHandle<AnimationTarget> AnimationTarget::Create(OmegaCommon::String name){
    return make<AnimationTarget>(std::move(name));
}

}
