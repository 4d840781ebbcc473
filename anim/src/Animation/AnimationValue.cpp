#include "omegaAnim/Animation/AnimationValue.h"

namespace OmegaAnim {

Volume AnimationValue<Volume>::lerp(const Volume & a,const Volume & b,float t){
    if(a.unit == Volume::Unit::Linear && b.unit == Volume::Unit::Linear){
        return Volume::Linear(OmegaAnim::lerp(a.value,b.value,t));
    }
    if(a.unit == Volume::Unit::Decibels && b.unit == Volume::Unit::Decibels){
        return Volume::Decibels(OmegaAnim::lerp(a.value,b.value,t));
    }
    /// Mixed units interpolate in decibels; decibels() already floors the linear side.
    return Volume::Decibels(OmegaAnim::lerp(a.decibels(),b.decibels(),t));
}

Volume AnimationValue<Volume>::difference(const Volume & a,const Volume & b){
    if(a.unit == Volume::Unit::Linear && b.unit == Volume::Unit::Linear && b.value != 0.f){
        return Volume::Linear(a.value / b.value);
    }
    return Volume::Decibels(a.decibels() - b.decibels());
}

void AnimationValue<Volume>::accumulate(Volume & self,const Volume & delta){
    if(self.unit == Volume::Unit::Linear && delta.unit == Volume::Unit::Linear){
        self.value *= delta.value;
        return;
    }
    self = Volume::Decibels(std::max(self.decibels() + delta.decibels(),Volume::SilenceDb));
}

Volume AnimationValue<Volume>::identity(){
    return Volume::Linear(1.f);
}

}
