#include "omegaAnim/Animation/TimeDriver.h"
#include "omegaAnim/Animation/Playhead.h"

namespace OmegaAnim {

PlaybackMode PlaybackMode::Once(){
    return PlaybackMode{Kind::Once,RepeatMode::Restart};
}

PlaybackMode PlaybackMode::Repeat(RepeatMode repeat){
    return PlaybackMode{Kind::Repeat,repeat};
}

bool PlaybackMode::operator==(const PlaybackMode & rhs) const{
    if(kind != rhs.kind){
        return false;
    }
    return kind == Kind::Once || repeat == rhs.repeat;
}

TimeDriver::TimeDriver(PlaybackMode mode,float speed):speed(speed),mode(mode){

}

void TimeDriver::play(){
    state = PlaybackState::Play;
}

void TimeDriver::pause(){
    state = PlaybackState::Pause;
}

bool TimeDriver::playing() const{
    return state == PlaybackState::Play;
}

void TimeDriver::drive(Playhead & playhead,float deltaSeconds) const{
    if(!playing()){
        return;
    }
    playhead.set(playhead.get() + (deltaSeconds * speed));
}

void TimeDriver::onSequenceCompleted(Playhead & playhead){
    if(mode.kind == PlaybackMode::Kind::Once){
        pause();
        return;
    }
    switch(mode.repeat){
        case RepeatMode::Restart:
            /// TODO: wrap the overshoot (position - total) instead of dropping it.
            playhead.jumpTo(0.f);
            break;
        case RepeatMode::PingPong:
            speed = -speed;
            break;
    }
}

}
