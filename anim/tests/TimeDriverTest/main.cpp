#include "TestSupport.h"

using namespace OmegaAnim;

namespace {

struct TwoSecondSequence {
    AnimationScene scene;
    NodeId root = InvalidNode;

    TwoSecondSequence(){
        root = scene.createRoot(AnimationTarget::Create("timeline"));
        scene.createLeaf(root,1.f);
        scene.createLeaf(root,1.f);
    }
};

void once(OmegaAnimTest::Expectations & e){
    TwoSecondSequence t;
    auto observer = std::make_shared<OmegaAnimTest::RecordingObserver>();
    AnimationRuntime runtime(t.scene,OmegaAnimTest::quietTuning());
    runtime.addObserver(observer);
    TimeDriver *driver = t.scene.attachDriver(t.root);

    TickReport first = runtime.update(0.5f);
    e.expect(first.hasSignal(t.root,SequenceSignal::Started),"SequenceStarted on the first move");
    e.expect(observer->started.size() == 1,"observer saw the start");

    runtime.update(1.5f);
    e.expect(observer->completed.size() == 1,"SequenceCompleted at the end");
    e.expect(!driver->playing(),"Once mode pauses");
    e.expectNear(t.scene.playhead(t.root)->get(),2.f,"playhead stays at the end");

    TickReport idle = runtime.update(1.f);
    e.expect(idle.stepCount == 0,"a paused driver produces no movement");

    driver->play();
    driver->speed = -1.f;
    TickReport back = runtime.update(0.5f);
    e.expect(back.stepCount == 1,"resumed in reverse");
    e.expect(back.hasSignal(t.root,SequenceSignal::Started),"leaving the end in reverse starts the sequence");
}

void pingPong(OmegaAnimTest::Expectations & e){
    TwoSecondSequence t;
    AnimationRuntime runtime(t.scene,OmegaAnimTest::quietTuning());
    TimeDriver *driver = t.scene.attachDriver(t.root,TimeDriver(PlaybackMode::Repeat(RepeatMode::PingPong)));

    TickReport report = runtime.update(2.f);
    e.expect(report.hasSignal(t.root,SequenceSignal::Completed),"forward pass completes");
    e.expectNear(driver->speed,-1.f,"speed negated immediately after completion");
    e.expect(driver->playing(),"ping-pong keeps playing");

    runtime.update(1.f);
    e.expectNear(t.scene.playhead(t.root)->get(),1.f,"moving backwards");
    TickReport back = runtime.update(1.f);
    e.expect(back.hasSignal(t.root,SequenceSignal::Completed),"reaching 0 completes the reverse pass");
    e.expectNear(driver->speed,1.f,"direction flips again at 0");

    TickReport again = runtime.update(0.5f);
    e.expect(again.hasSignal(t.root,SequenceSignal::Started),"forward pass starts again");
}

void restart(OmegaAnimTest::Expectations & e){
    TwoSecondSequence t;
    auto observer = std::make_shared<OmegaAnimTest::RecordingObserver>();
    AnimationRuntime runtime(t.scene,OmegaAnimTest::quietTuning());
    runtime.addObserver(observer);
    t.scene.attachDriver(t.root,TimeDriver(PlaybackMode::Repeat(RepeatMode::Restart)));

    runtime.update(1.5f);
    runtime.update(0.75f);
    e.expect(observer->completed.size() == 1,"completed once");
    /// Overshoot past the end is dropped by the restart.
    e.expectNear(t.scene.playhead(t.root)->get(),0.f,"jumped to 0");
    e.expectNear(t.scene.playhead(t.root)->previous(),0.f,"jump produces no movement");

    TickReport next = runtime.update(0.25f);
    e.expect(next.hasSignal(t.root,SequenceSignal::Started),"next pass starts from 0");
    e.expect(next.stepCount == 1,"one leaf in the next pass");
}

void playheadApi(OmegaAnimTest::Expectations & e){
    Playhead playhead;
    playhead.set(1.5f);
    e.expect(playhead.moved(),"set marks a pending move");
    e.expectNear(playhead.advance(),0.f,"advance returns the previous position");
    e.expect(!playhead.moved(),"advance consumes the move");
    playhead.jumpTo(3.f);
    e.expect(!playhead.moved(),"jumpTo is not a move");
    e.expectNear(playhead.get(),3.f,"jumpTo sets the position");

    TimeDriver driver;
    e.expect(driver.mode == PlaybackMode::Once() && driver.playing(),"defaults");
    driver.pause();
    driver.drive(playhead,1.f);
    e.expectNear(playhead.get(),3.f,"paused driver does not move the playhead");
    driver.play();
    driver.speed = 2.f;
    driver.drive(playhead,0.5f);
    e.expectNear(playhead.get(),4.f,"speed scales the delta");
}

void maxTickDelta(OmegaAnimTest::Expectations & e){
    TwoSecondSequence t;
    RuntimeTuning tuning = OmegaAnimTest::quietTuning();
    tuning.maxTickDelta = 0.25;
    AnimationRuntime runtime(t.scene,tuning);
    t.scene.attachDriver(t.root);
    runtime.update(10.f);
    e.expectNear(t.scene.playhead(t.root)->get(),0.25f,"delta clamped by tuning");
}

void independentClocks(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    NodeId outer = scene.createRoot(AnimationTarget::Create("outer"));
    scene.createLeaf(outer,1.f);
    NodeId inner = scene.createNode(outer);
    scene.createLeaf(inner,4.f);
    scene.attachDriver(outer);
    TimeDriver *innerDriver = scene.attachDriver(inner);
    innerDriver->speed = 0.5f;

    auto observer = std::make_shared<OmegaAnimTest::RecordingObserver>();
    AnimationRuntime runtime(scene,OmegaAnimTest::quietTuning());
    runtime.addObserver(observer);
    runtime.update(1.f);
    e.expectNear(scene.playhead(inner)->get(),0.5f,"inner clock runs at its own speed");
    e.expect(observer->completed.size() == 1 && observer->completed[0] == outer,"outer completes without waiting for the inner subtree");
}

}

int main(int argc,char *argv[]){
    (void)argc;
    (void)argv;
    OmegaAnimTest::Expectations e("TimeDriverTest");
    once(e);
    pingPong(e);
    restart(e);
    playheadApi(e);
    maxTickDelta(e);
    independentClocks(e);
    return e.finish();
}
