#include "TestSupport.h"

using namespace OmegaAnim;
using OmegaAnimTest::Transform;
using OmegaAnimTest::AudioGain;
using OmegaAnimTest::Sprite;

namespace {

struct Slider {
    AnimationScene scene;
    AnimationTargetPtr target = AnimationTarget::Create("slider");
    NodeId root = InvalidNode;
    NodeId leaf = InvalidNode;

    explicit Slider(AnimationCurvePtr curve = nullptr){
        target->insert(Transform{});
        root = scene.createRoot(target);
        scene.setLens<Vec3>(root,OMEGAANIM_LENS(Transform,translation));
        leaf = scene.createLeaf(root,2.f,std::move(curve));
        scene.addDelta<Vec3>(leaf,Vec3{8.f,0.f,-4.f});
    }

    Vec3 translation(){
        return target->get<Transform>()->translation;
    }
};

void accumulatesOverTicks(OmegaAnimTest::Expectations & e){
    Slider s;
    s.target->get<Transform>()->translation = Vec3{1.f,1.f,1.f};
    AnimationRuntime runtime(s.scene,OmegaAnimTest::quietTuning());
    s.scene.attachDriver(s.root);

    runtime.update(0.5f);
    e.expectNear(s.translation().x,3.f,"quarter of the delta added to the live value");
    e.expectNear(s.translation().z,0.f,"negative component");
    runtime.update(1.5f);
    e.expectNear(s.translation().x,9.f,"full delta applied by the end");
    e.expectNear(s.translation().y,1.f,"untouched component");
    runtime.update(1.f);
    e.expectNear(s.translation().x,9.f,"nothing added once finished and paused");
}

void coexistsWithOtherWriters(OmegaAnimTest::Expectations & e){
    Slider s;
    AnimationRuntime runtime(s.scene,OmegaAnimTest::quietTuning());
    s.scene.attachDriver(s.root);

    runtime.update(1.f);
    /// Someone else moves the field; the delta is additive on top.
    s.target->get<Transform>()->translation.x += 100.f;
    runtime.update(1.f);
    e.expectNear(s.translation().x,108.f,"external writes are preserved");
}

void reversalUndoes(OmegaAnimTest::Expectations & e){
    Slider s(AnimationCurve::Named(EaseFamily::Cubic,EaseMode::InOut));
    AnimationRuntime runtime(s.scene,OmegaAnimTest::quietTuning());

    s.scene.playhead(s.root)->set(1.5f);
    runtime.update(0.f);
    Vec3 forward = s.translation();
    e.expect(forward.x > 0.f,"moved forward");

    s.scene.playhead(s.root)->set(0.f);
    runtime.update(0.f);
    e.expectNear(s.translation().x,0.f,"reverse playback removes exactly what was added",1e-4f);
    e.expectNear(s.translation().z,0.f,"all components restored",1e-4f);
}

void deterministicWindows(OmegaAnimTest::Expectations & e){
    /// Replaying the same window twice adds the same offset twice.
    Slider s(AnimationCurve::EaseOut());
    DeltaEvaluator<Vec3> evaluator;
    StageContext context(0,false);

    s.scene.setMovement(s.leaf,PlayheadMove{0.4f,1.2f});
    e.expect(evaluator.evaluate(s.scene,context,s.leaf).ok(),"first replay");
    float once = s.translation().x;
    e.expect(evaluator.evaluate(s.scene,context,s.leaf).ok(),"second replay");
    e.expectNear(s.translation().x,once * 2.f,"identical windows add identical offsets");

    s.scene.setMovement(s.leaf,PlayheadMove{0.7f,0.7f});
    e.expect(evaluator.evaluate(s.scene,context,s.leaf).ok(),"empty window");
    e.expectNear(s.translation().x,once * 2.f,"empty window is a no-op");

    s.scene.setDuration(s.leaf,4.f);
    s.scene.setMovement(s.leaf,PlayheadMove{0.f,4.f});
    s.target->get<Transform>()->translation = Vec3{};
    e.expect(evaluator.evaluate(s.scene,context,s.leaf).ok(),"duration changed mid-flight");
    e.expectNear(s.translation().x,8.f,"full window after a duration change still totals the delta");
}

void rotationDelta(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    auto target = AnimationTarget::Create("spinner");
    target->insert(Transform{});
    NodeId root = scene.createRoot(target);
    scene.setLens<Quat>(root,OMEGAANIM_LENS(Transform,rotation));
    NodeId spin = scene.createLeaf(root,1.f);
    const float halfPi = 1.5707963f;
    scene.addDelta<Quat>(spin,Quat::FromRotationZ(halfPi));

    AnimationRuntime runtime(scene,OmegaAnimTest::quietTuning());
    scene.attachDriver(root);
    runtime.update(0.25f);
    runtime.update(0.25f);
    e.expect(target->get<Transform>()->rotation.approxEquals(Quat::FromRotationZ(halfPi * 0.5f)),"half a quarter turn");
    runtime.update(0.5f);
    e.expect(target->get<Transform>()->rotation.approxEquals(Quat::FromRotationZ(halfPi)),"full quarter turn composed");
}

void volumeAndColorDelta(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    auto target = AnimationTarget::Create("mix");
    target->insert(AudioGain{Volume::Decibels(-10.f)});
    target->insert(Sprite{});
    NodeId root = scene.createRoot(target,CompositionKind::Parallel);
    NodeId duck = scene.createLeaf(root,1.f);
    scene.setLens<Volume>(duck,OMEGAANIM_LENS(AudioGain,volume));
    scene.addDelta<Volume>(duck,Volume::Decibels(-6.f));
    NodeId dim = scene.createLeaf(root,1.f);
    scene.setLens<Color>(dim,OMEGAANIM_LENS(Sprite,tint));
    scene.addDelta<Color>(dim,Color::Rgba(-0.5f,-0.5f,-0.5f,0.f));

    AnimationRuntime runtime(scene,OmegaAnimTest::quietTuning());
    scene.attachDriver(root);
    TickReport report = runtime.update(1.f);
    e.expect(report.ok(),"parallel deltas of different types");
    e.expect(report.stageCount == 1,"parallel leaves share one stage");
    e.expect(target->get<AudioGain>()->volume.approxEquals(Volume::Decibels(-16.f)),"volume ducked by 6 dB");
    e.expectNear(target->get<Sprite>()->tint.r,0.5f,"tint dimmed");
    e.expectNear(target->get<Sprite>()->tint.a,1.f,"alpha untouched");
}

void fieldMissing(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    auto target = AnimationTarget::Create("no transform");
    NodeId root = scene.createRoot(target);
    scene.setLens<Vec3>(root,OMEGAANIM_LENS(Transform,translation));
    NodeId leaf = scene.createLeaf(root,1.f);
    scene.addDelta<Vec3>(leaf,Vec3{1.f,0.f,0.f});

    AnimationRuntime runtime(scene,OmegaAnimTest::quietTuning());
    scene.attachDriver(root);
    TickReport report = runtime.update(0.5f);
    auto failure = report.failureFor(leaf);
    e.expect(failure != nullptr && failure->status.code == ErrorCode::FieldMissing,"missing component reports FieldMissing");
}

}

int main(int argc,char *argv[]){
    (void)argc;
    (void)argv;
    OmegaAnimTest::Expectations e("DeltaEvaluatorTest");
    accumulatesOverTicks(e);
    coexistsWithOtherWriters(e);
    reversalUndoes(e);
    deterministicWindows(e);
    rotationDelta(e);
    volumeAndColorDelta(e);
    fieldMissing(e);
    return e.finish();
}
