#include "TestSupport.h"

using namespace OmegaAnim;

namespace {

struct ThreeLeaves {
    AnimationScene scene;
    NodeId root = InvalidNode;
    NodeId a = InvalidNode,b = InvalidNode,c = InvalidNode;

    ThreeLeaves(){
        root = scene.createRoot(AnimationTarget::Create("seq"));
        a = scene.createLeaf(root,1.f);
        b = scene.createLeaf(root,0.5f);
        c = scene.createLeaf(root,0.5f);
    }
};

void forwardWithinLeaf(OmegaAnimTest::Expectations & e){
    ThreeLeaves t;
    e.expectNear(t.scene.layoutDuration(t.root),2.f,"sequence duration is the sum");

    auto r = PlayheadTracer::trace(t.scene,t.root,0.f,0.5f);
    e.expect(r.forward,"forward move");
    e.expect(r.stages.size() == 1 && r.stepCount() == 1,"one step in one stage");
    auto step = r.stages[0][0];
    e.expect(step.leaf == t.a,"first leaf owns the position");
    e.expectNear(step.move.start,0.f,"window start");
    e.expectNear(step.move.end,0.5f,"window end");
    e.expect(step.started,"starting at 0 flags SequenceStarted");
    e.expect(!step.ended,"not ended");
}

void forwardAcrossLeaves(OmegaAnimTest::Expectations & e){
    ThreeLeaves t;
    auto r = PlayheadTracer::trace(t.scene,t.root,0.5f,1.4f);
    e.expect(r.stages.size() == 2,"two leaves touched in two stages");
    auto first = r.stages[0][0];
    auto second = r.stages[1][0];
    e.expect(first.leaf == t.a && second.leaf == t.b,"leaves in tree order");
    e.expectNear(first.move.start,0.5f,"first window start");
    e.expectNear(first.move.end,1.f,"first window clipped at its duration");
    e.expectNear(second.move.start,0.f,"second window from 0");
    e.expectNear(second.move.end,0.4f,"second window ends at the playhead");
    e.expect(!first.started,"no start flag past 0");
    e.expect(r.completions.size() == 1 && r.completions[0].node == t.a,"only the crossed leaf completed");

    auto end = PlayheadTracer::trace(t.scene,t.root,1.4f,2.5f);
    auto flat = end.flatten();
    e.expect(!flat.empty() && flat.back().leaf == t.c,"last leaf reached");
    e.expect(!flat.empty() && flat.back().ended,"passing the end flags SequenceCompleted");
    e.expectNear(flat.back().move.end,0.5f,"window clipped at the last leaf's end");
}

void tiling(OmegaAnimTest::Expectations & e){
    ThreeLeaves t;
    OmegaCommon::Map<NodeId,float> covered;
    float previous = 0.f;
    const float ticks[] = {0.25f,0.75f,1.f,1.25f,1.5f,2.f};
    bool contiguous = true;
    OmegaCommon::Map<NodeId,float> lastEnd;
    for(float current : ticks){
        auto r = PlayheadTracer::trace(t.scene,t.root,previous,current);
        for(auto & step : r.flatten()){
            auto found = lastEnd.find(step.leaf);
            float expectedStart = found == lastEnd.end() ? 0.f : found->second;
            contiguous = contiguous && std::fabs(step.move.start - expectedStart) < 1e-5f;
            covered[step.leaf] += step.move.end - step.move.start;
            lastEnd[step.leaf] = step.move.end;
        }
        previous = current;
    }
    e.expect(contiguous,"windows continue where the previous one ended");
    e.expectNear(covered[t.a],1.f,"leaf a fully covered once");
    e.expectNear(covered[t.b],0.5f,"leaf b fully covered once");
    e.expectNear(covered[t.c],0.5f,"leaf c fully covered once");
}

void zeroDuration(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    NodeId root = scene.createRoot(AnimationTarget::Create("z"));
    NodeId z0 = scene.createLeaf(root,0.f);
    NodeId z1 = scene.createLeaf(root,0.f);
    NodeId tail = scene.createLeaf(root,1.f);

    auto r = PlayheadTracer::trace(scene,root,0.f,0.5f);
    e.expect(r.stages.size() == 3,"each zero-length leaf gets its own stage");
    e.expect(r.stages[0][0].leaf == z0 && r.stages[1][0].leaf == z1 && r.stages[2][0].leaf == tail,"stage order");
    e.expectNear(r.stages[0][0].move.start,0.f,"zero leaf start");
    e.expectNear(r.stages[0][0].move.end,0.f,"zero leaf end");
    e.expect(r.stages[0][0].started,"first zero leaf carries the start flag");
    e.expect(!r.stages[1][0].started,"only the first step is flagged");

    AnimationScene single;
    NodeId only = single.createRoot(AnimationTarget::Create("only"));
    NodeId instant = single.createLeaf(only,0.f);
    auto s = PlayheadTracer::trace(single,only,0.f,0.1f);
    e.expect(s.stepCount() == 1 && s.stages[0][0].leaf == instant,"lone zero leaf traversed");
    e.expect(s.stages[0][0].started && s.stages[0][0].ended,"lone zero leaf starts and ends the sequence");
}

void nestedAndParallel(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    NodeId root = scene.createRoot(AnimationTarget::Create("n"));
    NodeId intro = scene.createLeaf(root,1.f);
    NodeId group = scene.createNode(root,CompositionKind::Parallel);
    NodeId left = scene.createLeaf(group,1.f);
    NodeId right = scene.createLeaf(group,0.5f);
    NodeId outro = scene.createLeaf(root,1.f);

    e.expectNear(scene.layoutDuration(group),1.f,"parallel duration is the max");
    e.expectNear(scene.layoutDuration(root),3.f,"nested duration");

    auto r = PlayheadTracer::trace(scene,root,0.5f,1.75f);
    e.expect(r.stages.size() == 2,"parallel children share a stage");
    e.expect(r.stages[1].size() == 2,"both parallel children step together");
    bool sawLeft = false,sawRight = false;
    for(auto & step : r.stages[1]){
        if(step.leaf == left){
            sawLeft = true;
            e.expectNear(step.move.end,0.75f,"left window");
        }
        if(step.leaf == right){
            sawRight = true;
            e.expectNear(step.move.end,0.5f,"right window clipped");
        }
    }
    e.expect(sawLeft && sawRight,"both parallel leaves present");
    e.expect(r.stages[0][0].leaf == intro,"intro first");

    auto finish = PlayheadTracer::trace(scene,root,1.75f,3.f);
    auto flat = finish.flatten();
    e.expect(!flat.empty() && flat.back().leaf == outro && flat.back().ended,"outro completes the sequence");
    bool groupCompleted = false;
    for(auto & completion : finish.completions){
        groupCompleted = groupCompleted || (completion.node == group && completion.composite);
    }
    e.expect(groupCompleted,"parallel composite completes once its longest child does");

    auto back = PlayheadTracer::trace(scene,root,2.5f,2.f);
    e.expect(back.unsupported && back.stepCount() == 0,"reverse through a parallel is flagged");
}

void backward(OmegaAnimTest::Expectations & e){
    ThreeLeaves t;
    auto r = PlayheadTracer::trace(t.scene,t.root,2.f,1.25f);
    e.expect(!r.forward,"backward move");
    e.expect(r.stages.size() == 2,"two leaves swept");
    auto first = r.stages[0][0];
    auto second = r.stages[1][0];
    e.expect(first.leaf == t.c && second.leaf == t.b,"reverse leaf order");
    e.expectNear(first.move.start,0.5f,"c window start");
    e.expectNear(first.move.end,0.f,"c window end");
    e.expectNear(second.move.start,0.5f,"b window start");
    e.expectNear(second.move.end,0.25f,"b window end");
    e.expect(first.started,"leaving the end flags SequenceStarted");
    e.expect(!second.ended,"not at zero yet");

    auto rest = PlayheadTracer::trace(t.scene,t.root,1.25f,-0.1f);
    auto flat = rest.flatten();
    e.expect(flat.size() == 2,"b and a swept");
    e.expect(flat.back().leaf == t.a && flat.back().ended,"reaching 0 on the first leaf ends the sequence");
    e.expectNear(flat.back().move.end,0.f,"window clamped at 0");
    e.expect(!flat.front().started,"no start flag mid sequence");
}

void backwardNested(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    NodeId root = scene.createRoot(AnimationTarget::Create("nested"));
    NodeId a = scene.createLeaf(root,1.f);
    NodeId inner = scene.createNode(root);
    NodeId b = scene.createLeaf(inner,0.5f);
    NodeId c = scene.createLeaf(inner,0.5f);
    NodeId d = scene.createLeaf(root,1.f);
    e.expectNear(scene.layoutDuration(root),3.f,"nested sequence duration");

    auto across = PlayheadTracer::trace(scene,root,1.75f,1.25f);
    e.expect(!across.unsupported,"nested sequences reverse fine");
    auto inside = across.flatten();
    e.expect(inside.size() == 2 && inside[0].leaf == c && inside[1].leaf == b,"inner boundary crossed in reverse order");
    e.expect(inside.size() == 2 && inside[0].stage == 0 && inside[1].stage == 1,"one stage per leaf");
    e.expectNear(inside[0].move.start,0.25f,"c window start");
    e.expectNear(inside[0].move.end,0.f,"c window end");
    e.expectNear(inside[1].move.start,0.5f,"b window start");
    e.expectNear(inside[1].move.end,0.25f,"b window end");

    auto wide = PlayheadTracer::trace(scene,root,2.25f,0.75f);
    auto steps = wide.flatten();
    e.expect(steps.size() == 4,"every leaf in range swept");
    e.expect(steps.size() == 4 && steps[0].leaf == d && steps[1].leaf == c && steps[2].leaf == b && steps[3].leaf == a,
             "innermost most recent leaf first");
    e.expectNear(steps[0].move.start,0.25f,"d window start");
    e.expectNear(steps[3].move.start,1.f,"a window start");
    e.expectNear(steps[3].move.end,0.75f,"a window end");
    e.expect(!steps[3].ended,"not at zero yet");

    auto toZero = PlayheadTracer::trace(scene,root,0.75f,0.f);
    auto last = toZero.flatten();
    e.expect(last.size() == 1 && last[0].leaf == a,"only the first leaf remains");
    e.expect(last.size() == 1 && last[0].ended,"reaching 0 ends the sequence");
    e.expectNear(last[0].move.end,0.f,"window ends at 0");
}

void despawnKeepsOffsets(OmegaAnimTest::Expectations & e){
    ThreeLeaves t;
    e.expect(t.scene.despawnNode(t.b),"middle leaf despawned");
    e.expectNear(t.scene.layoutDuration(t.root),2.f,"span kept");
    e.expectNear(t.scene.leadingGap(t.c),0.5f,"gap moved onto the next leaf");

    auto r = PlayheadTracer::trace(t.scene,t.root,1.4f,1.75f);
    auto steps = r.flatten();
    e.expect(steps.size() == 1 && steps[0].leaf == t.c,"only the last leaf is reached");
    e.expectNear(steps[0].move.start,0.f,"window starts at the leaf");
    e.expectNear(steps[0].move.end,0.25f,"leaf starts at its original offset");

    auto end = PlayheadTracer::trace(t.scene,t.root,1.75f,2.f);
    auto finish = end.flatten();
    e.expect(finish.size() == 1 && finish[0].ended,"sequence ends at the original total");

    auto back = PlayheadTracer::trace(t.scene,t.root,2.f,1.2f);
    auto reversed = back.flatten();
    e.expect(reversed.size() == 1 && reversed[0].leaf == t.c,"gap holds no leaf");
    e.expectNear(reversed[0].move.end,0.f,"c swept back to its start");

    e.expect(t.scene.removeNode(t.c),"plain removal");
    e.expectNear(t.scene.layoutDuration(t.root),1.f,"removal drops the node and its gap");
}

void independentPlayhead(OmegaAnimTest::Expectations & e){
    AnimationScene scene;
    NodeId root = scene.createRoot(AnimationTarget::Create("outer"));
    NodeId a = scene.createLeaf(root,1.f);
    NodeId inner = scene.createNode(root);
    scene.createLeaf(inner,5.f);
    scene.attachPlayhead(inner);
    NodeId b = scene.createLeaf(root,1.f);

    e.expectNear(scene.layoutDuration(root),2.f,"independent subtree excluded from timing");
    auto leaves = scene.leaves(root);
    e.expect(leaves.size() == 2 && leaves[0] == a && leaves[1] == b,"independent subtree excluded from traversal");
    e.expect(scene.leaves(inner).size() == 1,"inner playhead sees its own leaf");
}

}

int main(int argc,char *argv[]){
    (void)argc;
    (void)argv;
    OmegaAnimTest::Expectations e("PlayheadTracerTest");
    forwardWithinLeaf(e);
    forwardAcrossLeaves(e);
    tiling(e);
    zeroDuration(e);
    nestedAndParallel(e);
    backward(e);
    backwardNested(e);
    despawnKeepsOffsets(e);
    independentPlayhead(e);
    return e.finish();
}
