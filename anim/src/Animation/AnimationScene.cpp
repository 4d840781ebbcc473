#include "omegaAnim/Animation/AnimationScene.h"

namespace OmegaAnim {

static const OmegaCommon::Vector<NodeId> emptyChildren {};

detail::AnimationNode *AnimationScene::find(NodeId id){
    auto found = nodes.find(id);
    return found == nodes.end() ? nullptr : &found->second;
}

const detail::AnimationNode *AnimationScene::find(NodeId id) const{
    auto found = nodes.find(id);
    return found == nodes.end() ? nullptr : &found->second;
}

detail::AnimationNode *AnimationScene::node(NodeId id){
    return find(id);
}

NodeId AnimationScene::createRoot(AnimationTargetPtr target,CompositionKind kind){
    NodeId id = nextId++;
    auto & node = nodes[id];
    node.id = id;
    node.kind = kind;
    node.ownTarget = std::move(target);
    node.targetOwner = node.ownTarget != nullptr ? id : InvalidNode;
    node.playhead.emplace();
    return id;
}

NodeId AnimationScene::createNode(NodeId parent,CompositionKind kind,float duration){
    auto parentNode = find(parent);
    if(parentNode == nullptr){
        return InvalidNode;
    }
    NodeId id = nextId++;
    parentNode->children.push_back(id);

    detail::AnimationNode node {};
    node.id = id;
    node.parent = parent;
    node.kind = kind;
    node.duration = std::max(duration,0.f);
    node.targetOwner = parentNode->targetOwner;
    for(auto & entry : parentNode->channels){
        if(entry.second->lensOwner != InvalidNode){
            node.channels[entry.first] = entry.second->inherit();
        }
    }
    nodes.emplace(id,std::move(node));
    return id;
}

NodeId AnimationScene::createLeaf(NodeId parent,float duration,AnimationCurvePtr curve){
    NodeId id = createNode(parent,CompositionKind::Leaf,duration);
    if(id != InvalidNode){
        find(id)->curve = std::move(curve);
    }
    return id;
}

bool AnimationScene::removeNode(NodeId id){
    auto node = find(id);
    if(node == nullptr){
        return false;
    }
    if(node->parent != InvalidNode){
        auto parentNode = find(node->parent);
        if(parentNode != nullptr){
            auto & siblings = parentNode->children;
            siblings.erase(std::remove(siblings.begin(),siblings.end(),id),siblings.end());
        }
    }

    OmegaCommon::Vector<NodeId> worklist {id};
    while(!worklist.empty()){
        NodeId current = worklist.back();
        worklist.pop_back();
        auto found = nodes.find(current);
        if(found == nodes.end()){
            continue;
        }
        for(auto child : found->second.children){
            worklist.push_back(child);
        }
        nodes.erase(found);
    }
    return true;
}

bool AnimationScene::despawnNode(NodeId id){
    auto node = find(id);
    if(node == nullptr){
        return false;
    }
    auto parentNode = node->parent == InvalidNode ? nullptr : find(node->parent);
    if(parentNode != nullptr && !node->playhead.has_value()){
        const float span = layoutDuration(id);
        if(kind(node->parent) == CompositionKind::Parallel){
            parentNode->trailingGap = std::max(parentNode->trailingGap,span);
        }
        else {
            auto & siblings = parentNode->children;
            auto it = std::find(siblings.begin(),siblings.end(),id);
            detail::AnimationNode *next = nullptr;
            for(++it;it != siblings.end() && next == nullptr;++it){
                auto sibling = find(*it);
                if(sibling != nullptr && !sibling->playhead.has_value()){
                    next = sibling;
                }
            }
            const float held = node->leadingGap + span;
            if(next != nullptr){
                next->leadingGap += held;
            }
            else {
                parentNode->trailingGap += held;
            }
        }
    }
    return removeNode(id);
}

bool AnimationScene::contains(NodeId node) const{
    return find(node) != nullptr;
}

std::size_t AnimationScene::nodeCount() const{
    return nodes.size();
}

OmegaCommon::Vector<NodeId> AnimationScene::roots() const{
    OmegaCommon::Vector<NodeId> out;
    for(auto & entry : nodes){
        if(entry.second.parent == InvalidNode){
            out.push_back(entry.first);
        }
    }
    return out;
}

NodeId AnimationScene::parent(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? InvalidNode : node->parent;
}

const OmegaCommon::Vector<NodeId> & AnimationScene::children(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? emptyChildren : node->children;
}

CompositionKind AnimationScene::kind(NodeId id) const{
    auto node = find(id);
    if(node == nullptr || node->children.empty()){
        return CompositionKind::Leaf;
    }
    return node->kind == CompositionKind::Leaf ? CompositionKind::Sequence : node->kind;
}

bool AnimationScene::isLeaf(NodeId id) const{
    auto node = find(id);
    return node != nullptr && node->children.empty();
}

void AnimationScene::setDuration(NodeId id,float seconds){
    auto node = find(id);
    if(node != nullptr){
        node->duration = std::max(seconds,0.f);
    }
}

float AnimationScene::duration(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? 0.f : node->duration;
}

float AnimationScene::layoutDuration(NodeId id) const{
    auto node = find(id);
    if(node == nullptr){
        return 0.f;
    }
    if(node->children.empty()){
        return std::max(node->duration,node->trailingGap);
    }
    const bool parallel = node->kind == CompositionKind::Parallel;
    float total = 0.f;
    for(auto child : node->children){
        auto childNode = find(child);
        /// Independent clocks do not contribute to the parent's timing.
        if(childNode == nullptr || childNode->playhead.has_value()){
            continue;
        }
        float span = layoutDuration(child);
        total = parallel ? std::max(total,span) : total + childNode->leadingGap + span;
    }
    return parallel ? std::max(total,node->trailingGap) : total + node->trailingGap;
}

float AnimationScene::leadingGap(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? 0.f : node->leadingGap;
}

float AnimationScene::trailingGap(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? 0.f : node->trailingGap;
}

void AnimationScene::setCurve(NodeId id,AnimationCurvePtr curve){
    auto node = find(id);
    if(node != nullptr){
        node->curve = std::move(curve);
    }
}

AnimationCurvePtr AnimationScene::curve(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? nullptr : node->curve;
}

void AnimationScene::setCompletion(NodeId id,CompletionPolicy policy){
    auto node = find(id);
    if(node != nullptr){
        node->completion = policy;
    }
}

CompletionPolicy AnimationScene::completion(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? CompletionPolicy::Preserve : node->completion;
}

void AnimationScene::propagateTarget(NodeId from){
    auto origin = find(from);
    if(origin == nullptr){
        return;
    }
    const NodeId owner = origin->targetOwner;
    OmegaCommon::Vector<NodeId> worklist {from};
    while(!worklist.empty()){
        NodeId current = worklist.back();
        worklist.pop_back();
        auto node = find(current);
        if(node == nullptr){
            continue;
        }
        for(auto child : node->children){
            auto childNode = find(child);
            if(childNode == nullptr || childNode->ownTarget != nullptr){
                continue;
            }
            childNode->targetOwner = owner;
            worklist.push_back(child);
        }
    }
}

void AnimationScene::setTarget(NodeId id,AnimationTargetPtr target){
    auto node = find(id);
    if(node == nullptr){
        return;
    }
    node->ownTarget = std::move(target);
    if(node->ownTarget != nullptr){
        node->targetOwner = id;
    }
    else {
        auto parentNode = find(node->parent);
        node->targetOwner = parentNode == nullptr ? InvalidNode : parentNode->targetOwner;
    }
    propagateTarget(id);
}

AnimationTargetPtr AnimationScene::target(NodeId id) const{
    auto node = find(id);
    if(node == nullptr || node->targetOwner == InvalidNode){
        return nullptr;
    }
    auto owner = find(node->targetOwner);
    return owner == nullptr ? nullptr : owner->ownTarget;
}

NodeId AnimationScene::targetOwner(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? InvalidNode : node->targetOwner;
}

void AnimationScene::resetStartValues(NodeId id){
    OmegaCommon::Vector<NodeId> worklist {id};
    while(!worklist.empty()){
        NodeId current = worklist.back();
        worklist.pop_back();
        auto node = find(current);
        if(node == nullptr){
            continue;
        }
        for(auto & entry : node->channels){
            entry.second->clearStartValue();
        }
        for(auto child : node->children){
            worklist.push_back(child);
        }
    }
}

void AnimationScene::clearAnimations(NodeId id){
    auto node = find(id);
    if(node == nullptr){
        return;
    }
    for(auto & entry : node->channels){
        entry.second->clearAnimation();
    }
    node->callback = nullptr;
    node->eventTag.reset();
}

void AnimationScene::setCallback(NodeId id,AnimationCallback callback){
    auto node = find(id);
    if(node != nullptr){
        node->callback = std::move(callback);
        node->callbackFired = false;
    }
}

bool AnimationScene::hasCallback(NodeId id) const{
    auto node = find(id);
    return node != nullptr && node->callback != nullptr;
}

void AnimationScene::setEvent(NodeId id,OmegaCommon::String tag){
    auto node = find(id);
    if(node != nullptr){
        node->eventTag = std::move(tag);
        node->eventFired = false;
    }
}

Core::Optional<OmegaCommon::String> AnimationScene::event(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? Core::Optional<OmegaCommon::String>{} : node->eventTag;
}

bool AnimationScene::attachPlayhead(NodeId id){
    auto node = find(id);
    if(node == nullptr){
        return false;
    }
    if(!node->playhead.has_value()){
        node->playhead.emplace();
    }
    return true;
}

Playhead *AnimationScene::playhead(NodeId id){
    auto node = find(id);
    if(node == nullptr || !node->playhead.has_value()){
        return nullptr;
    }
    return &node->playhead.value();
}

const Playhead *AnimationScene::playhead(NodeId id) const{
    auto node = find(id);
    if(node == nullptr || !node->playhead.has_value()){
        return nullptr;
    }
    return &node->playhead.value();
}

OmegaCommon::Vector<NodeId> AnimationScene::playheadNodes() const{
    OmegaCommon::Vector<NodeId> out;
    for(auto & entry : nodes){
        if(entry.second.playhead.has_value()){
            out.push_back(entry.first);
        }
    }
    return out;
}

NodeId AnimationScene::governingPlayhead(NodeId id) const{
    auto node = find(id);
    while(node != nullptr){
        if(node->playhead.has_value()){
            return node->id;
        }
        node = find(node->parent);
    }
    return InvalidNode;
}

TimeDriver *AnimationScene::attachDriver(NodeId id,TimeDriver driver){
    auto node = find(id);
    if(node == nullptr){
        return nullptr;
    }
    if(!node->playhead.has_value()){
        node->playhead.emplace();
    }
    node->driver = driver;
    return &node->driver.value();
}

TimeDriver *AnimationScene::driver(NodeId id){
    auto node = find(id);
    if(node == nullptr || !node->driver.has_value()){
        return nullptr;
    }
    return &node->driver.value();
}

const TimeDriver *AnimationScene::driver(NodeId id) const{
    auto node = find(id);
    if(node == nullptr || !node->driver.has_value()){
        return nullptr;
    }
    return &node->driver.value();
}

void AnimationScene::collectLeavesInto(NodeId id,NodeId playheadNode,OmegaCommon::Vector<NodeId> & out) const{
    /// Explicit stack; children pushed in reverse so they pop in tree order.
    OmegaCommon::Vector<NodeId> stack {id};
    while(!stack.empty()){
        NodeId current = stack.back();
        stack.pop_back();
        auto node = find(current);
        if(node == nullptr){
            continue;
        }
        if(current != playheadNode && node->playhead.has_value()){
            continue;
        }
        if(node->children.empty()){
            out.push_back(current);
            continue;
        }
        for(auto it = node->children.rbegin();it != node->children.rend();++it){
            stack.push_back(*it);
        }
    }
}

OmegaCommon::Vector<NodeId> AnimationScene::leaves(NodeId playheadNode) const{
    OmegaCommon::Vector<NodeId> out;
    collectLeavesInto(playheadNode,playheadNode,out);
    return out;
}

bool AnimationScene::containsParallel(NodeId playheadNode) const{
    OmegaCommon::Vector<NodeId> stack {playheadNode};
    while(!stack.empty()){
        NodeId current = stack.back();
        stack.pop_back();
        auto node = find(current);
        if(node == nullptr || (current != playheadNode && node->playhead.has_value())){
            continue;
        }
        if(!node->children.empty() && node->kind == CompositionKind::Parallel){
            return true;
        }
        for(auto child : node->children){
            stack.push_back(child);
        }
    }
    return false;
}

void AnimationScene::setMovement(NodeId id,PlayheadMove move){
    auto node = find(id);
    if(node != nullptr){
        node->movement = move;
    }
}

Core::Optional<PlayheadMove> AnimationScene::movement(NodeId id) const{
    auto node = find(id);
    return node == nullptr ? Core::Optional<PlayheadMove>{} : node->movement;
}

const OmegaCommon::Vector<AnimationEvaluatorPtr> & AnimationScene::evaluators() const{
    return evaluatorList;
}

void AnimationScene::registerEvaluator(std::type_index key,const std::function<AnimationEvaluatorPtr()> & factory){
    if(evaluatorKeys.find(key) != evaluatorKeys.end()){
        return;
    }
    evaluatorKeys.insert(key);
    evaluatorList.push_back(factory());
}

}
