#include "omegaAnim/Core/Core.h"
#include "omegaAnim/Core/Status.h"
#include "omegaAnim/Core/Math.h"
#include "omegaAnim/Core/Tuning.h"

#include "omegaAnim/Animation/AnimationValue.h"
#include "omegaAnim/Animation/AnimationCurve.h"
#include "omegaAnim/Animation/AnimationTarget.h"
#include "omegaAnim/Animation/FieldLens.h"
#include "omegaAnim/Animation/Playhead.h"
#include "omegaAnim/Animation/TimeDriver.h"
#include "omegaAnim/Animation/AnimationScene.h"
#include "omegaAnim/Animation/Evaluators.h"
#include "omegaAnim/Animation/AnimationRuntime.h"

#ifndef OMEGAANIM_H
#define OMEGAANIM_H

#endif
