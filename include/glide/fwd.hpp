#pragma once

namespace glide
{

class Animation;
struct AnimationConfig;
class AnimationCanceled;
class TaskQueue;
class FrameLoop;
struct Frame;
class Logger;

namespace timing
{
class Gravitate;
struct GravitateSection;
}   // namespace timing

}   // namespace glide
