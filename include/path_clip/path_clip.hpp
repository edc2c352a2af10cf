#ifndef PATH_CLIP_PATH_CLIP_HPP
#define PATH_CLIP_PATH_CLIP_HPP

#include "base.hpp"
#include "roots.hpp"
#include "segment.hpp"
#include "path.hpp"
#include "intersect.hpp"
#include "contain.hpp"
#include "error.hpp"
#include "split.hpp"
#include "stitch.hpp"
#include "clip.hpp"

#endif
