#ifndef PATH_CLIP_CLIP_HPP
#define PATH_CLIP_CLIP_HPP

#include <vector>
#include <optional>
#include <memory_resource>
#include <string_view>
#include <span>
#include <cstddef>

#include "base.hpp"
#include "segment.hpp"
#include "path.hpp"
#include "intersect.hpp"
#include "contain.hpp"
#include "error.hpp"
#include "split.hpp"
#include "stitch.hpp"


namespace path_clip {

enum class tolerance_mode {
    /** The tolerance is a distance in the same units as the coordinates */
    absolute,

    /** The tolerance is multiplied by the length of the diagonal of the box
    containing both inputs */
    relative
};

/** Which part of the open path to keep */
enum class keep_side {inside,outside};

/** Convert "inside" or "outside" to a `keep_side` value. Anything else gives
nothing. */
inline std::optional<keep_side> parse_keep_side(std::string_view x) {
    if(x == "inside") return keep_side::inside;
    if(x == "outside") return keep_side::outside;
    return std::nullopt;
}

inline const char *to_string(keep_side x) {
    return x == keep_side::inside ? "inside" : "outside";
}

template<coordinate Coord> struct clip_options {
    /** The distance under which two points are considered the same. This is
    also how far a point can be from the outline of the clipping region and
    still be considered on it. */
    Coord tolerance = coord_ops<Coord>::default_tolerance();

    tolerance_mode mode = tolerance_mode::relative;

    fill_rule_t fill_rule = fill_rule_t::even_odd;

    /** If true, the parts outside of the clipping region are kept instead of
    the parts inside */
    bool invert = false;

    /** How many times a pair of curves may be split in half while looking for
    their intersections */
    unsigned int max_subdivision_depth = 40;

    clip_options &keep(keep_side x) {
        invert = x == keep_side::outside;
        return *this;
    }
};

namespace detail {

template<coordinate Coord> std::optional<clip_error> check_operand_kinds(
    const path<Coord> &open,
    const path<Coord> &region)
{
    if(open.empty()) return clip_error{error_kind::invalid_operand_kind,operand_t::open_path};
    for(std::size_t i=0; i<open.size(); ++i) {
        if(open[i].closed()) return clip_error{error_kind::invalid_operand_kind,operand_t::open_path,i};
    }
    if(region.empty()) return clip_error{error_kind::invalid_operand_kind,operand_t::clip_region};
    for(std::size_t i=0; i<region.size(); ++i) {
        if(!region[i].closed()) return clip_error{error_kind::invalid_operand_kind,operand_t::clip_region,i};
    }
    return std::nullopt;
}

template<coordinate Coord> std::optional<clip_error> check_continuity(
    const path<Coord> &p,
    operand_t op,
    Coord tolerance)
{
    for(std::size_t i=0; i<p.size(); ++i) {
        if(auto seg = p[i].find_discontinuity(tolerance)) {
            return clip_error{error_kind::discontinuous_path,op,i,*seg};
        }
    }
    return std::nullopt;
}

/* Call "f" with the end points of every segment of "region" and, for curves,
a few points along the way */
template<coordinate Coord,typename F> void for_each_outline_sample(const path<Coord> &region,F f) {
    constexpr int curve_samples = 8;
    for(auto &c : region) {
        for(auto &s : c) {
            if(s.is_line()) {
                f(s.start());
                f(s.end());
                continue;
            }
            for(int i=0; i<=curve_samples; ++i) f(s.at(Coord(i)/curve_samples));
        }
    }
}

/* False if every point of the outline of "region" lies within about
"tolerance" of a single line. The lobes of a self-intersecting contour can
cancel out in signed area, so that is not used here. */
template<coordinate Coord> bool encloses_area(const path<Coord> &region,Coord tolerance) {
    std::optional<point_t<Coord>> first;
    for(auto &c : region) {
        if(!c.empty()) {
            first = c.start_point();
            break;
        }
    }
    if(!first) return false;

    point_t<Coord> farthest = *first;
    Coord far_dist = 0;
    for_each_outline_sample(region,[&](const point_t<Coord> &p) {
        Coord d = vdist(*first,p);
        if(d > far_dist) {
            far_dist = d;
            farthest = p;
        }
    });
    if(far_dist <= tolerance) return false;

    bool wide = false;
    for_each_outline_sample(region,[&](const point_t<Coord> &p) {
        if(coord_ops<Coord>::abs(triangle_winding(*first,farthest,p)) > tolerance * far_dist) wide = true;
    });
    return wide;
}

} // namespace detail

/**
 * Clips open paths against closed regions.
 *
 * An instance of `clipper` reuses its allocated memory for subsequent
 * operations, making it more efficient than calling `clip` for performing
 * many operations. An instance must not be used by more than one thread at a
 * time.
 */
template<coordinate Coord> class clipper {
    std::pmr::memory_resource *contig_mem;

    std::pmr::vector<detail::region_edge<Coord>> edges;
    std::pmr::vector<cut_point<Coord>> cuts;
    std::pmr::vector<intersection<Coord>> found;
    detail::intersect_scratch<Coord> scratch;
    path_slices<Coord> slices;
    std::pmr::vector<point_location> labels;

    /* Validate the input, then cut and classify "open" */
    std::optional<clip_error> prepare(
        const path<Coord> &open,
        const path<Coord> &region,
        const clip_options<Coord> &options);

public:
    explicit clipper(std::pmr::memory_resource *_contig_mem=nullptr) :
        contig_mem(_contig_mem == nullptr ? std::pmr::get_default_resource() : _contig_mem),
        edges(contig_mem),
        cuts(contig_mem),
        found(contig_mem),
        scratch(contig_mem),
        slices(contig_mem),
        labels(contig_mem) {}

    clipper(clipper &&b) = default;

    /**
     * Return the parts of `open` that are inside `region`, or outside of it if
     * `options.invert` is true.
     *
     * Every contour of `open` must be open and every contour of `region` must
     * be closed. Each run of consecutive kept pieces of one contour of `open`
     * becomes one contour of the output, in the order and direction of
     * `open`. If nothing is kept, the output is empty.
     */
    result<std::vector<contour<Coord>>> clip(
        const path<Coord> &open,
        const path<Coord> &region,
        const clip_options<Coord> &options={});

    /**
     * Cut `open` wherever it meets the outline of `region` and return every
     * piece along with which side of `region` it lies on.
     *
     * `options.invert` is ignored.
     */
    result<std::vector<labeled_contour<Coord>>> cut(
        const path<Coord> &open,
        const path<Coord> &region,
        const clip_options<Coord> &options={});

    /** The cut points found by the last operation, in the order of the open
    path */
    std::span<const cut_point<Coord>> last_cuts() const noexcept { return cuts; }
};

template<coordinate Coord> std::optional<clip_error> clipper<Coord>::prepare(
    const path<Coord> &open,
    const path<Coord> &region,
    const clip_options<Coord> &options)
{
    cuts.clear();
    slices.clear();
    labels.clear();

    if(auto e = detail::check_operand_kinds(open,region)) return e;

    Coord tolerance = options.tolerance;
    if(options.mode == tolerance_mode::relative) {
        auto box = open.control_box();
        auto rbox = region.control_box();
        if(box && rbox) box->expand(*rbox);
        else if(rbox) box = rbox;
        if(box && box->extent() > Coord(0)) tolerance *= box->extent();
    }
    PATH_CLIP_DEBUG_LOG("tolerance: {}",tolerance);

    if(auto e = detail::check_continuity(open,operand_t::open_path,tolerance)) return e;
    if(auto e = detail::check_continuity(region,operand_t::clip_region,tolerance)) return e;
    if(!detail::encloses_area(region,tolerance)) return clip_error{error_kind::degenerate_clip_region,operand_t::clip_region};

    intersect_params<Coord> params{tolerance,options.max_subdivision_depth};
    if(auto e = detail::cut_into_slices(open,region,params,edges,scratch,found,cuts,slices)) return e;
    detail::classify_sub_segments(open,slices,region,options.fill_rule,tolerance,labels);
    return std::nullopt;
}

template<coordinate Coord> result<std::vector<contour<Coord>>> clipper<Coord>::clip(
    const path<Coord> &open,
    const path<Coord> &region,
    const clip_options<Coord> &options)
{
    if(auto e = prepare(open,region,options)) {
        PATH_CLIP_DEBUG_LOG("clip failed: {}",describe(*e));
        return *e;
    }
    return stitch(open,slices,std::span<const point_location>{labels},options.invert);
}

template<coordinate Coord> result<std::vector<labeled_contour<Coord>>> clipper<Coord>::cut(
    const path<Coord> &open,
    const path<Coord> &region,
    const clip_options<Coord> &options)
{
    if(auto e = prepare(open,region,options)) {
        PATH_CLIP_DEBUG_LOG("cut failed: {}",describe(*e));
        return *e;
    }
    return label_all(open,slices,std::span<const point_location>{labels});
}

/** Return the parts of `open` inside `region`, or outside of it if `invert`
is true */
template<coordinate Coord> result<std::vector<contour<Coord>>> clip(
    const path<Coord> &open,
    const path<Coord> &region,
    bool invert=false)
{
    clip_options<Coord> options;
    options.invert = invert;
    return clipper<Coord>{}.clip(open,region,options);
}

template<coordinate Coord> result<std::vector<contour<Coord>>> clip(
    const path<Coord> &open,
    const path<Coord> &region,
    const clip_options<Coord> &options)
{
    return clipper<Coord>{}.clip(open,region,options);
}

template<coordinate Coord> result<std::vector<contour<Coord>>> clip(
    const path<Coord> &open,
    const path<Coord> &region,
    keep_side side)
{
    return clipper<Coord>{}.clip(open,region,clip_options<Coord>{}.keep(side));
}

template<coordinate Coord> result<std::vector<labeled_contour<Coord>>> cut(
    const path<Coord> &open,
    const path<Coord> &region,
    const clip_options<Coord> &options={})
{
    return clipper<Coord>{}.cut(open,region,options);
}

} // namespace path_clip

#endif
