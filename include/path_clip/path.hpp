#ifndef PATH_CLIP_PATH_HPP
#define PATH_CLIP_PATH_HPP

#include <vector>
#include <algorithm>
#include <optional>
#include <span>
#include <utility>
#include <cstddef>
#include <ranges>

#include "base.hpp"
#include "segment.hpp"


namespace path_clip {

/**
 * A continuous chain of segments.
 *
 * The end of each segment is the start of the next one. A closed contour has
 * an implied straight line from its end back to its start if the two points
 * differ.
 */
template<coordinate Coord> class contour {
    std::vector<segment<Coord>> _segments;
    bool _closed;

public:
    contour() : _closed(false) {}
    explicit contour(std::vector<segment<Coord>> segments,bool closed=false)
        : _segments(std::move(segments)), _closed(closed) {}

    contour(const contour&) = default;
    contour(contour&&) noexcept = default;
    contour &operator=(const contour&) = default;
    contour &operator=(contour&&) noexcept = default;

    bool closed() const noexcept { return _closed; }
    void set_closed(bool value) noexcept { _closed = value; }

    std::span<const segment<Coord>> segments() const noexcept { return _segments; }
    std::size_t size() const noexcept { return _segments.size(); }
    bool empty() const noexcept { return _segments.empty(); }

    const segment<Coord> &operator[](std::size_t i) const noexcept { return _segments[i]; }
    auto begin() const noexcept { return _segments.begin(); }
    auto end() const noexcept { return _segments.end(); }

    const point_t<Coord> &start_point() const noexcept { return _segments.front().start(); }
    const point_t<Coord> &end_point() const noexcept { return _segments.back().end(); }

    void push_back(const segment<Coord> &s) { _segments.push_back(s); }
    void reserve(std::size_t n) { _segments.reserve(n); }
    void clear() noexcept { _segments.clear(); }

    /** Return the index of the first segment whose end point is more than
    `tolerance` away from the start of the segment after it, if any */
    std::optional<std::size_t> find_discontinuity(Coord tolerance) const {
        for(std::size_t i=1; i<_segments.size(); ++i) {
            if(!approx_equal(_segments[i-1].end(),_segments[i].start(),tolerance)) return i-1;
        }
        return std::nullopt;
    }

    box_t<Coord> control_box() const {
        PATH_CLIP_ASSERT(!empty());
        box_t<Coord> r = _segments.front().control_box();
        for(auto &s : _segments) r.expand(s.control_box());
        return r;
    }

    friend bool operator==(const contour &a,const contour &b) {
        return a._closed == b._closed && std::ranges::equal(a._segments,b._segments);
    }
};

namespace detail {
/* The contribution of one segment to the area of the contour it's part of,
from Green's theorem */
template<coordinate Coord> Coord segment_area(const segment<Coord> &s) {
    auto p = s.points();
    switch(s.kind()) {
    case segment_kind::line:
        return vcross(p[0],p[1]) / Coord(2);
    case segment_kind::quadratic:
        return (vcross(p[0],p[1]) + vcross(p[1],p[2])) / Coord(3)
            + vcross(p[0],p[2]) / Coord(6);
    case segment_kind::cubic:
        return (Coord(6)*vcross(p[0],p[1])
            + Coord(3)*vcross(p[0],p[2])
            + vcross(p[0],p[3])
            + Coord(3)*vcross(p[1],p[2])
            + Coord(3)*vcross(p[1],p[3])
            + Coord(6)*vcross(p[2],p[3])) / Coord(20);
    }
    PATH_CLIP_ASSERT(false);
    return Coord(0);
}
} // namespace detail

/** The signed area enclosed by `c`, treating it as closed. Positive if the
contour winds counter-clockwise (with the Y axis pointing up). */
template<coordinate Coord> Coord signed_area(const contour<Coord> &c) {
    if(c.empty()) return Coord(0);
    Coord r = 0;
    for(auto &s : c) r += detail::segment_area(s);
    r += vcross(c.end_point(),c.start_point()) / Coord(2);
    return r;
}

/**
 * An ordered sequence of contours.
 *
 * The operand being clipped has only open contours and the clipping region has
 * only closed contours.
 */
template<coordinate Coord> class path {
    std::vector<contour<Coord>> _contours;

public:
    path() = default;
    explicit path(std::vector<contour<Coord>> contours) : _contours(std::move(contours)) {}

    std::span<const contour<Coord>> contours() const noexcept { return _contours; }
    std::size_t size() const noexcept { return _contours.size(); }
    bool empty() const noexcept { return _contours.empty(); }

    const contour<Coord> &operator[](std::size_t i) const noexcept { return _contours[i]; }
    auto begin() const noexcept { return _contours.begin(); }
    auto end() const noexcept { return _contours.end(); }

    void push_back(contour<Coord> c) { _contours.push_back(std::move(c)); }

    /** True if there is at least one contour and every contour is closed */
    bool is_closed() const {
        return !_contours.empty() && std::ranges::all_of(_contours,[](auto &c) { return c.closed(); });
    }

    /** True if there is at least one contour and no contour is closed */
    bool is_open() const {
        return !_contours.empty() && std::ranges::none_of(_contours,[](auto &c) { return c.closed(); });
    }

    std::size_t segment_count() const {
        std::size_t r = 0;
        for(auto &c : _contours) r += c.size();
        return r;
    }

    /** The box containing the control points of every non-empty contour, or
    nothing if there are no segments */
    std::optional<box_t<Coord>> control_box() const {
        std::optional<box_t<Coord>> r;
        for(auto &c : _contours) {
            if(c.empty()) continue;
            if(r) r->expand(c.control_box());
            else r = c.control_box();
        }
        return r;
    }

    friend bool operator==(const path &a,const path &b) {
        return std::ranges::equal(a._contours,b._contours);
    }
};

/**
 * Builds a path one segment at a time, in the manner of a pen: each drawing
 * command continues from where the previous one ended.
 */
template<coordinate Coord> class path_builder {
    std::vector<contour<Coord>> contours;
    point_t<Coord> current;
    point_t<Coord> first;
    bool started = false;

    void ensure_started() {
        if(!started) move_to(current);
    }

public:
    path_builder() : current{Coord(0),Coord(0)}, first{Coord(0),Coord(0)} {}

    path_builder &move_to(const point_t<Coord> &p) {
        if(started && contours.back().empty()) contours.pop_back();
        contours.emplace_back();
        current = first = p;
        started = true;
        return *this;
    }

    path_builder &line_to(const point_t<Coord> &p) {
        ensure_started();
        contours.back().push_back(segment<Coord>::line(current,p));
        current = p;
        return *this;
    }

    path_builder &quad_to(const point_t<Coord> &c,const point_t<Coord> &p) {
        ensure_started();
        contours.back().push_back(segment<Coord>::quadratic(current,c,p));
        current = p;
        return *this;
    }

    path_builder &cubic_to(const point_t<Coord> &c1,const point_t<Coord> &c2,const point_t<Coord> &p) {
        ensure_started();
        contours.back().push_back(segment<Coord>::cubic(current,c1,c2,p));
        current = p;
        return *this;
    }

    /** Close the current contour, adding a line back to its first point if the
    pen isn't already there. The next drawing command starts a new contour at
    the same first point. */
    path_builder &close() {
        if(!started) return *this;
        if(current != first) line_to(first);
        if(contours.back().empty()) contours.pop_back();
        else contours.back().set_closed(true);
        started = false;
        current = first;
        return *this;
    }

    /** Return the finished path. The builder is left empty. */
    path<Coord> build() {
        if(started && contours.back().empty()) contours.pop_back();
        started = false;
        path<Coord> r{std::move(contours)};
        contours.clear();
        return r;
    }
};

/** Create a contour of straight lines through `points` */
template<coordinate Coord,point_range<Coord> Points>
contour<Coord> make_polyline(Points &&points,bool closed=false) {
    std::vector<segment<Coord>> segs;
    auto itr = std::ranges::begin(points);
    auto end = std::ranges::end(points);
    if(itr == end) return contour<Coord>{std::move(segs),closed};

    point_t<Coord> first(*itr);
    point_t<Coord> prev = first;
    while(++itr != end) {
        point_t<Coord> p(*itr);
        segs.push_back(segment<Coord>::line(prev,p));
        prev = p;
    }
    if(closed && prev != first) segs.push_back(segment<Coord>::line(prev,first));
    return contour<Coord>{std::move(segs),closed};
}

/** Create a path with one contour of straight lines through `points` */
template<coordinate Coord,point_range<Coord> Points>
path<Coord> make_polyline_path(Points &&points,bool closed=false) {
    path<Coord> r;
    r.push_back(make_polyline<Coord>(std::forward<Points>(points),closed));
    return r;
}

/** Put several open contours into one compound path, in order */
template<coordinate Coord,typename R> path<Coord> combine(R &&contours) {
    path<Coord> r;
    for(auto &&c : contours) r.push_back(std::forward<decltype(c)>(c));
    return r;
}

} // namespace path_clip

#endif
