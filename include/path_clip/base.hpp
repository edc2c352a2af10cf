#ifndef PATH_CLIP_BASE_HPP
#define PATH_CLIP_BASE_HPP

#include <cmath>
#include <numbers>
#include <utility>
#include <type_traits>
#include <concepts>
#include <span>
#include <ranges>
#include <tuple>

/* PATH_CLIP_ASSERT can be defined to use an exception, so it can't be used
inside functions marked as "noexcept". In such cases, "assert" is used. */
#ifndef PATH_CLIP_ASSERT
#include <cassert>
#define PATH_CLIP_ASSERT assert

// used for checks that would drastically slow down the algorithm
#define PATH_CLIP_ASSERT_SLOW(X) (void)0
#endif

#ifndef PATH_CLIP_ASSERT_SLOW
#define PATH_CLIP_ASSERT_SLOW PATH_CLIP_ASSERT
#endif

#ifndef PATH_CLIP_DEBUG_LOG
#define PATH_CLIP_DEBUG_LOG(...) (void)0
#endif


namespace path_clip {

/** Mathematical operations on coordinate types. This struct can be specialized
by users of this library. */
template<typename Coord> struct coord_ops {
    /** Functions need to be defined that are equivalent to the following
    functions from the "std" namespace: */
    static Coord abs(Coord x) { return std::abs(x); }
    static Coord sqrt(Coord x) { return std::sqrt(x); }
    static Coord cbrt(Coord x) { return std::cbrt(x); }
    static Coord acos(Coord x) { return std::acos(x); }
    static Coord cos(Coord x) { return std::cos(x); }
    static Coord sin(Coord x) { return std::sin(x); }

    static Coord pi() { return std::numbers::pi_v<Coord>; }

    /** The tolerance used when the caller doesn't supply one. With the default
    relative tolerance mode, this is multiplied by the extent of the input. */
    static Coord default_tolerance() { return Coord(1e-6); }
};

/* Getters for point-like objects. This can be specialized by the user for other
types. Static functions "get_x" and "get_y" should be defined to get the X and Y
coordinates respectively. */
template<typename T> struct point_ops {};

template<typename T> struct point_ops<T[2]> {
    static constexpr const T &get_x(const T (&p)[2]) noexcept { return p[0]; }
    static constexpr const T &get_y(const T (&p)[2]) noexcept { return p[1]; }
};

template<typename T> struct point_ops<std::span<T,2>> {
    static constexpr const T &get_x(const std::span<T,2> &p) noexcept { return p[0]; }
    static constexpr const T &get_y(const std::span<T,2> &p) noexcept { return p[1]; }
};

template<typename T> struct point_ops<std::tuple<T,T>> {
    static constexpr const T &get_x(const std::tuple<T,T> &p) noexcept { return std::get<0>(p); }
    static constexpr const T &get_y(const std::tuple<T,T> &p) noexcept { return std::get<1>(p); }
};

namespace detail {
template<typename T> concept arithmetic = requires(T x) {
    { x + x } -> std::convertible_to<T>;
    { x - x } -> std::convertible_to<T>;
    { x * x } -> std::convertible_to<T>;
    { x / x } -> std::convertible_to<T>;
    { -x } -> std::convertible_to<T>;
};
} // namespace detail

/* Coordinates are real numbers. Curve evaluation, intersection parameters and
tolerances are all expressed in the coordinate type itself. */
template<typename T> concept coordinate =
    detail::arithmetic<T>
    && std::totally_ordered<T>
    && std::convertible_to<int,T>
    && requires(T c) {
        { coord_ops<T>::abs(c) } -> std::same_as<T>;
        { coord_ops<T>::sqrt(c) } -> std::same_as<T>;
        { coord_ops<T>::cbrt(c) } -> std::same_as<T>;
        { coord_ops<T>::acos(c) } -> std::same_as<T>;
        { coord_ops<T>::cos(c) } -> std::same_as<T>;
        { coord_ops<T>::sin(c) } -> std::same_as<T>;
        { coord_ops<T>::pi() } -> std::same_as<T>;
        { coord_ops<T>::default_tolerance() } -> std::same_as<T>;
    };


template<typename T,typename Coord> concept point = requires(const T &v) {
    { point_ops<T>::get_x(v) } -> std::convertible_to<Coord>;
    { point_ops<T>::get_y(v) } -> std::convertible_to<Coord>;
};

template<typename T> struct point_t {
    T _data[2];

    point_t() = default;
    constexpr point_t(const T &x,const T &y) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : _data{x,y} {}
    constexpr point_t(const point_t &b) = default;
    template<point<T> U> constexpr point_t(const U &b)
        noexcept(std::is_nothrow_copy_constructible_v<T>
            && noexcept(point_ops<U>::get_x(b))
            && noexcept(point_ops<U>::get_y(b)))
        : _data{point_ops<U>::get_x(b),point_ops<U>::get_y(b)} {}

    constexpr point_t &operator=(const point_t &b) noexcept(std::is_nothrow_copy_constructible_v<T>) = default;

    constexpr T &operator[](std::size_t i) noexcept { return _data[i]; }
    constexpr const T &operator[](std::size_t i) const noexcept { return _data[i]; }

    constexpr T &x() noexcept { return _data[0]; }
    constexpr const T &x() const noexcept { return _data[0]; }
    constexpr T &y() noexcept { return _data[1]; }
    constexpr const T &y() const noexcept { return _data[1]; }

    constexpr point_t &operator+=(const point_t &b) {
        _data[0] += b[0];
        _data[1] += b[1];
        return *this;
    }

    constexpr point_t &operator-=(const point_t &b) {
        _data[0] -= b[0];
        _data[1] -= b[1];
        return *this;
    }

    constexpr point_t &operator*=(T b) {
        _data[0] *= b;
        _data[1] *= b;
        return *this;
    }

    constexpr point_t operator-() const {
        return {-_data[0],-_data[1]};
    }

    friend constexpr void swap(point_t &a,point_t &b) noexcept(std::is_nothrow_swappable_v<T>) {
        using std::swap;
        swap(a._data[0],b._data[0]);
        swap(a._data[1],b._data[1]);
    }
};

template<typename T> struct point_ops<point_t<T>> {
    static constexpr const T &get_x(const point_t<T> &p) noexcept { return p[0]; }
    static constexpr const T &get_y(const point_t<T> &p) noexcept { return p[1]; }
};

template<typename T>
constexpr point_t<T> operator+(const point_t<T> &a,const point_t<T> &b) {
    return {a[0]+b[0],a[1]+b[1]};
}

template<typename T>
constexpr point_t<T> operator-(const point_t<T> &a,const point_t<T> &b) {
    return {a[0]-b[0],a[1]-b[1]};
}

template<typename T>
constexpr point_t<T> operator*(const point_t<T> &a,std::type_identity_t<T> b) {
    return {a[0]*b,a[1]*b};
}
template<typename T>
constexpr point_t<T> operator*(std::type_identity_t<T> a,const point_t<T> &b) {
    return {a*b[0],a*b[1]};
}
template<typename T>
constexpr point_t<T> operator/(const point_t<T> &a,std::type_identity_t<T> b) {
    return {a[0]/b,a[1]/b};
}

template<typename T>
constexpr bool operator==(const point_t<T> &a,const point_t<T> &b) {
    return a[0] == b[0] && a[1] == b[1];
}
template<typename T>
constexpr bool operator!=(const point_t<T> &a,const point_t<T> &b) {
    return a[0] != b[0] || a[1] != b[1];
}

template<typename T> constexpr T vdot(const point_t<T> &a,const point_t<T> &b) {
    return a[0]*b[0] + a[1]*b[1];
}

/* The Z component of the 3D cross product. Positive if "b" is counter-clockwise
from "a" (with the Y axis pointing up). */
template<typename T> constexpr T vcross(const point_t<T> &a,const point_t<T> &b) {
    return a[0]*b[1] - a[1]*b[0];
}

template<typename T> constexpr T square(const point_t<T> &a) {
    return vdot(a,a);
}

template<coordinate Coord> Coord vmag(const point_t<Coord> &x) {
    return coord_ops<Coord>::sqrt(square(x));
}

template<coordinate Coord> Coord vdist(const point_t<Coord> &a,const point_t<Coord> &b) {
    return vmag(b - a);
}

/* Returns "x" scaled to a length of one, or a zero vector if "x" has no
length */
template<coordinate Coord> point_t<Coord> vunit(const point_t<Coord> &x) {
    Coord m = vmag(x);
    if(m == Coord(0)) return {Coord(0),Coord(0)};
    return x / m;
}

template<coordinate Coord> constexpr point_t<Coord> vlerp(const point_t<Coord> &a,const point_t<Coord> &b,Coord t) {
    return a + (b - a) * t;
}

template<coordinate Coord> bool approx_equal(const point_t<Coord> &a,const point_t<Coord> &b,Coord tolerance) {
    return square(b - a) <= tolerance*tolerance;
}

/* Returns a positive number if p1,p2,p3 turn counter-clockwise, negative if
clockwise and zero if they are collinear */
template<coordinate Coord> constexpr Coord triangle_winding(
    const point_t<Coord> &p1,
    const point_t<Coord> &p2,
    const point_t<Coord> &p3)
{
    return vcross(p2 - p1,p3 - p1);
}


template<typename T,typename Coord> concept point_range
    = std::ranges::range<T> && point<std::ranges::range_value_t<T>,Coord>;

template<typename T,typename Coord> concept point_range_range
    = std::ranges::range<T> && point_range<std::ranges::range_value_t<T>,Coord>;

/** An axis-aligned bounding box */
template<coordinate Coord> struct box_t {
    point_t<Coord> min;
    point_t<Coord> max;

    box_t() = default;
    constexpr box_t(const point_t<Coord> &p) : min{p}, max{p} {}
    constexpr box_t(const point_t<Coord> &min,const point_t<Coord> &max) : min{min}, max{max} {}

    void expand(const point_t<Coord> &p) {
        if(p.x() < min.x()) min.x() = p.x();
        if(p.y() < min.y()) min.y() = p.y();
        if(p.x() > max.x()) max.x() = p.x();
        if(p.y() > max.y()) max.y() = p.y();
    }

    void expand(const box_t &b) {
        expand(b.min);
        expand(b.max);
    }

    /* The length of the diagonal */
    Coord extent() const { return vdist(min,max); }

    /* "tolerance" grows both boxes, so boxes that are less than "tolerance"
    apart still count as overlapping */
    bool overlaps(const box_t &b,Coord tolerance=Coord(0)) const {
        return min.x() <= b.max.x() + tolerance && b.min.x() <= max.x() + tolerance
            && min.y() <= b.max.y() + tolerance && b.min.y() <= max.y() + tolerance;
    }
};

} // namespace path_clip

#endif
