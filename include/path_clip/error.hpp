#ifndef PATH_CLIP_ERROR_HPP
#define PATH_CLIP_ERROR_HPP

#include <cstddef>
#include <string>
#include <format>
#include <variant>
#include <utility>

#include "base.hpp"


namespace path_clip {

enum class error_kind {
    /** The path to clip has a closed contour, the clipping region has an open
    contour, or either one has no contours */
    invalid_operand_kind,

    /** The clipping region doesn't enclose any area */
    degenerate_clip_region,

    /** The intersection of two curves couldn't be resolved within the
    subdivision limit */
    numerical_failure,

    /** A segment doesn't start where the one before it ends */
    discontinuous_path
};

/** Identifies one of the two inputs of a clipping operation */
enum class operand_t {open_path=0,clip_region=1};

/**
 * A description of why a clipping operation failed.
 *
 * `contour` and `segment` locate the problem in the operand given by
 * `operand`. For `error_kind::numerical_failure`, they refer to the open path
 * and `other_contour` and `other_segment` refer to the clipping region. Fields
 * that don't apply are set to `npos`.
 */
struct clip_error {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    error_kind kind;
    operand_t operand = operand_t::open_path;
    std::size_t contour = npos;
    std::size_t segment = npos;
    std::size_t other_contour = npos;
    std::size_t other_segment = npos;

    friend bool operator==(const clip_error&,const clip_error&) = default;
};

inline const char *to_string(error_kind kind) {
    switch(kind) {
    case error_kind::invalid_operand_kind:
        return "invalid operand kind";
    case error_kind::degenerate_clip_region:
        return "degenerate clip region";
    case error_kind::numerical_failure:
        return "numerical failure";
    case error_kind::discontinuous_path:
        return "discontinuous path";
    }
    PATH_CLIP_ASSERT(false);
    return "unknown error";
}

inline const char *to_string(operand_t op) {
    return op == operand_t::open_path ? "open path" : "clip region";
}

/** A human readable message for `e` */
inline std::string describe(const clip_error &e) {
    switch(e.kind) {
    case error_kind::invalid_operand_kind:
        if(e.contour == clip_error::npos) {
            return std::format("invalid operand kind: the {} has no contours",to_string(e.operand));
        }
        return std::format(
            "invalid operand kind: contour {} of the {} is {}",
            e.contour,
            to_string(e.operand),
            e.operand == operand_t::open_path ? "closed" : "open");
    case error_kind::degenerate_clip_region:
        return "degenerate clip region: the clip region encloses no area";
    case error_kind::numerical_failure:
        return std::format(
            "numerical failure: could not intersect segment {} of contour {} of the open path"
            " with segment {} of contour {} of the clip region",
            e.segment,
            e.contour,
            e.other_segment,
            e.other_contour);
    case error_kind::discontinuous_path:
        return std::format(
            "discontinuous path: segment {} of contour {} of the {} does not end where the next one starts",
            e.segment,
            e.contour,
            to_string(e.operand));
    }
    PATH_CLIP_ASSERT(false);
    return to_string(e.kind);
}

/**
 * Either a value or a `clip_error`.
 *
 * Calling `value` on a result holding an error, or `error` on a result holding
 * a value, is a precondition violation.
 */
template<typename T> class result {
    std::variant<T,clip_error> data;

public:
    result(T value) : data(std::in_place_index<0>,std::move(value)) {}
    result(clip_error e) : data(std::in_place_index<1>,e) {}

    bool has_value() const noexcept { return data.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T &value() & {
        PATH_CLIP_ASSERT(has_value());
        return *std::get_if<0>(&data);
    }
    const T &value() const & {
        PATH_CLIP_ASSERT(has_value());
        return *std::get_if<0>(&data);
    }
    T &&value() && {
        PATH_CLIP_ASSERT(has_value());
        return std::move(*std::get_if<0>(&data));
    }

    const clip_error &error() const {
        PATH_CLIP_ASSERT(!has_value());
        return *std::get_if<1>(&data);
    }

    T &operator*() & { return value(); }
    const T &operator*() const & { return value(); }
    T *operator->() { return &value(); }
    const T *operator->() const { return &value(); }
};

} // namespace path_clip

#endif
