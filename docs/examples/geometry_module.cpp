/**
 * Example extension module: geometry
 *
 * Builds as geometry.so next to the tests. From Python:
 *
 *   import geometry
 *   p = geometry.Point(1.0, y=2.0)
 *   p.scale(3)
 *   c = geometry.Circle(p, 5.0)
 *   c.x, c.radius, c.area()
 */

#include "pn/pynative.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace geometry {

struct Point {
    double x{0.0};
    double y{0.0};

    double length() const { return std::sqrt(x * x + y * y); }

    void scale(double factor, std::optional<double> yFactor) {
        x *= factor;
        y *= yFactor.value_or(factor);
    }

    static Point origin() { return Point{}; }
};

// A Circle is a Point (its centre) with a radius.
struct Circle {
    double radius{1.0};

    double area() const { return 3.14159265358979323846 * radius * radius; }
};

struct GeometryError {
    std::string detail;
};

} // namespace geometry

// ClassInfo must be visible before any Initializer or conversion names the
// class, so the traits come first and the method tables follow the functions.

template<>
struct pn::ClassInfo<geometry::Point> {
    static constexpr std::string_view name = "Point";
    static constexpr std::string_view module = "geometry";
    static constexpr std::string_view doc = "A point in the plane";
    using Base = pn::ObjectBase;
    static constexpr unsigned flags = pn::TypeFlags::BaseType;

    static std::vector<pn::MethodDef> methods();
};

template<>
struct pn::ClassInfo<geometry::Circle> {
    static constexpr std::string_view name = "Circle";
    static constexpr std::string_view module = "geometry";
    using Base = geometry::Point;
    static constexpr unsigned flags = pn::TypeFlags::Dict | pn::TypeFlags::WeakRef;

    static std::vector<pn::MethodDef> methods();
};

template<>
struct pn::ClassInfo<geometry::GeometryError> {
    static constexpr std::string_view name = "GeometryError";
    static constexpr std::string_view module = "geometry";
    using Base = pn::ExceptionBase;
    static constexpr unsigned flags = pn::TypeFlags::Extended | pn::TypeFlags::GC;

    static std::vector<pn::MethodDef> methods();
};

namespace geometry {

Point makePoint(double x, double y) {
    return Point{x, y};
}

pn::Initializer<Circle> makeCircle(const Point& centre, double radius) {
    if (radius < 0) {
        throw pn::ValueError("radius must not be negative");
    }
    pn::Initializer<Circle> init = pn::Initializer<Circle>::fromValue(Circle{radius});
    init.getSuper().init(centre);
    return init;
}

GeometryError makeError(std::string detail) {
    return GeometryError{std::move(detail)};
}

double distance(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

// ----------------------------------------------------------------------------
// Signatures
// ----------------------------------------------------------------------------

constexpr std::string_view kXY[] = {"x", "y"};
constexpr pn::FunctionDescription kPointNew{
    .clsName = "Point",
    .funcName = "__new__",
    .positionalParameterNames = kXY,
    .requiredPositionalParameters = 2,
};

constexpr pn::FunctionDescription kLength{.clsName = "Point", .funcName = "length"};
constexpr pn::FunctionDescription kOrigin{.clsName = "Point", .funcName = "origin"};

constexpr std::string_view kScaleParams[] = {"factor"};
constexpr pn::KeywordOnlyParameterDescription kScaleKeywords[] = {{"y_factor", false}};
constexpr pn::FunctionDescription kScale{
    .clsName = "Point",
    .funcName = "scale",
    .positionalParameterNames = kScaleParams,
    .requiredPositionalParameters = 1,
    .keywordOnlyParameters = kScaleKeywords,
};

constexpr std::string_view kCircleParams[] = {"centre", "radius"};
constexpr pn::FunctionDescription kCircleNew{
    .clsName = "Circle",
    .funcName = "__new__",
    .positionalParameterNames = kCircleParams,
    .requiredPositionalParameters = 2,
};
constexpr pn::FunctionDescription kArea{.clsName = "Circle", .funcName = "area"};

constexpr std::string_view kErrorParams[] = {"detail"};
constexpr pn::FunctionDescription kErrorNew{
    .clsName = "GeometryError",
    .funcName = "__new__",
    .positionalParameterNames = kErrorParams,
    .requiredPositionalParameters = 1,
};

constexpr std::string_view kDistanceParams[] = {"a", "b"};
constexpr pn::FunctionDescription kDistance{
    .funcName = "distance",
    .positionalParameterNames = kDistanceParams,
    .positionalOnlyParameters = 2,
    .requiredPositionalParameters = 2,
};

} // namespace geometry

std::vector<pn::MethodDef> pn::ClassInfo<geometry::Point>::methods() {
    using geometry::Point;
    return {
        pn::constructor<geometry::kPointNew, &geometry::makePoint>(),
        pn::method<geometry::kLength, &Point::length>(),
        pn::method<geometry::kScale, &Point::scale>("Scale in place"),
        pn::staticMethod<geometry::kOrigin, &Point::origin>(),
        pn::getter<&Point::x>("x"),
        pn::setter<&Point::x>("x"),
        pn::getter<&Point::y>("y"),
        pn::setter<&Point::y>("y"),
    };
}

std::vector<pn::MethodDef> pn::ClassInfo<geometry::Circle>::methods() {
    using geometry::Circle;
    return {
        pn::constructor<geometry::kCircleNew, &geometry::makeCircle>(),
        pn::method<geometry::kArea, &Circle::area>(),
        pn::getter<&Circle::radius>("radius"),
    };
}

std::vector<pn::MethodDef> pn::ClassInfo<geometry::GeometryError>::methods() {
    return {
        pn::constructor<geometry::kErrorNew, &geometry::makeError>(),
        pn::getter<&geometry::GeometryError::detail>("detail"),
    };
}

namespace {

PyMethodDef geometryFunctions[] = {
    pn::function<geometry::kDistance, &geometry::distance>("Euclidean distance"),
    {nullptr, nullptr, 0, nullptr},
};

PyModuleDef geometryModule = {
    PyModuleDef_HEAD_INIT,
    "geometry",
    "Example module built with PyNative",
    -1,
    geometryFunctions,
};

} // namespace

PyMODINIT_FUNC PyInit_geometry() {
    PyObject* module = PyModule_Create(&geometryModule);
    if (!module) {
        return nullptr;
    }
    try {
        pn::addType<geometry::Point>(module);
        pn::addType<geometry::Circle>(module);
        pn::addType<geometry::GeometryError>(module);
    } catch (const std::exception& error) {
        Py_DECREF(module);
        pn::raiseInHost(error);
        return nullptr;
    }
    return module;
}
